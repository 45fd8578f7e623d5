// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/GraphItem.hpp"
#include "nodecanvas/NodeCanvasConstants.hpp"

#include <QtCore/QSizeF>

#include <vector>

namespace NodeCanvas {

class NODECANVAS_EXPORT GraphNode final : public GraphItem
{
public:
    GraphNode(NodeId id, const QPointF& positionScene);

    NodeId id() const noexcept { return m_id; }

    Kind kind() const override { return Kind::Node; }
    bool isInteractiveNode() const override { return true; }
    double depth() const override { return Constants::kNodeDepth; }

    // Top-left corner in world coordinates.
    QPointF position() const noexcept { return m_position; }

    // Raw position update. GraphScene::moveNode() is the move that also refreshes attached connections.
    void setPosition(const QPointF& positionScene) { m_position = positionScene; }

    QSizeF size() const noexcept { return m_size; }
    double portRadius() const noexcept { return m_portRadius; }

    QPointF inputPortOffset() const noexcept { return m_inputOffset; }
    QPointF outputPortOffset() const noexcept { return m_outputOffset; }
    QPointF portOffset(PortKind port) const noexcept;
    QPointF portScene(PortKind port) const;
    QPointF inputPortScene() const { return portScene(PortKind::Input); }
    QPointF outputPortScene() const { return portScene(PortKind::Output); }

    // Manhattan distance, strictly below the threshold.
    bool isNearPort(PortKind port, const QPointF& scenePos, double threshold) const;

    // Local rect grown by the port radius on both sides.
    QRectF boundingBox() const;
    QRectF bodyRectScene() const;

    bool isSelected() const noexcept { return m_selected; }
    void setSelected(bool selected) { m_selected = selected; }

    const std::vector<ConnectionId>& connections() const noexcept { return m_connections; }
    bool isAttached(ConnectionId id) const;
    bool attachConnection(ConnectionId id);
    bool detachConnection(ConnectionId id);

    void draw(QPainter& p, const GraphRenderContext& ctx) const override;
    QRectF boundsScene() const override;

private:
    NodeId m_id{};
    QPointF m_position;
    const QSizeF m_size{Constants::kNodeWidth, Constants::kNodeHeight};
    const double m_portRadius = Constants::kPortRadius;
    const QPointF m_inputOffset;
    const QPointF m_outputOffset;
    bool m_selected = false;
    std::vector<ConnectionId> m_connections;
};

} // namespace NodeCanvas
