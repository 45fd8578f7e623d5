// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/GraphItem.hpp"
#include "nodecanvas/NodeCanvasConstants.hpp"
#include "nodecanvas/Tools.hpp"

#include <QtGui/QPainterPath>

#include <memory>

namespace NodeCanvas {

class GraphNode;

// Directed edge from a source node's output port to a target node's input port.
class NODECANVAS_EXPORT GraphConnection final : public GraphItem
{
public:
    // Returns nullptr for a self-loop or an invalid endpoint.
    static std::unique_ptr<GraphConnection> create(ConnectionId id, NodeId source, NodeId target);

    ConnectionId id() const noexcept { return m_id; }
    NodeId source() const noexcept { return m_source; }
    NodeId target() const noexcept { return m_target; }
    bool attachesTo(NodeId nodeId) const noexcept { return m_source == nodeId || m_target == nodeId; }

    bool isSelected() const noexcept { return m_selected; }
    void setSelected(bool selected) { m_selected = selected; }

    Kind kind() const override { return Kind::Connection; }
    double depth() const override { return Constants::kConnectionDepth; }

    void recomputePath(const GraphNode& source, const GraphNode& target);

    bool hasPath() const noexcept { return m_hasPath; }
    const QPainterPath& path() const noexcept { return m_path; }
    const Tools::CubicCurve& curve() const noexcept { return m_curve; }
    QPointF startPoint() const { return m_curve.start; }
    QPointF endPoint() const { return m_curve.end; }

    void draw(QPainter& p, const GraphRenderContext& ctx) const override;
    QRectF boundsScene() const override;
    bool hitTest(const QPointF& scenePos) const override;

private:
    GraphConnection(ConnectionId id, NodeId source, NodeId target);

    ConnectionId m_id{};
    NodeId m_source{};
    NodeId m_target{};
    bool m_selected = false;

    bool m_hasPath = false;
    Tools::CubicCurve m_curve;
    QPainterPath m_path;
    QPainterPath m_hitShape;
};

} // namespace NodeCanvas
