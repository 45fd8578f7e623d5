// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodecanvas/GraphNode.hpp"

#include "nodecanvas/GraphStyle.hpp"
#include "nodecanvas/Tools.hpp"

#include <algorithm>

namespace NodeCanvas {

GraphNode::GraphNode(NodeId id, const QPointF& positionScene)
    : m_id(id)
    , m_position(positionScene)
    , m_inputOffset(0.0, Constants::kNodeHeight * 0.5)
    , m_outputOffset(Constants::kNodeWidth, Constants::kNodeHeight * 0.5)
{
}

QPointF GraphNode::portOffset(PortKind port) const noexcept
{
    return port == PortKind::Input ? m_inputOffset : m_outputOffset;
}

QPointF GraphNode::portScene(PortKind port) const
{
    return m_position + portOffset(port);
}

bool GraphNode::isNearPort(PortKind port, const QPointF& scenePos, double threshold) const
{
    return Tools::manhattanDistance(scenePos, portScene(port)) < threshold;
}

QRectF GraphNode::boundingBox() const
{
    return QRectF(-m_portRadius, 0.0, m_size.width() + 2.0 * m_portRadius, m_size.height());
}

QRectF GraphNode::bodyRectScene() const
{
    return QRectF(m_position, m_size);
}

QRectF GraphNode::boundsScene() const
{
    return boundingBox().translated(m_position);
}

bool GraphNode::isAttached(ConnectionId id) const
{
    return std::find(m_connections.begin(), m_connections.end(), id) != m_connections.end();
}

bool GraphNode::attachConnection(ConnectionId id)
{
    if (!id || isAttached(id))
        return false;
    m_connections.push_back(id);
    return true;
}

bool GraphNode::detachConnection(ConnectionId id)
{
    const auto it = std::find(m_connections.begin(), m_connections.end(), id);
    if (it == m_connections.end())
        return false;
    m_connections.erase(it);
    return true;
}

void GraphNode::draw(QPainter& p, const GraphRenderContext& ctx) const
{
    if (!ctx.isVisible(boundsScene()))
        return;

    GraphStyle::drawNodeBody(p, bodyRectScene(), m_selected);
    GraphStyle::drawPort(p, inputPortScene(), m_portRadius);
    GraphStyle::drawPort(p, outputPortScene(), m_portRadius);
}

} // namespace NodeCanvas
