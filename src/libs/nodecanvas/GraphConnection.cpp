// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodecanvas/GraphConnection.hpp"

#include "nodecanvas/GraphNode.hpp"
#include "nodecanvas/GraphStyle.hpp"

#include <QtGui/QPainterPathStroker>

namespace NodeCanvas {

GraphConnection::GraphConnection(ConnectionId id, NodeId source, NodeId target)
    : m_id(id)
    , m_source(source)
    , m_target(target)
{
}

std::unique_ptr<GraphConnection> GraphConnection::create(ConnectionId id, NodeId source, NodeId target)
{
    if (!id || !source || !target)
        return nullptr;
    if (source == target) {
        qCDebug(nodecanvaslog) << "refusing self-connection on node" << source.value();
        return nullptr;
    }
    return std::unique_ptr<GraphConnection>(new GraphConnection(id, source, target));
}

void GraphConnection::recomputePath(const GraphNode& source, const GraphNode& target)
{
    m_curve = Tools::connectionCurve(source.outputPortScene(), target.inputPortScene());

    QPainterPath path;
    path.moveTo(m_curve.start);
    path.cubicTo(m_curve.control1, m_curve.control2, m_curve.end);
    m_path = path;

    QPainterPathStroker stroker;
    stroker.setWidth(Constants::kConnectionHitTolerance * 2.0);
    stroker.setCapStyle(Qt::RoundCap);
    m_hitShape = stroker.createStroke(m_path);

    m_hasPath = true;
}

void GraphConnection::draw(QPainter& p, const GraphRenderContext& ctx) const
{
    if (!m_hasPath || !ctx.isVisible(boundsScene()))
        return;
    GraphStyle::drawConnection(p, m_path, m_selected);
}

QRectF GraphConnection::boundsScene() const
{
    if (!m_hasPath)
        return QRectF();
    const double pad = Constants::kConnectionHitTolerance;
    return m_path.controlPointRect().adjusted(-pad, -pad, pad, pad);
}

bool GraphConnection::hitTest(const QPointF& scenePos) const
{
    return m_hasPath && m_hitShape.contains(scenePos);
}

} // namespace NodeCanvas
