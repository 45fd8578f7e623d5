#include "nodecanvas/GraphViewport.hpp"

#include "nodecanvas/EditorSettings.hpp"
#include "nodecanvas/Tools.hpp"

#include <QtCore/QtGlobal>

namespace NodeCanvas {

GraphViewport::GraphViewport(QObject* parent)
    : QObject(parent)
{
}

void GraphViewport::applySettings(const EditorSettings& settings)
{
    m_minZoom = settings.minZoom;
    m_maxZoom = settings.maxZoom;
    m_zoomStep = settings.zoomStep;

    // Tighter limits pull the current scale back in, keeping the screen origin fixed.
    const double bounded = qBound(m_minZoom, m_scale, m_maxZoom);
    if (bounded == m_scale)
        return;
    qCDebug(nodecanvaslog) << "scale" << m_scale << "clamped to" << bounded;
    m_pan = Tools::panForAnchoredZoom(QPointF(0.0, 0.0), m_pan, m_scale, bounded);
    m_scale = bounded;
    emit changed();
}

bool GraphViewport::zoom(int deltaDirection, const QPointF& anchorScreen)
{
    if (deltaDirection == 0)
        return false;

    const double factor = deltaDirection > 0 ? m_zoomStep : (1.0 / m_zoomStep);
    const double next = m_scale * factor;
    if (deltaDirection > 0 && next > m_maxZoom + Constants::kZoomEpsilon) {
        qCDebug(nodecanvaslog) << "zoom in rejected at scale" << m_scale;
        return false;
    }
    if (deltaDirection < 0 && next < m_minZoom - Constants::kZoomEpsilon) {
        qCDebug(nodecanvaslog) << "zoom out rejected at scale" << m_scale;
        return false;
    }

    m_pan = Tools::panForAnchoredZoom(anchorScreen, m_pan, m_scale, next);
    m_scale = next;
    emit changed();
    return true;
}

void GraphViewport::setPan(const QPointF& pan)
{
    if (m_pan == pan)
        return;
    m_pan = pan;
    emit changed();
}

void GraphViewport::beginPan(const QPointF& screenPos)
{
    m_panning = true;
    m_lastPanPos = screenPos;
}

void GraphViewport::updatePan(const QPointF& screenPos)
{
    if (!m_panning)
        return;

    const QPointF next = Tools::panFromViewDrag(m_pan, m_lastPanPos, screenPos);
    m_lastPanPos = screenPos;
    setPan(next);
}

void GraphViewport::endPan()
{
    m_panning = false;
}

void GraphViewport::resetView()
{
    if (qFuzzyCompare(m_scale, 1.0) && m_pan.isNull())
        return;
    m_scale = 1.0;
    m_pan = QPointF(0.0, 0.0);
    emit changed();
}

void GraphViewport::setSize(const QSizeF& size)
{
    if (m_size == size)
        return;
    m_size = size;
    emit changed();
}

QPointF GraphViewport::toWorld(const QPointF& screenPos) const
{
    return Tools::viewToScene(screenPos, m_pan, m_scale);
}

QPointF GraphViewport::toScreen(const QPointF& worldPos) const
{
    return Tools::sceneToView(worldPos, m_pan, m_scale);
}

QRectF GraphViewport::visibleWorldRect() const
{
    return Tools::visibleSceneRect(QRectF(QPointF(0.0, 0.0), m_size), m_pan, m_scale);
}

} // namespace NodeCanvas
