#pragma once

#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>

QT_BEGIN_NAMESPACE
class QRandomGenerator;
QT_END_NAMESPACE

namespace NodeCanvas::Tools {

// -----------------------------------------------------------------------------
// View transform: view = scene * zoom + pan (pan is in view pixels)
// -----------------------------------------------------------------------------
NODECANVAS_EXPORT QPointF sceneToView(const QPointF& scenePos, const QPointF& pan, double zoom);
NODECANVAS_EXPORT QPointF viewToScene(const QPointF& viewPos, const QPointF& pan, double zoom);

NODECANVAS_EXPORT QPointF panFromViewDrag(const QPointF& startPan,
                                          const QPointF& startViewPos,
                                          const QPointF& currentViewPos);

// Pan that keeps the scene point under anchorViewPos fixed across a zoom change.
NODECANVAS_EXPORT QPointF panForAnchoredZoom(const QPointF& anchorViewPos,
                                             const QPointF& pan,
                                             double oldZoom,
                                             double newZoom);

NODECANVAS_EXPORT QRectF visibleSceneRect(const QRectF& viewRect, const QPointF& pan, double zoom);

// -----------------------------------------------------------------------------
// Geometry
// -----------------------------------------------------------------------------
NODECANVAS_EXPORT double manhattanDistance(const QPointF& a, const QPointF& b);

struct NODECANVAS_EXPORT CubicCurve final {
    QPointF start;
    QPointF control1;
    QPointF control2;
    QPointF end;
};

// Horizontal S-curve used for connections.
NODECANVAS_EXPORT CubicCurve connectionCurve(const QPointF& start, const QPointF& end);

NODECANVAS_EXPORT QPointF randomNodePosition(QRandomGenerator& rng);

} // namespace NodeCanvas::Tools
