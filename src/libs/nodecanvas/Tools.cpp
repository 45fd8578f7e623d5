#include "nodecanvas/Tools.hpp"

#include "nodecanvas/NodeCanvasConstants.hpp"

#include <QtCore/QRandomGenerator>
#include <QtCore/QtMath>

#include <algorithm>
#include <cmath>

namespace NodeCanvas::Tools {

QPointF sceneToView(const QPointF& scenePos, const QPointF& pan, double zoom)
{
    return scenePos * zoom + pan;
}

QPointF viewToScene(const QPointF& viewPos, const QPointF& pan, double zoom)
{
    if (qFuzzyIsNull(zoom))
        return viewPos - pan;
    return (viewPos - pan) / zoom;
}

QPointF panFromViewDrag(const QPointF& startPan,
                        const QPointF& startViewPos,
                        const QPointF& currentViewPos)
{
    return startPan + (currentViewPos - startViewPos);
}

QPointF panForAnchoredZoom(const QPointF& anchorViewPos,
                           const QPointF& pan,
                           double oldZoom,
                           double newZoom)
{
    if (qFuzzyIsNull(oldZoom))
        return pan;

    const QPointF anchorScene = viewToScene(anchorViewPos, pan, oldZoom);
    return anchorViewPos - anchorScene * newZoom;
}

QRectF visibleSceneRect(const QRectF& viewRect, const QPointF& pan, double zoom)
{
    if (viewRect.isEmpty())
        return QRectF();

    const QPointF tl = viewToScene(viewRect.topLeft(), pan, zoom);
    const QPointF br = viewToScene(viewRect.bottomRight(), pan, zoom);
    const double left   = std::min(tl.x(), br.x());
    const double right  = std::max(tl.x(), br.x());
    const double top    = std::min(tl.y(), br.y());
    const double bottom = std::max(tl.y(), br.y());
    return QRectF(QPointF(left, top), QPointF(right, bottom));
}

double manhattanDistance(const QPointF& a, const QPointF& b)
{
    return (a - b).manhattanLength();
}

CubicCurve connectionCurve(const QPointF& start, const QPointF& end)
{
    const double dx = end.x() - start.x();
    const double midX = start.x() + dx * 0.5;

    CubicCurve curve;
    curve.start = start;
    curve.control1 = QPointF(midX, start.y());
    curve.control2 = QPointF(midX, end.y());
    curve.end = end;
    return curve;
}

QPointF randomNodePosition(QRandomGenerator& rng)
{
    const int x = rng.bounded(Constants::kRandomPlacementMaxX + 1);
    const int y = rng.bounded(Constants::kRandomPlacementMaxY + 1);
    return QPointF(x, y);
}

} // namespace NodeCanvas::Tools
