#include "nodecanvas/GraphStyle.hpp"

#include "nodecanvas/NodeCanvasConstants.hpp"

#include <QtGui/QBrush>
#include <QtGui/QColor>
#include <QtGui/QPainter>
#include <QtGui/QPainterPath>
#include <QtGui/QPen>

#include <algorithm>

namespace NodeCanvas {

void GraphStyle::drawBackground(QPainter& p, const QRectF& viewRect)
{
    p.fillRect(viewRect, QColor(Constants::kSceneBackgroundColor));
}

void GraphStyle::drawNodeBody(QPainter& p, const QRectF& bodyScene, bool selected)
{
    QPen pen{QColor(selected ? Constants::kNodeSelectedOutlineColor : Constants::kNodeOutlineColor)};
    pen.setWidthF(selected ? Constants::kNodeSelectedOutlineWidth : Constants::kNodeOutlineWidth);
    const QBrush brush{QColor(selected ? Constants::kNodeSelectedFillColor : Constants::kNodeFillColor)};

    QPainterPath body;
    body.addRoundedRect(bodyScene, Constants::kNodeCornerRadius, Constants::kNodeCornerRadius);

    p.save();
    p.setPen(pen);
    p.setBrush(brush);
    p.drawPath(body);
    p.restore();
}

void GraphStyle::drawPort(QPainter& p, const QPointF& centerScene, double radius)
{
    QPen pen{QColor(Constants::kNodeOutlineColor)};
    pen.setWidthF(Constants::kNodeOutlineWidth);

    p.save();
    p.setPen(pen);
    p.setBrush(QColor(Constants::kPortFillColor));
    p.drawEllipse(centerScene, radius, radius);
    p.restore();
}

void GraphStyle::drawConnection(QPainter& p, const QPainterPath& pathScene, bool selected)
{
    QPen pen{QColor(selected ? Constants::kConnectionSelectedColor : Constants::kConnectionColor)};
    pen.setWidthF(selected ? Constants::kConnectionSelectedWidth : Constants::kConnectionWidth);

    p.save();
    p.setPen(pen);
    p.setBrush(Qt::NoBrush);
    p.drawPath(pathScene);
    p.restore();
}

void GraphStyle::drawConnectionPreview(QPainter& p, const QLineF& lineScene)
{
    QPen pen{QColor(Constants::kPreviewLineColor)};
    pen.setWidthF(Constants::kPreviewLineWidth);
    pen.setStyle(Qt::DashLine);

    p.save();
    p.setPen(pen);
    p.setBrush(Qt::NoBrush);
    p.drawLine(lineScene);
    p.restore();
}

void GraphStyle::drawMarquee(QPainter& p, const QRectF& rectScene, double zoom)
{
    QPen pen{QColor(Constants::kMarqueeOutlineColor)};
    pen.setWidthF(1.0 / std::clamp(zoom, 0.25, 8.0));

    p.save();
    p.setPen(pen);
    p.setBrush(QColor(Constants::kMarqueeFillColor));
    p.drawRect(rectScene.normalized());
    p.restore();
}

} // namespace NodeCanvas
