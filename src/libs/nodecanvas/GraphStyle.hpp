#pragma once

#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QLineF>
#include <QtCore/QPointF>
#include <QtCore/QRectF>

QT_BEGIN_NAMESPACE
class QPainter;
class QPainterPath;
QT_END_NAMESPACE

namespace NodeCanvas {

struct NODECANVAS_EXPORT GraphStyle final
{
    static void drawBackground(QPainter& p, const QRectF& viewRect);
    static void drawNodeBody(QPainter& p, const QRectF& bodyScene, bool selected);
    static void drawPort(QPainter& p, const QPointF& centerScene, double radius);
    static void drawConnection(QPainter& p, const QPainterPath& pathScene, bool selected);
    static void drawConnectionPreview(QPainter& p, const QLineF& lineScene);
    static void drawMarquee(QPainter& p, const QRectF& rectScene, double zoom);
};

} // namespace NodeCanvas
