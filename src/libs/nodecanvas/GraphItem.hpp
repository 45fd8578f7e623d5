// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/GraphRenderContext.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"
#include "nodecanvas/NodeCanvasTypes.hpp"

#include <QtCore/QPointF>
#include <QtCore/QRectF>

QT_BEGIN_NAMESPACE
class QPainter;
QT_END_NAMESPACE

namespace NodeCanvas {

class NODECANVAS_EXPORT GraphItem
{
public:
    enum class Kind : quint8 { Node, Connection };

    virtual ~GraphItem() = default;

    virtual Kind kind() const = 0;
    virtual bool isInteractiveNode() const { return false; }

    // Items with a lower depth are drawn first and lose hit tests to higher ones.
    virtual double depth() const = 0;

    virtual void draw(QPainter& p, const GraphRenderContext& ctx) const = 0;
    virtual QRectF boundsScene() const = 0;

    virtual bool hitTest(const QPointF& scenePos) const {
        return boundsScene().contains(scenePos);
    }
};

} // namespace NodeCanvas
