#pragma once

#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QRectF>

namespace NodeCanvas {

struct NODECANVAS_EXPORT GraphRenderContext final {
    double zoom = 1.0;
    QRectF visibleSceneRect;

    bool isVisible(const QRectF& boundsScene) const {
        return visibleSceneRect.isNull() || visibleSceneRect.intersects(boundsScene);
    }
};

} // namespace NodeCanvas
