#pragma once

#include "nodecanvas/NodeCanvasConstants.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSizeF>

namespace NodeCanvas {

struct EditorSettings;

class NODECANVAS_EXPORT GraphViewport final : public QObject
{
    Q_OBJECT

public:
    explicit GraphViewport(QObject* parent = nullptr);

    void applySettings(const EditorSettings& settings);

    double scale() const noexcept { return m_scale; }
    double minZoom() const noexcept { return m_minZoom; }
    double maxZoom() const noexcept { return m_maxZoom; }
    double zoomStep() const noexcept { return m_zoomStep; }

    // Returns false (and leaves the transform untouched) when the step would leave [minZoom, maxZoom].
    bool zoom(int deltaDirection, const QPointF& anchorScreen);
    bool zoomIn(const QPointF& anchorScreen) { return zoom(1, anchorScreen); }
    bool zoomOut(const QPointF& anchorScreen) { return zoom(-1, anchorScreen); }

    QPointF pan() const noexcept { return m_pan; }
    void setPan(const QPointF& pan);

    bool isPanning() const noexcept { return m_panning; }
    void beginPan(const QPointF& screenPos);
    void updatePan(const QPointF& screenPos);
    void endPan();

    void resetView();

    QSizeF size() const noexcept { return m_size; }
    void setSize(const QSizeF& size);

    QPointF toWorld(const QPointF& screenPos) const;
    QPointF toScreen(const QPointF& worldPos) const;
    QRectF visibleWorldRect() const;

signals:
    void changed();

private:
    double m_scale = 1.0;
    double m_minZoom = Constants::kMinZoom;
    double m_maxZoom = Constants::kMaxZoom;
    double m_zoomStep = Constants::kZoomStep;
    QPointF m_pan{0.0, 0.0};
    QSizeF m_size;

    bool m_panning = false;
    QPointF m_lastPanPos;
};

} // namespace NodeCanvas
