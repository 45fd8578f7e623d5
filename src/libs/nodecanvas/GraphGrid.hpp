// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/NodeCanvasConstants.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QLineF>
#include <QtCore/QRectF>

#include <vector>

QT_BEGIN_NAMESPACE
class QPainter;
QT_END_NAMESPACE

namespace NodeCanvas {

struct NODECANVAS_EXPORT GridLine final {
    QLineF line;
    bool major = false;
};

// Background grid; lines are generated for the visible rect on every paint.
class NODECANVAS_EXPORT GraphGrid final
{
public:
    struct Config final {
        double cellSize;
        int majorLineEvery;
        const char* minorColor;
        const char* majorColor;

        constexpr Config() noexcept
            : cellSize(Constants::kGridCellSize)
            , majorLineEvery(Constants::kGridMajorLineEvery)
            , minorColor(Constants::kGridMinorColor)
            , majorColor(Constants::kGridMajorColor)
        {}
    };

    explicit GraphGrid(Config cfg = {}) : m_cfg(cfg) {}

    const Config& config() const { return m_cfg; }
    void setConfig(const Config& cfg) { m_cfg = cfg; }

    std::vector<GridLine> lines(const QRectF& sceneRect) const;
    void draw(QPainter& p, const QRectF& sceneRect) const;

private:
    Config m_cfg;
};

} // namespace NodeCanvas
