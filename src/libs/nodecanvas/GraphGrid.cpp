// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodecanvas/GraphGrid.hpp"

#include <QtCore/QVector>
#include <QtCore/QtMath>
#include <QtGui/QPainter>
#include <QtGui/QPen>

namespace NodeCanvas {

namespace {

bool isMajorIndex(long long index, int every)
{
    return every > 0 && index % every == 0;
}

} // namespace

std::vector<GridLine> GraphGrid::lines(const QRectF& sceneRect) const
{
    const QRectF r = sceneRect.normalized();
    const double step = m_cfg.cellSize;
    if (r.isEmpty() || step <= 0.0)
        return {};

    std::vector<GridLine> out;

    const long long firstX = static_cast<long long>(qCeil(r.left() / step));
    for (long long ix = firstX; ix * step < r.right(); ++ix) {
        const double x = ix * step;
        out.push_back(GridLine{QLineF(x, r.top(), x, r.bottom()), isMajorIndex(ix, m_cfg.majorLineEvery)});
    }

    const long long firstY = static_cast<long long>(qCeil(r.top() / step));
    for (long long iy = firstY; iy * step < r.bottom(); ++iy) {
        const double y = iy * step;
        out.push_back(GridLine{QLineF(r.left(), y, r.right(), y), isMajorIndex(iy, m_cfg.majorLineEvery)});
    }

    return out;
}

void GraphGrid::draw(QPainter& p, const QRectF& sceneRect) const
{
    const std::vector<GridLine> all = lines(sceneRect);
    if (all.empty())
        return;

    QVector<QLineF> minor;
    QVector<QLineF> major;
    for (const auto& l : all) {
        if (l.major)
            major.push_back(l.line);
        else
            minor.push_back(l.line);
    }

    // Cosmetic pens keep grid lines one device pixel wide at every zoom level.
    QPen minorPen{QColor(m_cfg.minorColor)};
    minorPen.setCosmetic(true);
    QPen majorPen{QColor(m_cfg.majorColor)};
    majorPen.setCosmetic(true);

    p.save();
    p.setBrush(Qt::NoBrush);
    p.setPen(minorPen);
    p.drawLines(minor);
    p.setPen(majorPen);
    p.drawLines(major);
    p.restore();
}

} // namespace NodeCanvas
