// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodecanvas/GraphGrid.hpp"

#include <algorithm>
#include <cmath>

using NodeCanvas::GraphGrid;
using NodeCanvas::GridLine;

namespace {

bool isVertical(const GridLine& l)
{
    return l.line.x1() == l.line.x2();
}

} // namespace

TEST(GraphGridTests, LinesCoverVisibleRectOnly)
{
    GraphGrid grid;
    const auto lines = grid.lines(QRectF(0.0, 0.0, 100.0, 40.0));

    const auto vertical = std::count_if(lines.begin(), lines.end(), isVertical);
    EXPECT_EQ(vertical, 5);
    EXPECT_EQ(static_cast<long>(lines.size()) - vertical, 2);

    for (const auto& l : lines) {
        if (isVertical(l)) {
            EXPECT_GE(l.line.x1(), 0.0);
            EXPECT_LT(l.line.x1(), 100.0);
        } else {
            EXPECT_GE(l.line.y1(), 0.0);
            EXPECT_LT(l.line.y1(), 40.0);
        }
    }
}

TEST(GraphGridTests, EveryFifthLineIsMajor)
{
    GraphGrid grid;
    const auto lines = grid.lines(QRectF(-45.0, 0.0, 170.0, 10.0));

    for (const auto& l : lines) {
        if (!isVertical(l))
            continue;
        const double x = l.line.x1();
        const bool expectMajor = std::fmod(std::abs(x), 100.0) == 0.0;
        EXPECT_EQ(l.major, expectMajor) << "x=" << x;
    }
    EXPECT_TRUE(std::any_of(lines.begin(), lines.end(), [](const GridLine& l) {
        return isVertical(l) && l.line.x1() == -40.0;
    }));
}

TEST(GraphGridTests, CellSizeComesFromConfig)
{
    GraphGrid::Config cfg;
    cfg.cellSize = 50.0;
    cfg.majorLineEvery = 2;
    GraphGrid grid(cfg);

    const auto lines = grid.lines(QRectF(0.0, 0.0, 200.0, 1.0));
    const auto vertical = std::count_if(lines.begin(), lines.end(), isVertical);
    EXPECT_EQ(vertical, 4);

    const auto major = std::count_if(lines.begin(), lines.end(), [](const GridLine& l) {
        return isVertical(l) && l.major;
    });
    EXPECT_EQ(major, 2);
}

TEST(GraphGridTests, EmptyRectYieldsNoLines)
{
    GraphGrid grid;
    EXPECT_TRUE(grid.lines(QRectF()).empty());

    GraphGrid::Config cfg;
    cfg.cellSize = 0.0;
    EXPECT_TRUE(GraphGrid(cfg).lines(QRectF(0.0, 0.0, 10.0, 10.0)).empty());
}
