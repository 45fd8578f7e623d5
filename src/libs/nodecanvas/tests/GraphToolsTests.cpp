// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodecanvas/Tools.hpp"

#include <QtCore/QRandomGenerator>

#include <vector>

namespace {

void expectPointNear(const QPointF& a, const QPointF& b, double eps = 1e-9)
{
    EXPECT_NEAR(a.x(), b.x(), eps);
    EXPECT_NEAR(a.y(), b.y(), eps);
}

} // namespace

TEST(GraphToolsTests, RoundTripWorldScreen)
{
    struct Case { QPointF scene; QPointF pan; double zoom; };
    const std::vector<Case> cases = {
        {QPointF(0.0, 0.0), QPointF(0.0, 0.0), 1.0},
        {QPointF(12.5, -7.25), QPointF(3.0, 4.0), 1.25},
        {QPointF(-123.0, 456.0), QPointF(10.0, -20.0), 4.0},
        {QPointF(1.0, 2.0), QPointF(-3.0, -4.0), 0.25},
    };

    for (const auto& c : cases) {
        const QPointF view = NodeCanvas::Tools::sceneToView(c.scene, c.pan, c.zoom);
        expectPointNear(view, c.scene * c.zoom + c.pan);
        expectPointNear(NodeCanvas::Tools::viewToScene(view, c.pan, c.zoom), c.scene);
    }
}

TEST(GraphToolsTests, AnchoredZoomKeepsAnchorFixed)
{
    const QPointF pan(40.0, -15.0);
    const QPointF anchor(320.0, 240.0);
    const double oldZoom = 1.25;
    const double newZoom = 1.25 * 1.25;

    const QPointF before = NodeCanvas::Tools::viewToScene(anchor, pan, oldZoom);
    const QPointF newPan = NodeCanvas::Tools::panForAnchoredZoom(anchor, pan, oldZoom, newZoom);
    const QPointF after = NodeCanvas::Tools::viewToScene(anchor, newPan, newZoom);

    expectPointNear(before, after);
}

TEST(GraphToolsTests, PanFromViewDragAddsScreenDelta)
{
    const QPointF pan = NodeCanvas::Tools::panFromViewDrag(QPointF(10.0, -5.0),
                                                           QPointF(100.0, 200.0),
                                                           QPointF(140.0, 170.0));
    expectPointNear(pan, QPointF(50.0, -35.0));
}

TEST(GraphToolsTests, VisibleSceneRectFollowsTransform)
{
    const QRectF r = NodeCanvas::Tools::visibleSceneRect(QRectF(0.0, 0.0, 800.0, 600.0),
                                                         QPointF(100.0, 50.0), 2.0);
    expectPointNear(r.topLeft(), QPointF(-50.0, -25.0));
    expectPointNear(r.bottomRight(), QPointF(350.0, 275.0));

    EXPECT_TRUE(NodeCanvas::Tools::visibleSceneRect(QRectF(), QPointF(), 1.0).isNull());
}

TEST(GraphToolsTests, ManhattanDistance)
{
    EXPECT_DOUBLE_EQ(NodeCanvas::Tools::manhattanDistance(QPointF(1.0, 2.0), QPointF(4.0, -2.0)), 7.0);
    EXPECT_DOUBLE_EQ(NodeCanvas::Tools::manhattanDistance(QPointF(3.0, 3.0), QPointF(3.0, 3.0)), 0.0);
}

TEST(GraphToolsTests, ConnectionCurveUsesHorizontalMidpoint)
{
    const auto forward = NodeCanvas::Tools::connectionCurve(QPointF(150.0, 50.0), QPointF(300.0, 250.0));
    expectPointNear(forward.start, QPointF(150.0, 50.0));
    expectPointNear(forward.control1, QPointF(225.0, 50.0));
    expectPointNear(forward.control2, QPointF(225.0, 250.0));
    expectPointNear(forward.end, QPointF(300.0, 250.0));

    // Target left of source: dx is negative, the midpoint still sits halfway.
    const auto backward = NodeCanvas::Tools::connectionCurve(QPointF(550.0, 50.0), QPointF(0.0, 50.0));
    expectPointNear(backward.control1, QPointF(275.0, 50.0));
    expectPointNear(backward.control2, QPointF(275.0, 50.0));
}

TEST(GraphToolsTests, RandomNodePositionStaysInPlacementArea)
{
    QRandomGenerator rng(1234u);
    for (int i = 0; i < 500; ++i) {
        const QPointF p = NodeCanvas::Tools::randomNodePosition(rng);
        EXPECT_GE(p.x(), 0.0);
        EXPECT_LE(p.x(), 500.0);
        EXPECT_GE(p.y(), 0.0);
        EXPECT_LE(p.y(), 200.0);
    }
}
