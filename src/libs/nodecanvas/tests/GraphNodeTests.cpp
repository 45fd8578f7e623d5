// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodecanvas/GraphNode.hpp"

using NodeCanvas::GraphNode;
using NodeCanvas::NodeId;
using NodeCanvas::PortKind;

TEST(GraphNodeTests, PortsSitAtVerticalMidpointOfEachSide)
{
    GraphNode node(NodeId(1), QPointF(0.0, 0.0));

    EXPECT_EQ(node.size(), QSizeF(150.0, 100.0));
    EXPECT_DOUBLE_EQ(node.portRadius(), 6.0);
    EXPECT_EQ(node.inputPortOffset(), QPointF(0.0, 50.0));
    EXPECT_EQ(node.outputPortOffset(), QPointF(150.0, 50.0));
    EXPECT_EQ(node.portOffset(PortKind::Input), node.inputPortOffset());
    EXPECT_EQ(node.portOffset(PortKind::Output), node.outputPortOffset());
}

TEST(GraphNodeTests, PortScenePositionFollowsNode)
{
    GraphNode node(NodeId(1), QPointF(300.0, -20.0));
    EXPECT_EQ(node.inputPortScene(), QPointF(300.0, 30.0));
    EXPECT_EQ(node.outputPortScene(), QPointF(450.0, 30.0));

    node.setPosition(QPointF(10.0, 10.0));
    EXPECT_EQ(node.inputPortScene(), QPointF(10.0, 60.0));
    EXPECT_EQ(node.outputPortScene(), QPointF(160.0, 60.0));
    EXPECT_EQ(node.outputPortOffset(), QPointF(150.0, 50.0));
}

TEST(GraphNodeTests, BoundingBoxIncludesPortRadius)
{
    GraphNode node(NodeId(1), QPointF(100.0, 200.0));

    EXPECT_EQ(node.boundingBox(), QRectF(-6.0, 0.0, 162.0, 100.0));
    EXPECT_EQ(node.boundsScene(), QRectF(94.0, 200.0, 162.0, 100.0));
    EXPECT_EQ(node.bodyRectScene(), QRectF(100.0, 200.0, 150.0, 100.0));

    EXPECT_TRUE(node.hitTest(QPointF(95.0, 250.0)));
    EXPECT_TRUE(node.hitTest(QPointF(255.0, 250.0)));
    EXPECT_FALSE(node.hitTest(QPointF(93.0, 250.0)));
    EXPECT_FALSE(node.hitTest(QPointF(175.0, 301.0)));
}

TEST(GraphNodeTests, PortProximityIsStrictManhattan)
{
    GraphNode node(NodeId(1), QPointF(0.0, 0.0));

    EXPECT_TRUE(node.isNearPort(PortKind::Output, QPointF(150.0, 50.0), 15.0));
    EXPECT_TRUE(node.isNearPort(PortKind::Output, QPointF(160.0, 54.0), 15.0));
    EXPECT_FALSE(node.isNearPort(PortKind::Output, QPointF(160.0, 55.0), 15.0));
    EXPECT_FALSE(node.isNearPort(PortKind::Output, QPointF(140.0, 60.0), 15.0));
    EXPECT_TRUE(node.isNearPort(PortKind::Input, QPointF(-7.0, 43.0), 15.0));
    EXPECT_FALSE(node.isNearPort(PortKind::Input, QPointF(150.0, 50.0), 15.0));
}

TEST(GraphNodeTests, AttachmentsAreASet)
{
    GraphNode node(NodeId(1), QPointF());
    const NodeCanvas::ConnectionId a(7);
    const NodeCanvas::ConnectionId b(9);

    EXPECT_TRUE(node.attachConnection(a));
    EXPECT_FALSE(node.attachConnection(a));
    EXPECT_TRUE(node.attachConnection(b));
    EXPECT_FALSE(node.attachConnection(NodeCanvas::ConnectionId{}));
    ASSERT_EQ(node.connections().size(), 2u);
    EXPECT_EQ(node.connections().front(), a);

    EXPECT_TRUE(node.detachConnection(a));
    EXPECT_FALSE(node.detachConnection(a));
    EXPECT_FALSE(node.isAttached(a));
    EXPECT_TRUE(node.isAttached(b));
}

TEST(GraphNodeTests, IsInteractiveNode)
{
    GraphNode node(NodeId(3), QPointF());
    EXPECT_TRUE(node.isInteractiveNode());
    EXPECT_EQ(node.kind(), NodeCanvas::GraphItem::Kind::Node);
    EXPECT_FALSE(node.isSelected());
    node.setSelected(true);
    EXPECT_TRUE(node.isSelected());
}
