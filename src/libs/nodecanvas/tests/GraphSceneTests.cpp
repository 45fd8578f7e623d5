// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodecanvas/GraphScene.hpp"

#include <QtTest/QSignalSpy>

using namespace NodeCanvas;

TEST(GraphSceneTests, ConnectRegistersWithBothEndpoints)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));
    ASSERT_NE(a, nullptr);
    ASSERT_NE(b, nullptr);
    EXPECT_NE(a->id(), b->id());

    const ConnectionId id = scene.connectNodes(a->id(), b->id());
    ASSERT_TRUE(id.isValid());
    ASSERT_EQ(scene.connections().size(), 1u);

    const GraphConnection* c = scene.findConnection(id);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->startPoint(), QPointF(150.0, 50.0));
    EXPECT_EQ(c->endPoint(), QPointF(300.0, 50.0));
    EXPECT_TRUE(a->isAttached(id));
    EXPECT_TRUE(b->isAttached(id));
    EXPECT_TRUE(scene.isConsistent());
}

TEST(GraphSceneTests, ConnectRejectsSelfAndUnknownNodes)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));

    EXPECT_FALSE(scene.connectNodes(a->id(), a->id()).isValid());
    EXPECT_FALSE(scene.connectNodes(a->id(), NodeId(99)).isValid());
    EXPECT_TRUE(scene.connections().empty());
    EXPECT_TRUE(a->connections().empty());
}

TEST(GraphSceneTests, MovingSourceNodeUpdatesConnectionStartOnly)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));
    const ConnectionId id = scene.connectNodes(a->id(), b->id());
    ASSERT_TRUE(id.isValid());

    QSignalSpy spy(&scene, &GraphScene::changed);
    ASSERT_TRUE(scene.moveNode(a->id(), QPointF(50.0, 80.0)));
    EXPECT_EQ(spy.count(), 1);

    const GraphConnection* c = scene.findConnection(id);
    EXPECT_EQ(c->startPoint(), QPointF(200.0, 130.0));
    EXPECT_EQ(c->endPoint(), QPointF(300.0, 50.0));
    EXPECT_EQ(c->curve().control1, QPointF(250.0, 130.0));

    ASSERT_TRUE(scene.moveNode(b->id(), QPointF(400.0, 80.0)));
    EXPECT_EQ(c->startPoint(), QPointF(200.0, 130.0));
    EXPECT_EQ(c->endPoint(), QPointF(400.0, 130.0));
}

TEST(GraphSceneTests, RemovingNodeCascadesToConnections)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));
    GraphNode* c = scene.addNode(QPointF(300.0, 300.0));
    const NodeId aId = a->id();
    ASSERT_TRUE(scene.connectNodes(aId, b->id()).isValid());
    ASSERT_TRUE(scene.connectNodes(aId, c->id()).isValid());
    const ConnectionId bc = scene.connectNodes(b->id(), c->id());
    ASSERT_TRUE(bc.isValid());

    EXPECT_FALSE(scene.takeNode(aId).has_value());

    ASSERT_TRUE(scene.removeNode(aId));
    EXPECT_EQ(scene.findNode(aId), nullptr);
    ASSERT_EQ(scene.connections().size(), 1u);
    EXPECT_EQ(scene.connections().front()->id(), bc);
    ASSERT_EQ(b->connections().size(), 1u);
    ASSERT_EQ(c->connections().size(), 1u);
    EXPECT_TRUE(scene.isConsistent());
}

TEST(GraphSceneTests, RemovingConnectionDetachesBothEnds)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));
    const ConnectionId id = scene.connectNodes(a->id(), b->id());

    const auto removed = scene.takeConnection(id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->index, 0u);
    EXPECT_FALSE(scene.takeConnection(id).has_value());
    EXPECT_TRUE(scene.connections().empty());
    EXPECT_TRUE(a->connections().empty());
    EXPECT_TRUE(b->connections().empty());
    EXPECT_TRUE(scene.isConsistent());
}

TEST(GraphSceneTests, NodesWinHitTestsOverConnections)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(400.0, 200.0));
    const ConnectionId id = scene.connectNodes(a->id(), b->id());
    const GraphConnection* c = scene.findConnection(id);
    ASSERT_NE(c, nullptr);

    const QPointF onCurve = c->path().pointAtPercent(0.5);
    GraphItem* hit = scene.itemAt(onCurve);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->kind(), GraphItem::Kind::Connection);
    EXPECT_EQ(scene.nodeAt(onCurve), nullptr);

    GraphNode* cover = scene.addNode(onCurve - QPointF(75.0, 50.0));
    EXPECT_EQ(scene.itemAt(onCurve), cover);

    EXPECT_EQ(scene.itemAt(QPointF(-500.0, -500.0)), nullptr);
}

TEST(GraphSceneTests, LaterNodeIsOnTop)
{
    GraphScene scene;
    GraphNode* first = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* second = scene.addNode(QPointF(50.0, 20.0));

    EXPECT_EQ(scene.itemAt(QPointF(100.0, 50.0)), second);
    EXPECT_EQ(scene.itemAt(QPointF(10.0, 10.0)), first);
}

TEST(GraphSceneTests, DrawOrderPutsConnectionsUnderNodes)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));
    ASSERT_TRUE(scene.connectNodes(a->id(), b->id()).isValid());

    const auto items = scene.itemsInDrawOrder();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]->kind(), GraphItem::Kind::Connection);
    EXPECT_EQ(items[1], a);
    EXPECT_EQ(items[2], b);
}

TEST(GraphSceneTests, SelectionHelpers)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));

    const auto hits = scene.nodesIntersecting(QRectF(QPointF(200.0, 50.0), QPointF(-20.0, -20.0)));
    ASSERT_EQ(hits.size(), 1);
    EXPECT_EQ(hits.front(), a->id());

    QSignalSpy spy(&scene, &GraphScene::changed);
    scene.setSelection({a->id(), b->id()});
    EXPECT_EQ(spy.count(), 1);
    EXPECT_EQ(scene.selectedNodes().size(), 2);
    scene.setSelection({a->id(), b->id()});
    EXPECT_EQ(spy.count(), 1);

    scene.clearSelection();
    EXPECT_TRUE(scene.selectedNodes().isEmpty());
    EXPECT_FALSE(scene.isSelected(a->id()));
}

TEST(GraphSceneTests, ConnectionAndNodeSelectionAreExclusive)
{
    GraphScene scene;
    GraphNode* a = scene.addNode(QPointF(0.0, 0.0));
    GraphNode* b = scene.addNode(QPointF(300.0, 0.0));
    const ConnectionId id = scene.connectNodes(a->id(), b->id());
    GraphConnection* c = scene.findConnection(id);
    ASSERT_NE(c, nullptr);

    scene.setSelection({a->id()});
    QSignalSpy spy(&scene, &GraphScene::changed);
    scene.selectConnection(id);
    EXPECT_EQ(spy.count(), 1);
    EXPECT_EQ(scene.selectedConnection(), id);
    EXPECT_TRUE(c->isSelected());
    EXPECT_TRUE(scene.selectedNodes().isEmpty());

    scene.selectConnection(id);
    EXPECT_EQ(spy.count(), 1);

    scene.setSelection({b->id()});
    EXPECT_FALSE(scene.selectedConnection().isValid());
    EXPECT_FALSE(c->isSelected());

    scene.selectConnection(id);
    const auto removed = scene.takeConnection(id);
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed->connection->isSelected());
    EXPECT_FALSE(scene.selectedConnection().isValid());
}
