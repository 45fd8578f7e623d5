// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/GraphCommandManager.hpp"
#include "nodecanvas/GraphConnection.hpp"
#include "nodecanvas/GraphNode.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"
#include "nodecanvas/NodeCanvasTypes.hpp"

#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSet>

#include <memory>
#include <optional>
#include <vector>

namespace NodeCanvas {

// Owns every node and connection. Nodes and connections only refer to each other by id.
class NODECANVAS_EXPORT GraphScene final : public QObject
{
    Q_OBJECT

public:
    explicit GraphScene(QObject* parent = nullptr);

    const std::vector<std::unique_ptr<GraphNode>>& nodes() const { return m_nodes; }
    const std::vector<std::unique_ptr<GraphConnection>>& connections() const { return m_connections; }

    GraphCommandManager& commands() { return m_commands; }
    const GraphCommandManager& commands() const { return m_commands; }

    NodeId allocateNodeId();
    ConnectionId allocateConnectionId();

    GraphNode* addNode(const QPointF& positionScene);
    GraphNode* findNode(NodeId id) const;
    std::optional<size_t> indexOfNode(NodeId id) const;

    // Invalid id when the pair is rejected (self-loop, unknown node).
    ConnectionId connectNodes(NodeId source, NodeId target);
    GraphConnection* findConnection(ConnectionId id) const;
    std::optional<size_t> indexOfConnection(ConnectionId id) const;
    std::vector<GraphConnection*> connectionsOf(NodeId id) const;

    bool moveNode(NodeId id, const QPointF& newPositionScene);
    void refreshConnections(const GraphNode& node);

    struct RemovedNode final {
        std::unique_ptr<GraphNode> node;
        size_t index = 0;
    };

    struct RemovedConnection final {
        std::unique_ptr<GraphConnection> connection;
        size_t index = 0;
    };

    // Fails while the node still has attached connections.
    std::optional<RemovedNode> takeNode(NodeId id);
    bool insertNode(size_t index, std::unique_ptr<GraphNode> node);

    std::optional<RemovedConnection> takeConnection(ConnectionId id);
    // Registers the connection with both endpoints and computes its path.
    bool insertConnection(size_t index, std::unique_ptr<GraphConnection> connection);

    // Removes the node together with every connection attached to it.
    bool removeNode(NodeId id);

    // Topmost item under scenePos: nodes beat connections, later beats earlier.
    GraphItem* itemAt(const QPointF& scenePos) const;
    GraphNode* nodeAt(const QPointF& scenePos) const;
    std::vector<const GraphItem*> itemsInDrawOrder() const;

    QList<NodeId> selectedNodes() const;
    QList<NodeId> nodesIntersecting(const QRectF& sceneRect) const;
    void setSelection(const QSet<NodeId>& ids);
    void clearSelection();
    bool isSelected(NodeId id) const;

    // Node and connection selection are exclusive: selecting one clears the other.
    ConnectionId selectedConnection() const;
    void selectConnection(ConnectionId id);

    // Bidirectional node <-> connection bookkeeping holds.
    bool isConsistent() const;

    void notifyChanged();
    void notifyHistoryChanged();

signals:
    void changed();
    // Undo/redo stacks changed; emitted after the stacks are updated.
    void historyChanged();

private:
    bool deselectConnections();

    std::vector<std::unique_ptr<GraphNode>> m_nodes;
    std::vector<std::unique_ptr<GraphConnection>> m_connections;
    GraphCommandManager m_commands;

    quint64 m_nextNodeId = 1;
    quint64 m_nextConnectionId = 1;
};

} // namespace NodeCanvas
