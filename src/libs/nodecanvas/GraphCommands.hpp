#pragma once

#include "nodecanvas/GraphCommand.hpp"
#include "nodecanvas/GraphConnection.hpp"
#include "nodecanvas/GraphNode.hpp"
#include "nodecanvas/NodeCanvasTypes.hpp"

#include <QtCore/QPointF>

#include <memory>
#include <vector>

namespace NodeCanvas {

class NODECANVAS_EXPORT AddNodeCommand final : public GraphCommand
{
public:
    AddNodeCommand(NodeId nodeId, QPointF positionScene);

    QString name() const override;
    bool apply(GraphScene& scene) override;
    bool revert(GraphScene& scene) override;

private:
    NodeId m_nodeId{};
    QPointF m_position;
    std::unique_ptr<GraphNode> m_node;
    size_t m_index = 0;
    bool m_hasIndex = false;
};

class NODECANVAS_EXPORT MoveNodesCommand final : public GraphCommand
{
public:
    struct Move final {
        NodeId nodeId{};
        QPointF from;
        QPointF to;
    };

    explicit MoveNodesCommand(std::vector<Move> moves);

    QString name() const override;
    bool apply(GraphScene& scene) override;
    bool revert(GraphScene& scene) override;

private:
    std::vector<Move> m_moves;
};

class NODECANVAS_EXPORT ConnectNodesCommand final : public GraphCommand
{
public:
    ConnectNodesCommand(ConnectionId connectionId, NodeId source, NodeId target);

    QString name() const override;
    bool apply(GraphScene& scene) override;
    bool revert(GraphScene& scene) override;

private:
    ConnectionId m_connectionId{};
    NodeId m_source{};
    NodeId m_target{};
    std::unique_ptr<GraphConnection> m_connection;
    size_t m_index = 0;
    bool m_hasIndex = false;
};

class NODECANVAS_EXPORT DeleteConnectionCommand final : public GraphCommand
{
public:
    explicit DeleteConnectionCommand(ConnectionId connectionId);

    QString name() const override;
    bool apply(GraphScene& scene) override;
    bool revert(GraphScene& scene) override;

private:
    ConnectionId m_connectionId{};
    std::unique_ptr<GraphConnection> m_saved;
    size_t m_index = 0;
};

// Deletes nodes and, first, every connection attached to any of them.
class NODECANVAS_EXPORT DeleteNodesCommand final : public GraphCommand
{
public:
    explicit DeleteNodesCommand(std::vector<NodeId> nodeIds);

    QString name() const override;
    bool apply(GraphScene& scene) override;
    bool revert(GraphScene& scene) override;

private:
    struct SavedNode final {
        size_t index = 0;
        std::unique_ptr<GraphNode> node;
    };

    struct SavedConnection final {
        size_t index = 0;
        std::unique_ptr<GraphConnection> connection;
    };

    std::vector<NodeId> m_nodeIds;
    std::vector<SavedNode> m_savedNodes;
    std::vector<SavedConnection> m_savedConnections;
};

} // namespace NodeCanvas
