#include "nodecanvas/GraphCommands.hpp"

#include "nodecanvas/GraphScene.hpp"

#include <algorithm>

namespace NodeCanvas {

AddNodeCommand::AddNodeCommand(NodeId nodeId, QPointF positionScene)
    : m_nodeId(nodeId)
    , m_position(positionScene)
{}

QString AddNodeCommand::name() const
{
    return QStringLiteral("Add Node");
}

bool AddNodeCommand::apply(GraphScene& scene)
{
    if (!m_nodeId)
        return false;

    if (!m_hasIndex) {
        m_index = scene.nodes().size();
        m_hasIndex = true;
    }

    auto node = m_node ? std::move(m_node) : std::make_unique<GraphNode>(m_nodeId, m_position);
    if (!scene.insertNode(m_index, std::move(node)))
        return false;

    qCDebug(nodecanvaslog) << "node" << m_nodeId.value() << "added at" << m_position;
    return true;
}

bool AddNodeCommand::revert(GraphScene& scene)
{
    auto removed = scene.takeNode(m_nodeId);
    if (!removed)
        return false;
    m_index = removed->index;
    m_node = std::move(removed->node);
    m_node->setSelected(false);
    return true;
}

MoveNodesCommand::MoveNodesCommand(std::vector<Move> moves)
    : m_moves(std::move(moves))
{}

QString MoveNodesCommand::name() const
{
    return m_moves.size() == 1 ? QStringLiteral("Move Node") : QStringLiteral("Move Nodes");
}

bool MoveNodesCommand::apply(GraphScene& scene)
{
    if (m_moves.empty())
        return false;

    bool ok = true;
    for (const auto& m : m_moves)
        ok = scene.moveNode(m.nodeId, m.to) && ok;
    return ok;
}

bool MoveNodesCommand::revert(GraphScene& scene)
{
    bool ok = true;
    for (const auto& m : m_moves)
        ok = scene.moveNode(m.nodeId, m.from) && ok;
    return ok;
}

ConnectNodesCommand::ConnectNodesCommand(ConnectionId connectionId, NodeId source, NodeId target)
    : m_connectionId(connectionId)
    , m_source(source)
    , m_target(target)
{}

QString ConnectNodesCommand::name() const
{
    return QStringLiteral("Connect Nodes");
}

bool ConnectNodesCommand::apply(GraphScene& scene)
{
    auto connection = m_connection ? std::move(m_connection)
                                   : GraphConnection::create(m_connectionId, m_source, m_target);
    if (!connection)
        return false;

    if (!m_hasIndex) {
        m_index = scene.connections().size();
        m_hasIndex = true;
    }

    return scene.insertConnection(m_index, std::move(connection));
}

bool ConnectNodesCommand::revert(GraphScene& scene)
{
    auto removed = scene.takeConnection(m_connectionId);
    if (!removed)
        return false;
    m_index = removed->index;
    m_connection = std::move(removed->connection);
    return true;
}

DeleteConnectionCommand::DeleteConnectionCommand(ConnectionId connectionId)
    : m_connectionId(connectionId)
{}

QString DeleteConnectionCommand::name() const
{
    return QStringLiteral("Delete Connection");
}

bool DeleteConnectionCommand::apply(GraphScene& scene)
{
    auto removed = scene.takeConnection(m_connectionId);
    if (!removed)
        return false;
    m_index = removed->index;
    m_saved = std::move(removed->connection);
    return true;
}

bool DeleteConnectionCommand::revert(GraphScene& scene)
{
    if (!m_saved)
        return false;
    return scene.insertConnection(m_index, std::move(m_saved));
}

DeleteNodesCommand::DeleteNodesCommand(std::vector<NodeId> nodeIds)
    : m_nodeIds(std::move(nodeIds))
{}

QString DeleteNodesCommand::name() const
{
    return m_nodeIds.size() == 1 ? QStringLiteral("Delete Node") : QStringLiteral("Delete Nodes");
}

bool DeleteNodesCommand::apply(GraphScene& scene)
{
    std::vector<NodeId> nodes;
    for (const NodeId id : m_nodeIds) {
        if (scene.findNode(id) && std::find(nodes.begin(), nodes.end(), id) == nodes.end())
            nodes.push_back(id);
    }
    if (nodes.empty())
        return false;

    std::vector<ConnectionId> connections;
    for (const NodeId id : nodes) {
        for (const GraphConnection* c : scene.connectionsOf(id)) {
            if (std::find(connections.begin(), connections.end(), c->id()) == connections.end())
                connections.push_back(c->id());
        }
    }

    // Highest index first so each recorded index is the pre-delete one.
    std::sort(connections.begin(), connections.end(), [&scene](ConnectionId a, ConnectionId b) {
        return scene.indexOfConnection(a).value_or(0) > scene.indexOfConnection(b).value_or(0);
    });
    std::sort(nodes.begin(), nodes.end(), [&scene](NodeId a, NodeId b) {
        return scene.indexOfNode(a).value_or(0) > scene.indexOfNode(b).value_or(0);
    });

    m_savedConnections.clear();
    m_savedNodes.clear();

    for (const ConnectionId id : connections) {
        auto removed = scene.takeConnection(id);
        if (removed)
            m_savedConnections.push_back(SavedConnection{removed->index, std::move(removed->connection)});
    }
    for (const NodeId id : nodes) {
        auto removed = scene.takeNode(id);
        if (!removed)
            return false;
        m_savedNodes.push_back(SavedNode{removed->index, std::move(removed->node)});
    }

    qCDebug(nodecanvaslog) << "deleted" << m_savedNodes.size() << "node(s) and"
                           << m_savedConnections.size() << "connection(s)";
    return true;
}

bool DeleteNodesCommand::revert(GraphScene& scene)
{
    if (m_savedNodes.empty())
        return false;

    bool ok = true;
    for (auto it = m_savedNodes.rbegin(); it != m_savedNodes.rend(); ++it) {
        it->node->setSelected(false);
        ok = scene.insertNode(it->index, std::move(it->node)) && ok;
    }
    for (auto it = m_savedConnections.rbegin(); it != m_savedConnections.rend(); ++it)
        ok = scene.insertConnection(it->index, std::move(it->connection)) && ok;

    m_savedNodes.clear();
    m_savedConnections.clear();
    return ok;
}

} // namespace NodeCanvas
