// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodecanvas/GraphScene.hpp"

#include <algorithm>
#include <utility>

namespace NodeCanvas {

GraphScene::GraphScene(QObject* parent)
    : QObject(parent)
    , m_commands(this)
{
}

NodeId GraphScene::allocateNodeId()
{
    return NodeId(m_nextNodeId++);
}

ConnectionId GraphScene::allocateConnectionId()
{
    return ConnectionId(m_nextConnectionId++);
}

GraphNode* GraphScene::addNode(const QPointF& positionScene)
{
    auto node = std::make_unique<GraphNode>(allocateNodeId(), positionScene);
    GraphNode* raw = node.get();
    m_nodes.push_back(std::move(node));
    qCDebug(nodecanvaslog) << "node" << raw->id().value() << "added at" << positionScene;
    notifyChanged();
    return raw;
}

GraphNode* GraphScene::findNode(NodeId id) const
{
    if (!id)
        return nullptr;
    for (const auto& n : m_nodes) {
        if (n && n->id() == id)
            return n.get();
    }
    return nullptr;
}

std::optional<size_t> GraphScene::indexOfNode(NodeId id) const
{
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        if (m_nodes[i] && m_nodes[i]->id() == id)
            return i;
    }
    return std::nullopt;
}

ConnectionId GraphScene::connectNodes(NodeId source, NodeId target)
{
    if (!findNode(source) || !findNode(target))
        return ConnectionId{};

    auto connection = GraphConnection::create(allocateConnectionId(), source, target);
    if (!connection)
        return ConnectionId{};

    const ConnectionId id = connection->id();
    if (!insertConnection(m_connections.size(), std::move(connection)))
        return ConnectionId{};
    return id;
}

GraphConnection* GraphScene::findConnection(ConnectionId id) const
{
    if (!id)
        return nullptr;
    for (const auto& c : m_connections) {
        if (c && c->id() == id)
            return c.get();
    }
    return nullptr;
}

std::optional<size_t> GraphScene::indexOfConnection(ConnectionId id) const
{
    for (size_t i = 0; i < m_connections.size(); ++i) {
        if (m_connections[i] && m_connections[i]->id() == id)
            return i;
    }
    return std::nullopt;
}

std::vector<GraphConnection*> GraphScene::connectionsOf(NodeId id) const
{
    std::vector<GraphConnection*> out;
    const GraphNode* node = findNode(id);
    if (!node)
        return out;
    for (const ConnectionId cid : node->connections()) {
        if (GraphConnection* c = findConnection(cid))
            out.push_back(c);
    }
    return out;
}

bool GraphScene::moveNode(NodeId id, const QPointF& newPositionScene)
{
    GraphNode* node = findNode(id);
    if (!node)
        return false;
    if (node->position() == newPositionScene)
        return true;

    node->setPosition(newPositionScene);
    refreshConnections(*node);
    notifyChanged();
    return true;
}

void GraphScene::refreshConnections(const GraphNode& node)
{
    for (const ConnectionId cid : node.connections()) {
        GraphConnection* c = findConnection(cid);
        if (!c)
            continue;
        const GraphNode* source = findNode(c->source());
        const GraphNode* target = findNode(c->target());
        if (source && target)
            c->recomputePath(*source, *target);
    }
}

std::optional<GraphScene::RemovedNode> GraphScene::takeNode(NodeId id)
{
    const auto index = indexOfNode(id);
    if (!index)
        return std::nullopt;
    if (!m_nodes[*index]->connections().empty()) {
        qCWarning(nodecanvaslog) << "node" << id.value() << "still has connections; not removed";
        return std::nullopt;
    }

    RemovedNode out;
    out.index = *index;
    out.node = std::move(m_nodes[*index]);
    m_nodes.erase(m_nodes.begin() + static_cast<std::ptrdiff_t>(*index));
    notifyChanged();
    return out;
}

bool GraphScene::insertNode(size_t index, std::unique_ptr<GraphNode> node)
{
    if (!node || !node->id() || findNode(node->id()))
        return false;
    if (!node->connections().empty())
        return false;

    m_nextNodeId = std::max(m_nextNodeId, node->id().value() + 1);
    index = std::min(index, m_nodes.size());
    m_nodes.insert(m_nodes.begin() + static_cast<std::ptrdiff_t>(index), std::move(node));
    notifyChanged();
    return true;
}

std::optional<GraphScene::RemovedConnection> GraphScene::takeConnection(ConnectionId id)
{
    const auto index = indexOfConnection(id);
    if (!index)
        return std::nullopt;

    GraphConnection* c = m_connections[*index].get();
    if (GraphNode* source = findNode(c->source()))
        source->detachConnection(id);
    if (GraphNode* target = findNode(c->target()))
        target->detachConnection(id);

    c->setSelected(false);

    RemovedConnection out;
    out.index = *index;
    out.connection = std::move(m_connections[*index]);
    m_connections.erase(m_connections.begin() + static_cast<std::ptrdiff_t>(*index));
    notifyChanged();
    return out;
}

bool GraphScene::insertConnection(size_t index, std::unique_ptr<GraphConnection> connection)
{
    if (!connection || findConnection(connection->id()))
        return false;

    GraphNode* source = findNode(connection->source());
    GraphNode* target = findNode(connection->target());
    if (!source || !target || source == target)
        return false;

    source->attachConnection(connection->id());
    target->attachConnection(connection->id());
    connection->recomputePath(*source, *target);

    qCDebug(nodecanvaslog) << "connection" << connection->id().value() << ":"
                           << source->id().value() << "->" << target->id().value();

    m_nextConnectionId = std::max(m_nextConnectionId, connection->id().value() + 1);
    index = std::min(index, m_connections.size());
    m_connections.insert(m_connections.begin() + static_cast<std::ptrdiff_t>(index), std::move(connection));
    notifyChanged();
    return true;
}

bool GraphScene::removeNode(NodeId id)
{
    GraphNode* node = findNode(id);
    if (!node)
        return false;

    const std::vector<ConnectionId> attached = node->connections();
    for (const ConnectionId cid : attached)
        takeConnection(cid);

    return takeNode(id).has_value();
}

GraphItem* GraphScene::itemAt(const QPointF& scenePos) const
{
    if (GraphNode* node = nodeAt(scenePos))
        return node;

    for (auto it = m_connections.rbegin(); it != m_connections.rend(); ++it) {
        GraphConnection* c = it->get();
        if (c && c->hitTest(scenePos))
            return c;
    }
    return nullptr;
}

GraphNode* GraphScene::nodeAt(const QPointF& scenePos) const
{
    for (auto it = m_nodes.rbegin(); it != m_nodes.rend(); ++it) {
        GraphNode* n = it->get();
        if (n && n->hitTest(scenePos))
            return n;
    }
    return nullptr;
}

std::vector<const GraphItem*> GraphScene::itemsInDrawOrder() const
{
    std::vector<const GraphItem*> out;
    out.reserve(m_nodes.size() + m_connections.size());
    for (const auto& c : m_connections)
        out.push_back(c.get());
    for (const auto& n : m_nodes)
        out.push_back(n.get());

    std::stable_sort(out.begin(), out.end(), [](const GraphItem* a, const GraphItem* b) {
        return a->depth() < b->depth();
    });
    return out;
}

QList<NodeId> GraphScene::selectedNodes() const
{
    QList<NodeId> out;
    for (const auto& n : m_nodes) {
        if (n->isSelected())
            out.push_back(n->id());
    }
    return out;
}

QList<NodeId> GraphScene::nodesIntersecting(const QRectF& sceneRect) const
{
    QList<NodeId> out;
    const QRectF rect = sceneRect.normalized();
    for (const auto& n : m_nodes) {
        if (rect.intersects(n->boundsScene()))
            out.push_back(n->id());
    }
    return out;
}

void GraphScene::setSelection(const QSet<NodeId>& ids)
{
    bool changed_ = deselectConnections();
    for (const auto& n : m_nodes) {
        const bool selected = ids.contains(n->id());
        if (n->isSelected() != selected) {
            n->setSelected(selected);
            changed_ = true;
        }
    }
    if (changed_)
        notifyChanged();
}

void GraphScene::clearSelection()
{
    setSelection({});
}

bool GraphScene::isSelected(NodeId id) const
{
    const GraphNode* node = findNode(id);
    return node && node->isSelected();
}

ConnectionId GraphScene::selectedConnection() const
{
    for (const auto& c : m_connections) {
        if (c->isSelected())
            return c->id();
    }
    return ConnectionId{};
}

void GraphScene::selectConnection(ConnectionId id)
{
    GraphConnection* connection = findConnection(id);
    if (!connection) {
        clearSelection();
        return;
    }
    if (connection->isSelected() && selectedNodes().isEmpty())
        return;

    for (const auto& n : m_nodes)
        n->setSelected(false);
    deselectConnections();
    connection->setSelected(true);
    notifyChanged();
}

bool GraphScene::deselectConnections()
{
    bool any = false;
    for (const auto& c : m_connections) {
        if (c->isSelected()) {
            c->setSelected(false);
            any = true;
        }
    }
    return any;
}

bool GraphScene::isConsistent() const
{
    for (const auto& c : m_connections) {
        const GraphNode* source = findNode(c->source());
        const GraphNode* target = findNode(c->target());
        if (!source || !target || source == target)
            return false;
        if (!source->isAttached(c->id()) || !target->isAttached(c->id()))
            return false;
    }
    for (const auto& n : m_nodes) {
        for (const ConnectionId cid : n->connections()) {
            const GraphConnection* c = findConnection(cid);
            if (!c || !c->attachesTo(n->id()))
                return false;
        }
    }
    return true;
}

void GraphScene::notifyChanged()
{
    emit changed();
}

void GraphScene::notifyHistoryChanged()
{
    emit historyChanged();
}

} // namespace NodeCanvas
