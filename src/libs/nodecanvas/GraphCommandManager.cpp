#include "nodecanvas/GraphCommandManager.hpp"

#include "nodecanvas/GraphScene.hpp"

namespace NodeCanvas {

GraphCommandManager::GraphCommandManager(GraphScene* scene)
    : m_scene(scene)
{}

bool GraphCommandManager::execute(std::unique_ptr<GraphCommand> cmd)
{
    if (!m_scene || !cmd)
        return false;

    if (!cmd->apply(*m_scene)) {
        qCDebug(nodecanvaslog) << "command rejected:" << cmd->name();
        return false;
    }

    qCDebug(nodecanvaslog) << "executed" << cmd->name();
    m_redo.clear();
    m_undo.push_back(std::move(cmd));
    m_scene->notifyHistoryChanged();
    return true;
}

QString GraphCommandManager::undoName() const
{
    return m_undo.empty() ? QString() : m_undo.back()->name();
}

QString GraphCommandManager::redoName() const
{
    return m_redo.empty() ? QString() : m_redo.back()->name();
}

bool GraphCommandManager::undo()
{
    return step(Direction::Undo);
}

bool GraphCommandManager::redo()
{
    return step(Direction::Redo);
}

bool GraphCommandManager::step(Direction direction)
{
    auto& from = direction == Direction::Undo ? m_undo : m_redo;
    auto& to = direction == Direction::Undo ? m_redo : m_undo;
    if (!m_scene || from.empty())
        return false;

    std::unique_ptr<GraphCommand> cmd = std::move(from.back());
    from.pop_back();

    const bool ok = direction == Direction::Undo ? cmd->revert(*m_scene) : cmd->apply(*m_scene);
    if (!ok) {
        // A command that cannot be replayed leaves the history for good.
        qCWarning(nodecanvaslog) << (direction == Direction::Undo ? "undo" : "redo")
                                 << "failed:" << cmd->name();
        m_scene->notifyHistoryChanged();
        return false;
    }

    to.push_back(std::move(cmd));
    m_scene->notifyHistoryChanged();
    return true;
}

void GraphCommandManager::clear()
{
    m_undo.clear();
    m_redo.clear();
    if (m_scene)
        m_scene->notifyHistoryChanged();
}

} // namespace NodeCanvas
