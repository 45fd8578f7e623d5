#pragma once

#include "nodecanvas/GraphCommand.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QString>

#include <memory>
#include <vector>

namespace NodeCanvas {

class GraphScene;

// Linear undo history. Executing a new command drops everything that could have been redone.
class NODECANVAS_EXPORT GraphCommandManager final
{
public:
    explicit GraphCommandManager(GraphScene* scene);

    bool execute(std::unique_ptr<GraphCommand> cmd);

    bool canUndo() const noexcept { return !m_undo.empty(); }
    bool canRedo() const noexcept { return !m_redo.empty(); }

    // Name of the command the next undo()/redo() would touch; empty when there is none.
    QString undoName() const;
    QString redoName() const;

    bool undo();
    bool redo();

    void clear();

private:
    enum class Direction { Undo, Redo };
    bool step(Direction direction);

    GraphScene* m_scene = nullptr;
    std::vector<std::unique_ptr<GraphCommand>> m_undo;
    std::vector<std::unique_ptr<GraphCommand>> m_redo;
};

} // namespace NodeCanvas
