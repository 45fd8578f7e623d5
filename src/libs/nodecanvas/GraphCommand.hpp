#pragma once

#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QString>

namespace NodeCanvas {

class GraphScene;

class NODECANVAS_EXPORT GraphCommand
{
public:
    virtual ~GraphCommand() = default;

    virtual QString name() const = 0;

    virtual bool apply(GraphScene& scene) = 0;

    virtual bool revert(GraphScene& scene) = 0;
};

} // namespace NodeCanvas
