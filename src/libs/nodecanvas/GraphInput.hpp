#pragma once

#include <QtCore/QPointF>
#include <QtCore/Qt>

namespace NodeCanvas {

// Toolkit-independent input records. GraphView translates QMouseEvent and friends into these.
struct PointerEvent final {
	enum class Action { Press, Move, Release };

	Action action = Action::Move;
	QPointF screenPos;
	Qt::MouseButton button = Qt::NoButton;
	Qt::MouseButtons buttons = Qt::NoButton;
	Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

struct WheelInput final {
	QPointF screenPos;
	int angleDeltaY = 0;
	Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

struct KeyInput final {
	int key = 0;
	Qt::KeyboardModifiers modifiers = Qt::NoModifier;
};

} // namespace NodeCanvas
