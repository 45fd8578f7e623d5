// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/GraphInput.hpp"
#include "nodecanvas/NodeCanvasConstants.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"
#include "nodecanvas/NodeCanvasTypes.hpp"

#include <QtCore/QLineF>
#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QRectF>
#include <QtCore/QSet>

#include <optional>
#include <utility>
#include <vector>

QT_BEGIN_NAMESPACE
class QRandomGenerator;
QT_END_NAMESPACE

namespace NodeCanvas {

class GraphNode;
class GraphScene;
class GraphViewport;
struct EditorSettings;

class NODECANVAS_EXPORT GraphController final : public QObject
{
	Q_OBJECT

public:
	enum class InteractionState { Idle, DraggingNode, DrawingConnection, RubberBand };
	Q_ENUM(InteractionState)

	GraphController(GraphScene* scene, GraphViewport* viewport, QObject* parent = nullptr);

	GraphScene* scene() const noexcept { return m_scene; }
	GraphViewport* viewport() const noexcept { return m_viewport; }

	void applySettings(const EditorSettings& settings);
	double portHitThreshold() const noexcept { return m_portHitThreshold; }

	InteractionState state() const noexcept { return m_state; }
	bool isPanning() const;

	NodeId connectionSource() const noexcept { return m_connectionSource; }
	// In-progress connection line in world coordinates, from the source output port to the pointer.
	std::optional<QLineF> previewLine() const;
	std::optional<QRectF> marqueeRect() const;

	// Each handler returns true when the event was consumed.
	bool handlePointer(const PointerEvent& ev);
	bool handleWheel(const WheelInput& ev);
	bool handleKey(const KeyInput& ev);

	NodeId addNode(const QPointF& positionScene);
	NodeId addNodeAtRandom();
	NodeId addNodeAtRandom(QRandomGenerator& rng);

	bool deleteSelection();
	bool undo();
	bool redo();

	// Aborts whatever gesture is running and returns to Idle.
	void cancelGesture();

signals:
	void stateChanged(NodeCanvas::GraphController::InteractionState state);
	void overlayChanged();

private:
	void setState(InteractionState state);

	bool handlePress(const PointerEvent& ev);
	bool handleMove(const PointerEvent& ev);
	bool handleRelease(const PointerEvent& ev);

	GraphNode* topmostNodeAt(const QPointF& scenePos) const;

	void beginConnection(const GraphNode& source, const QPointF& scenePos);
	void updateConnection(const QPointF& scenePos);
	void finishConnection(const QPointF& scenePos);

	void beginNodeDrag(GraphNode& node, const QPointF& scenePos, Qt::KeyboardModifiers mods);
	void updateNodeDrag(const QPointF& scenePos);
	void finishNodeDrag();
	void restoreDraggedNodes();

	void beginMarquee(const QPointF& scenePos, const QPointF& screenPos, Qt::KeyboardModifiers mods);
	void updateMarquee(const QPointF& scenePos);
	void finishMarquee(const QPointF& scenePos, const QPointF& screenPos);

	static bool isPanButton(Qt::MouseButton button);

	GraphScene* m_scene = nullptr;
	GraphViewport* m_viewport = nullptr;

	InteractionState m_state = InteractionState::Idle;
	double m_portHitThreshold = Constants::kPortHitThreshold;

	NodeId m_connectionSource{};
	QPointF m_connectionStartScene;
	QPointF m_connectionEndScene;

	QPointF m_dragStartScene;
	std::vector<std::pair<NodeId, QPointF>> m_dragOrigins;

	QPointF m_marqueeStartScene;
	QPointF m_marqueeStartView;
	QRectF m_marqueeRectScene;
	Qt::KeyboardModifiers m_marqueeMods = Qt::NoModifier;
	QSet<NodeId> m_marqueeBaseSelection;
};

} // namespace NodeCanvas
