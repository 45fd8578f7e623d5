// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodecanvas/GraphController.hpp"

#include "nodecanvas/EditorSettings.hpp"
#include "nodecanvas/GraphCommands.hpp"
#include "nodecanvas/GraphNode.hpp"
#include "nodecanvas/GraphScene.hpp"
#include "nodecanvas/GraphViewport.hpp"
#include "nodecanvas/Tools.hpp"

#include <QtCore/QRandomGenerator>

#include <memory>

namespace NodeCanvas {

namespace {

bool hasToggleModifier(Qt::KeyboardModifiers mods)
{
	return mods.testFlag(Qt::ControlModifier);
}

bool hasExtendModifier(Qt::KeyboardModifiers mods)
{
	return mods.testFlag(Qt::ShiftModifier) || mods.testFlag(Qt::ControlModifier);
}

QSet<NodeId> toSet(const QList<NodeId>& ids)
{
	return QSet<NodeId>(ids.cbegin(), ids.cend());
}

} // namespace

GraphController::GraphController(GraphScene* scene, GraphViewport* viewport, QObject* parent)
	: QObject(parent)
	, m_scene(scene)
	, m_viewport(viewport)
{}

void GraphController::applySettings(const EditorSettings& settings)
{
	m_portHitThreshold = settings.portHitThreshold;
}

bool GraphController::isPanning() const
{
	return m_viewport && m_viewport->isPanning();
}

std::optional<QLineF> GraphController::previewLine() const
{
	if (m_state != InteractionState::DrawingConnection)
		return std::nullopt;
	return QLineF(m_connectionStartScene, m_connectionEndScene);
}

std::optional<QRectF> GraphController::marqueeRect() const
{
	if (m_state != InteractionState::RubberBand)
		return std::nullopt;
	return m_marqueeRectScene;
}

void GraphController::setState(InteractionState state)
{
	if (m_state == state)
		return;
	m_state = state;
	qCDebug(nodecanvaslog) << "interaction state" << state;
	emit stateChanged(state);
}

bool GraphController::isPanButton(Qt::MouseButton button)
{
	return button == Qt::RightButton || button == Qt::MiddleButton;
}

GraphNode* GraphController::topmostNodeAt(const QPointF& scenePos) const
{
	GraphItem* hit = m_scene->itemAt(scenePos);
	if (!hit || !hit->isInteractiveNode())
		return nullptr;
	return static_cast<GraphNode*>(hit);
}

bool GraphController::handlePointer(const PointerEvent& ev)
{
	if (!m_scene || !m_viewport)
		return false;

	switch (ev.action) {
		case PointerEvent::Action::Press: return handlePress(ev);
		case PointerEvent::Action::Move: return handleMove(ev);
		case PointerEvent::Action::Release: return handleRelease(ev);
	}
	return false;
}

bool GraphController::handlePress(const PointerEvent& ev)
{
	if (isPanButton(ev.button)) {
		m_viewport->beginPan(ev.screenPos);
		return true;
	}

	if (ev.button != Qt::LeftButton)
		return false;

	// A second left press while a gesture is live is swallowed.
	if (m_state != InteractionState::Idle)
		return true;

	const QPointF scenePos = m_viewport->toWorld(ev.screenPos);
	GraphItem* hit = m_scene->itemAt(scenePos);
	GraphNode* node = hit && hit->isInteractiveNode() ? static_cast<GraphNode*>(hit) : nullptr;

	if (node && node->isNearPort(PortKind::Output, scenePos, m_portHitThreshold)) {
		beginConnection(*node, scenePos);
		return true;
	}

	if (node) {
		beginNodeDrag(*node, scenePos, ev.modifiers);
		return true;
	}

	if (hit && hit->kind() == GraphItem::Kind::Connection) {
		const auto* connection = static_cast<const GraphConnection*>(hit);
		qCDebug(nodecanvaslog) << "connection" << connection->id().value() << "selected";
		m_scene->selectConnection(connection->id());
		return true;
	}

	beginMarquee(scenePos, ev.screenPos, ev.modifiers);
	return true;
}

bool GraphController::handleMove(const PointerEvent& ev)
{
	if (m_viewport->isPanning()) {
		if (ev.buttons.testFlag(Qt::RightButton) || ev.buttons.testFlag(Qt::MiddleButton))
			m_viewport->updatePan(ev.screenPos);
		else
			m_viewport->endPan();
		return true;
	}

	const QPointF scenePos = m_viewport->toWorld(ev.screenPos);

	switch (m_state) {
		case InteractionState::DrawingConnection:
			updateConnection(scenePos);
			return true;
		case InteractionState::DraggingNode:
			if (!ev.buttons.testFlag(Qt::LeftButton)) {
				finishNodeDrag();
				return true;
			}
			updateNodeDrag(scenePos);
			return true;
		case InteractionState::RubberBand:
			updateMarquee(scenePos);
			return true;
		case InteractionState::Idle:
			break;
	}
	return false;
}

bool GraphController::handleRelease(const PointerEvent& ev)
{
	if (isPanButton(ev.button)) {
		if (!m_viewport->isPanning())
			return false;
		if (!ev.buttons.testFlag(Qt::RightButton) && !ev.buttons.testFlag(Qt::MiddleButton))
			m_viewport->endPan();
		return true;
	}

	if (ev.button != Qt::LeftButton)
		return false;

	const QPointF scenePos = m_viewport->toWorld(ev.screenPos);

	switch (m_state) {
		case InteractionState::DrawingConnection:
			finishConnection(scenePos);
			return true;
		case InteractionState::DraggingNode:
			finishNodeDrag();
			return true;
		case InteractionState::RubberBand:
			finishMarquee(scenePos, ev.screenPos);
			return true;
		case InteractionState::Idle:
			break;
	}
	return false;
}

bool GraphController::handleWheel(const WheelInput& ev)
{
	if (!m_viewport || ev.angleDeltaY == 0)
		return false;

	m_viewport->zoom(ev.angleDeltaY > 0 ? 1 : -1, ev.screenPos);
	return true;
}

bool GraphController::handleKey(const KeyInput& ev)
{
	if (!m_scene)
		return false;

	if (ev.key == Qt::Key_Escape) {
		if (m_state == InteractionState::Idle)
			return false;
		cancelGesture();
		return true;
	}

	if (m_state != InteractionState::Idle)
		return false;

	if (ev.modifiers.testFlag(Qt::ControlModifier)) {
		if (ev.key == Qt::Key_Z) {
			if (ev.modifiers.testFlag(Qt::ShiftModifier))
				redo();
			else
				undo();
			return true;
		}
		if (ev.key == Qt::Key_Y) {
			redo();
			return true;
		}
	}

	if (ev.key == Qt::Key_Delete || ev.key == Qt::Key_Backspace)
		return deleteSelection();

	return false;
}

NodeId GraphController::addNode(const QPointF& positionScene)
{
	if (!m_scene)
		return NodeId{};

	const NodeId id = m_scene->allocateNodeId();
	if (!m_scene->commands().execute(std::make_unique<AddNodeCommand>(id, positionScene)))
		return NodeId{};
	return id;
}

NodeId GraphController::addNodeAtRandom()
{
	return addNodeAtRandom(*QRandomGenerator::global());
}

NodeId GraphController::addNodeAtRandom(QRandomGenerator& rng)
{
	return addNode(Tools::randomNodePosition(rng));
}

bool GraphController::deleteSelection()
{
	if (!m_scene || m_state != InteractionState::Idle)
		return false;

	const QList<NodeId> selected = m_scene->selectedNodes();
	if (selected.isEmpty()) {
		const ConnectionId connection = m_scene->selectedConnection();
		if (!connection)
			return false;
		return m_scene->commands().execute(std::make_unique<DeleteConnectionCommand>(connection));
	}

	std::vector<NodeId> ids(selected.cbegin(), selected.cend());
	return m_scene->commands().execute(std::make_unique<DeleteNodesCommand>(std::move(ids)));
}

bool GraphController::undo()
{
	if (!m_scene || m_state != InteractionState::Idle)
		return false;
	return m_scene->commands().undo();
}

bool GraphController::redo()
{
	if (!m_scene || m_state != InteractionState::Idle)
		return false;
	return m_scene->commands().redo();
}

void GraphController::cancelGesture()
{
	switch (m_state) {
		case InteractionState::DrawingConnection:
			qCDebug(nodecanvaslog) << "connection from node" << m_connectionSource.value() << "cancelled";
			m_connectionSource = NodeId{};
			break;
		case InteractionState::DraggingNode:
			restoreDraggedNodes();
			break;
		case InteractionState::RubberBand:
			if (m_scene)
				m_scene->setSelection(m_marqueeBaseSelection);
			m_marqueeRectScene = QRectF();
			break;
		case InteractionState::Idle:
			return;
	}

	setState(InteractionState::Idle);
	emit overlayChanged();
}

void GraphController::beginConnection(const GraphNode& source, const QPointF& scenePos)
{
	m_connectionSource = source.id();
	m_connectionStartScene = source.outputPortScene();
	m_connectionEndScene = scenePos;
	qCDebug(nodecanvaslog) << "connection started at node" << source.id().value();

	setState(InteractionState::DrawingConnection);
	emit overlayChanged();
}

void GraphController::updateConnection(const QPointF& scenePos)
{
	m_connectionEndScene = scenePos;
	emit overlayChanged();
}

void GraphController::finishConnection(const QPointF& scenePos)
{
	const NodeId source = m_connectionSource;
	m_connectionSource = NodeId{};
	setState(InteractionState::Idle);
	emit overlayChanged();

	GraphNode* target = topmostNodeAt(scenePos);
	if (!target || target->id() == source
	    || !target->isNearPort(PortKind::Input, scenePos, m_portHitThreshold)) {
		qCDebug(nodecanvaslog) << "connection from node" << source.value() << "dropped";
		return;
	}

	const ConnectionId id = m_scene->allocateConnectionId();
	m_scene->commands().execute(std::make_unique<ConnectNodesCommand>(id, source, target->id()));
}

void GraphController::beginNodeDrag(GraphNode& node, const QPointF& scenePos, Qt::KeyboardModifiers mods)
{
	QSet<NodeId> selection = toSet(m_scene->selectedNodes());
	if (hasToggleModifier(mods)) {
		if (selection.contains(node.id()))
			selection.remove(node.id());
		else
			selection.insert(node.id());
		m_scene->setSelection(selection);
		if (!selection.contains(node.id()))
			return;
	} else if (!selection.contains(node.id())) {
		selection = {node.id()};
		m_scene->setSelection(selection);
	}

	m_dragStartScene = scenePos;
	m_dragOrigins.clear();
	for (const auto& n : m_scene->nodes()) {
		if (n->isSelected())
			m_dragOrigins.emplace_back(n->id(), n->position());
	}

	setState(InteractionState::DraggingNode);
}

void GraphController::updateNodeDrag(const QPointF& scenePos)
{
	const QPointF delta = scenePos - m_dragStartScene;
	for (const auto& [id, origin] : m_dragOrigins)
		m_scene->moveNode(id, origin + delta);
}

void GraphController::finishNodeDrag()
{
	std::vector<MoveNodesCommand::Move> moves;
	for (const auto& [id, origin] : m_dragOrigins) {
		const GraphNode* node = m_scene->findNode(id);
		if (node && node->position() != origin)
			moves.push_back(MoveNodesCommand::Move{id, origin, node->position()});
	}
	m_dragOrigins.clear();
	setState(InteractionState::Idle);

	if (!moves.empty())
		m_scene->commands().execute(std::make_unique<MoveNodesCommand>(std::move(moves)));
}

void GraphController::restoreDraggedNodes()
{
	for (const auto& [id, origin] : m_dragOrigins)
		m_scene->moveNode(id, origin);
	m_dragOrigins.clear();
}

void GraphController::beginMarquee(const QPointF& scenePos, const QPointF& screenPos, Qt::KeyboardModifiers mods)
{
	m_marqueeStartScene = scenePos;
	m_marqueeStartView = screenPos;
	m_marqueeRectScene = QRectF(scenePos, scenePos);
	m_marqueeMods = mods;
	m_marqueeBaseSelection = toSet(m_scene->selectedNodes());

	if (!hasExtendModifier(mods))
		m_scene->clearSelection();

	setState(InteractionState::RubberBand);
	emit overlayChanged();
}

void GraphController::updateMarquee(const QPointF& scenePos)
{
	m_marqueeRectScene = QRectF(m_marqueeStartScene, scenePos).normalized();

	const QSet<NodeId> hits = toSet(m_scene->nodesIntersecting(m_marqueeRectScene));
	QSet<NodeId> next = m_marqueeBaseSelection;

	if (m_marqueeMods.testFlag(Qt::ControlModifier)) {
		for (const NodeId id : hits) {
			if (next.contains(id))
				next.remove(id);
			else
				next.insert(id);
		}
	} else if (m_marqueeMods.testFlag(Qt::ShiftModifier)) {
		next.unite(hits);
	} else {
		next = hits;
	}

	m_scene->setSelection(next);
	emit overlayChanged();
}

void GraphController::finishMarquee(const QPointF& scenePos, const QPointF& screenPos)
{
	const double dist = QLineF(m_marqueeStartView, screenPos).length();
	if (dist < Constants::kMarqueeDragThresholdPx) {
		if (hasExtendModifier(m_marqueeMods))
			m_scene->setSelection(m_marqueeBaseSelection);
		else
			m_scene->clearSelection();
	} else {
		updateMarquee(scenePos);
	}

	m_marqueeRectScene = QRectF();
	m_marqueeBaseSelection.clear();
	setState(InteractionState::Idle);
	emit overlayChanged();
}

} // namespace NodeCanvas
