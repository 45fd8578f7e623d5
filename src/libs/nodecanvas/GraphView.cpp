#include "nodecanvas/GraphView.hpp"

#include "nodecanvas/EditorSettings.hpp"
#include "nodecanvas/GraphController.hpp"
#include "nodecanvas/GraphItem.hpp"
#include "nodecanvas/GraphRenderContext.hpp"
#include "nodecanvas/GraphScene.hpp"
#include "nodecanvas/GraphStyle.hpp"
#include "nodecanvas/GraphViewport.hpp"

#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtGui/QWheelEvent>

namespace NodeCanvas {

GraphView::GraphView(QWidget* parent)
	: QWidget(parent)
	, m_viewport(new GraphViewport(this))
{
	setObjectName("GraphView");
	setMouseTracking(true);
	setFocusPolicy(Qt::StrongFocus);
	setAttribute(Qt::WA_OpaquePaintEvent, true);

	// Any transform change repaints the whole viewport.
	connect(m_viewport, &GraphViewport::changed, this, QOverload<>::of(&GraphView::update));
}

void GraphView::setScene(GraphScene* scene)
{
	if (m_scene == scene)
		return;

	if (m_scene)
		disconnect(m_scene, nullptr, this, nullptr);

	m_scene = scene;

	if (m_scene)
		connect(m_scene, &GraphScene::changed, this, QOverload<>::of(&GraphView::update));

	update();
}

void GraphView::setController(GraphController* controller)
{
	if (m_controller == controller)
		return;

	if (m_controller)
		disconnect(m_controller, nullptr, this, nullptr);

	m_controller = controller;

	if (m_controller)
		connect(m_controller, &GraphController::overlayChanged, this, QOverload<>::of(&GraphView::update));
}

void GraphView::applySettings(const EditorSettings& settings)
{
	m_viewport->applySettings(settings);

	GraphGrid::Config cfg = m_grid.config();
	cfg.cellSize = settings.gridCellSize;
	cfg.majorLineEvery = settings.gridMajorLineEvery;
	m_grid.setConfig(cfg);

	if (m_controller)
		m_controller->applySettings(settings);

	update();
}

GraphRenderContext GraphView::buildRenderContext() const
{
	GraphRenderContext ctx;
	ctx.zoom = m_viewport->scale();
	ctx.visibleSceneRect = m_viewport->visibleWorldRect();
	return ctx;
}

void GraphView::paintEvent(QPaintEvent* e)
{
	Q_UNUSED(e);

	QPainter p(this);
	p.setRenderHints(QPainter::Antialiasing, true);

	drawBackgroundLayer(p);

	const GraphRenderContext ctx = buildRenderContext();

	p.save();
	applyViewTransform(p);
	drawGridLayer(p, ctx);
	drawContentLayer(p, ctx);
	drawOverlayLayer(p, ctx);
	p.restore();
}

void GraphView::drawBackgroundLayer(QPainter& p) const
{
	GraphStyle::drawBackground(p, rect());
}

void GraphView::applyViewTransform(QPainter& p) const
{
	const QPointF pan = m_viewport->pan();
	const double zoom = m_viewport->scale();
	p.translate(pan.x(), pan.y());
	p.scale(zoom, zoom);
}

void GraphView::drawGridLayer(QPainter& p, const GraphRenderContext& ctx) const
{
	m_grid.draw(p, ctx.visibleSceneRect);
}

void GraphView::drawContentLayer(QPainter& p, const GraphRenderContext& ctx) const
{
	if (!m_scene)
		return;

	for (const GraphItem* item : m_scene->itemsInDrawOrder()) {
		if (item && ctx.isVisible(item->boundsScene()))
			item->draw(p, ctx);
	}
}

void GraphView::drawOverlayLayer(QPainter& p, const GraphRenderContext& ctx) const
{
	if (!m_controller)
		return;

	if (const auto line = m_controller->previewLine())
		GraphStyle::drawConnectionPreview(p, *line);

	if (const auto band = m_controller->marqueeRect())
		GraphStyle::drawMarquee(p, *band, ctx.zoom);
}

void GraphView::resizeEvent(QResizeEvent* e)
{
	QWidget::resizeEvent(e);
	m_viewport->setSize(QSizeF(size()));
}

bool GraphView::forwardPointer(PointerEvent::Action action, QMouseEvent* e)
{
	if (!m_controller)
		return false;

	PointerEvent ev;
	ev.action = action;
	ev.screenPos = e->position();
	ev.button = e->button();
	ev.buttons = e->buttons();
	ev.modifiers = e->modifiers();
	return m_controller->handlePointer(ev);
}

void GraphView::mousePressEvent(QMouseEvent* event)
{
	if (forwardPointer(PointerEvent::Action::Press, event))
		event->accept();
	else
		QWidget::mousePressEvent(event);
}

void GraphView::mouseMoveEvent(QMouseEvent* event)
{
	if (forwardPointer(PointerEvent::Action::Move, event))
		event->accept();
	else
		QWidget::mouseMoveEvent(event);
}

void GraphView::mouseReleaseEvent(QMouseEvent* event)
{
	if (forwardPointer(PointerEvent::Action::Release, event))
		event->accept();
	else
		QWidget::mouseReleaseEvent(event);
}

void GraphView::wheelEvent(QWheelEvent* event)
{
	if (!m_controller) {
		QWidget::wheelEvent(event);
		return;
	}

	WheelInput ev;
	ev.screenPos = event->position();
	ev.angleDeltaY = event->angleDelta().y();
	ev.modifiers = event->modifiers();
	if (m_controller->handleWheel(ev))
		event->accept();
	else
		event->ignore();
}

void GraphView::keyPressEvent(QKeyEvent* event)
{
	if (m_controller && m_controller->handleKey(KeyInput{event->key(), event->modifiers()}))
		event->accept();
	else
		QWidget::keyPressEvent(event);
}

} // namespace NodeCanvas
