#pragma once

#include "nodecanvas/GraphGrid.hpp"
#include "nodecanvas/GraphInput.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtWidgets/QWidget>

namespace NodeCanvas {

class GraphController;
class GraphScene;
class GraphViewport;
struct EditorSettings;
struct GraphRenderContext;

class NODECANVAS_EXPORT GraphView final : public QWidget
{
	Q_OBJECT

public:
	explicit GraphView(QWidget* parent = nullptr);
	~GraphView() override = default;

	GraphViewport* viewport() const noexcept { return m_viewport; }
	GraphScene* scene() const noexcept { return m_scene; }
	GraphController* controller() const noexcept { return m_controller; }
	const GraphGrid& grid() const noexcept { return m_grid; }

	void setScene(GraphScene* scene);
	void setController(GraphController* controller);
	void applySettings(const EditorSettings& settings);

protected:
	void paintEvent(QPaintEvent* e) override;
	void resizeEvent(QResizeEvent* e) override;
	void wheelEvent(QWheelEvent* e) override;
	void mousePressEvent(QMouseEvent* e) override;
	void mouseMoveEvent(QMouseEvent* e) override;
	void mouseReleaseEvent(QMouseEvent* e) override;
	void keyPressEvent(QKeyEvent* e) override;

private:
	GraphRenderContext buildRenderContext() const;
	void drawBackgroundLayer(QPainter& p) const;
	void applyViewTransform(QPainter& p) const;
	void drawGridLayer(QPainter& p, const GraphRenderContext& ctx) const;
	void drawContentLayer(QPainter& p, const GraphRenderContext& ctx) const;
	void drawOverlayLayer(QPainter& p, const GraphRenderContext& ctx) const;

	bool forwardPointer(PointerEvent::Action action, QMouseEvent* e);

	GraphViewport* m_viewport = nullptr;
	GraphScene* m_scene = nullptr;
	GraphController* m_controller = nullptr;
	GraphGrid m_grid;
};

} // namespace NodeCanvas
