#pragma once

#include <QtWidgets/QMainWindow>

namespace NodeCanvas {
class GraphController;
class GraphScene;
class GraphView;
struct EditorSettings;
} // namespace NodeCanvas

class MainWindow final : public QMainWindow
{
	Q_OBJECT

public:
	explicit MainWindow(const NodeCanvas::EditorSettings& settings, QWidget* parent = nullptr);

	NodeCanvas::GraphView* view() const noexcept { return m_view; }
	NodeCanvas::GraphController* controller() const noexcept { return m_controller; }

private:
	void buildToolBar();

	NodeCanvas::GraphScene* m_scene = nullptr;
	NodeCanvas::GraphView* m_view = nullptr;
	NodeCanvas::GraphController* m_controller = nullptr;
};
