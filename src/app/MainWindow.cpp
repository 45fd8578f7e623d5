#include "MainWindow.hpp"

#include "nodecanvas/EditorSettings.hpp"
#include "nodecanvas/GraphController.hpp"
#include "nodecanvas/GraphScene.hpp"
#include "nodecanvas/GraphView.hpp"
#include "nodecanvas/GraphViewport.hpp"

#include <QtGui/QAction>
#include <QtGui/QIcon>
#include <QtWidgets/QStyle>
#include <QtWidgets/QToolBar>

MainWindow::MainWindow(const NodeCanvas::EditorSettings& settings, QWidget* parent)
	: QMainWindow(parent)
{
	setWindowTitle(tr("NodeCanvas"));
	resize(1024, 768);

	m_scene = new NodeCanvas::GraphScene(this);
	m_view = new NodeCanvas::GraphView(this);
	m_controller = new NodeCanvas::GraphController(m_scene, m_view->viewport(), this);

	m_view->setScene(m_scene);
	m_view->setController(m_controller);
	m_view->applySettings(settings);
	setCentralWidget(m_view);

	buildToolBar();
	m_view->setFocus();
}

void MainWindow::buildToolBar()
{
	auto* toolBar = addToolBar(tr("Graph"));
	toolBar->setObjectName(QStringLiteral("GraphToolBar"));
	toolBar->setMovable(false);
	toolBar->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);

	const QIcon addIcon = QIcon::fromTheme(QStringLiteral("list-add"),
	                                       style()->standardIcon(QStyle::SP_FileDialogNewFolder));
	QAction* addNodeAction = toolBar->addAction(addIcon, tr("Add Node"));
	connect(addNodeAction, &QAction::triggered, this, [this] {
		m_controller->addNodeAtRandom();
		m_view->setFocus();
	});

	toolBar->addSeparator();

	QAction* undoAction = toolBar->addAction(tr("Undo"));
	connect(undoAction, &QAction::triggered, m_controller, &NodeCanvas::GraphController::undo);

	QAction* redoAction = toolBar->addAction(tr("Redo"));
	connect(redoAction, &QAction::triggered, m_controller, &NodeCanvas::GraphController::redo);

	const auto syncHistoryActions = [this, undoAction, redoAction] {
		const auto& commands = m_scene->commands();
		undoAction->setEnabled(commands.canUndo());
		undoAction->setToolTip(commands.canUndo() ? tr("Undo %1").arg(commands.undoName()) : tr("Undo"));
		redoAction->setEnabled(commands.canRedo());
		redoAction->setToolTip(commands.canRedo() ? tr("Redo %1").arg(commands.redoName()) : tr("Redo"));
	};
	connect(m_scene, &NodeCanvas::GraphScene::historyChanged, this, syncHistoryActions);
	syncHistoryActions();

	QAction* resetAction = toolBar->addAction(tr("Reset View"));
	connect(resetAction, &QAction::triggered, m_view->viewport(), &NodeCanvas::GraphViewport::resetView);
}
