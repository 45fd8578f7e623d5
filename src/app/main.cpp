#include <QtCore/QCoreApplication>
#include <QtCore/QLoggingCategory>
#include <QtCore/QSettings>

#include <QtWidgets/QApplication>

#include "MainWindow.hpp"

#include "nodecanvas/EditorSettings.hpp"

Q_LOGGING_CATEGORY(nodecanvasapplog, "nodecanvas.app")

static constexpr char organizationNameC[] = "NodeCanvas";
static constexpr char applicationNameC[] = "NodeCanvas";

int main(int argc, char** argv)
{
	QCoreApplication::setOrganizationName(QString::fromLatin1(organizationNameC));
	QCoreApplication::setApplicationName(QString::fromLatin1(applicationNameC));

	QApplication app(argc, argv);

	const QSettings settings;
	const NodeCanvas::EditorSettings editorSettings = NodeCanvas::EditorSettings::load(settings);
	qCInfo(nodecanvasapplog) << "settings:" << settings.fileName()
	                         << "zoom" << editorSettings.minZoom << "-" << editorSettings.maxZoom;

	MainWindow window(editorSettings);
	window.show();

	return app.exec();
}
