// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodecanvas/EditorSettings.hpp"
#include "nodecanvas/GraphController.hpp"
#include "nodecanvas/GraphScene.hpp"
#include "nodecanvas/GraphView.hpp"
#include "nodecanvas/GraphViewport.hpp"

#include <QtGui/QColor>
#include <QtGui/QImage>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>
#include <QtTest/QSignalSpy>
#include <QtWidgets/QApplication>

using namespace NodeCanvas;

namespace {

QApplication* ensureApp()
{
    static QApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "nodecanvas-view-tests";
        static char* argv[] = { arg0, nullptr };
        return new QApplication(argc, argv);
    }();
    return app;
}

struct ViewHarness {
    GraphScene scene;
    GraphView view;
    GraphController controller{&scene, view.viewport()};

    ViewHarness()
    {
        view.setScene(&scene);
        view.setController(&controller);
        view.resize(640, 480);
        view.show();
    }
};

void sendMouse(QWidget& w, QEvent::Type type, const QPointF& pos, Qt::MouseButton button, Qt::MouseButtons buttons)
{
    QMouseEvent ev(type, pos, w.mapToGlobal(pos), button, buttons, Qt::NoModifier);
    QApplication::sendEvent(&w, &ev);
}

} // namespace

TEST(GraphViewTests, ResizeUpdatesViewportSize)
{
    ensureApp();
    ViewHarness h;
    EXPECT_EQ(h.view.viewport()->size(), QSizeF(640.0, 480.0));
    EXPECT_EQ(h.view.viewport()->visibleWorldRect(), QRectF(0.0, 0.0, 640.0, 480.0));
}

TEST(GraphViewTests, WheelEventZoomsViewport)
{
    ensureApp();
    ViewHarness h;
    QSignalSpy spy(h.view.viewport(), &GraphViewport::changed);

    const QPointF pos(200.0, 150.0);
    QWheelEvent ev(pos, h.view.mapToGlobal(pos), QPoint(), QPoint(0, 120),
                   Qt::NoButton, Qt::NoModifier, Qt::NoScrollPhase, false);
    QApplication::sendEvent(&h.view, &ev);

    EXPECT_TRUE(ev.isAccepted());
    EXPECT_DOUBLE_EQ(h.view.viewport()->scale(), 1.25);
    EXPECT_EQ(spy.count(), 1);
}

TEST(GraphViewTests, MouseDragThroughWidgetConnectsNodes)
{
    ensureApp();
    ViewHarness h;
    h.controller.addNode(QPointF(0.0, 0.0));
    h.controller.addNode(QPointF(300.0, 0.0));

    sendMouse(h.view, QEvent::MouseButtonPress, QPointF(150.0, 50.0), Qt::LeftButton, Qt::LeftButton);
    sendMouse(h.view, QEvent::MouseMove, QPointF(250.0, 50.0), Qt::NoButton, Qt::LeftButton);
    EXPECT_EQ(h.controller.state(), GraphController::InteractionState::DrawingConnection);
    sendMouse(h.view, QEvent::MouseButtonRelease, QPointF(301.0, 50.0), Qt::LeftButton, Qt::NoButton);

    EXPECT_EQ(h.scene.connections().size(), 1u);
    EXPECT_EQ(h.controller.state(), GraphController::InteractionState::Idle);
}

TEST(GraphViewTests, SettingsReachGridAndController)
{
    ensureApp();
    ViewHarness h;

    EditorSettings settings;
    settings.gridCellSize = 40.0;
    settings.gridMajorLineEvery = 4;
    settings.portHitThreshold = 25.0;
    h.view.applySettings(settings);

    EXPECT_DOUBLE_EQ(h.view.grid().config().cellSize, 40.0);
    EXPECT_EQ(h.view.grid().config().majorLineEvery, 4);
    EXPECT_DOUBLE_EQ(h.controller.portHitThreshold(), 25.0);
}

TEST(GraphViewTests, RendersBackgroundAndNodes)
{
    ensureApp();
    ViewHarness h;
    h.controller.addNode(QPointF(100.0, 100.0));

    QImage image(h.view.size(), QImage::Format_ARGB32);
    image.fill(Qt::transparent);
    h.view.render(&image);

    EXPECT_EQ(image.pixelColor(5, 5).rgb(), QColor(QStringLiteral("#F0F0F0")).rgb());
    EXPECT_EQ(image.pixelColor(175, 150).rgb(), QColor(QStringLiteral("#F0FFF0")).rgb());
}
