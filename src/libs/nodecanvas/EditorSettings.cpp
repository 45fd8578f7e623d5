// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "nodecanvas/EditorSettings.hpp"

#include <QtCore/QSettings>
#include <QtCore/QtNumeric>

#include <utility>

namespace NodeCanvas {

namespace {

constexpr char kMinZoomKey[] = "view/minZoom";
constexpr char kMaxZoomKey[] = "view/maxZoom";
constexpr char kZoomStepKey[] = "view/zoomStep";
constexpr char kGridCellSizeKey[] = "grid/cellSize";
constexpr char kGridMajorLineEveryKey[] = "grid/majorLineEvery";
constexpr char kPortHitThresholdKey[] = "interaction/portHitThreshold";

bool fail(QString* error, const QString& msg)
{
    if (error)
        *error = msg;
    return false;
}

} // namespace

bool EditorSettings::isValid(QString* error) const
{
    const std::pair<const char*, double> reals[] = {
        {kMinZoomKey, minZoom},
        {kMaxZoomKey, maxZoom},
        {kZoomStepKey, zoomStep},
        {kGridCellSizeKey, gridCellSize},
        {kPortHitThresholdKey, portHitThreshold},
    };
    for (const auto& [key, value] : reals) {
        if (!qIsFinite(value))
            return fail(error, QStringLiteral("%1 must be a finite number (got %2).").arg(QLatin1String(key)).arg(value));
    }

    if (!(minZoom > 0.0))
        return fail(error, QStringLiteral("view/minZoom must be positive (got %1).").arg(minZoom));
    if (minZoom > 1.0 || maxZoom < 1.0)
        return fail(error, QStringLiteral("Zoom range [%1, %2] must contain 1.0.").arg(minZoom).arg(maxZoom));
    if (!(zoomStep > 1.0))
        return fail(error, QStringLiteral("view/zoomStep must be greater than 1.0 (got %1).").arg(zoomStep));
    if (!(gridCellSize > 0.0))
        return fail(error, QStringLiteral("grid/cellSize must be positive (got %1).").arg(gridCellSize));
    if (gridMajorLineEvery < 1)
        return fail(error, QStringLiteral("grid/majorLineEvery must be at least 1 (got %1).").arg(gridMajorLineEvery));
    if (!(portHitThreshold > 0.0))
        return fail(error, QStringLiteral("interaction/portHitThreshold must be positive (got %1).").arg(portHitThreshold));
    return true;
}

EditorSettings EditorSettings::load(const QSettings& settings)
{
    const EditorSettings defaults;

    EditorSettings out;
    out.minZoom = settings.value(kMinZoomKey, defaults.minZoom).toDouble();
    out.maxZoom = settings.value(kMaxZoomKey, defaults.maxZoom).toDouble();
    out.zoomStep = settings.value(kZoomStepKey, defaults.zoomStep).toDouble();
    out.gridCellSize = settings.value(kGridCellSizeKey, defaults.gridCellSize).toDouble();
    out.gridMajorLineEvery = settings.value(kGridMajorLineEveryKey, defaults.gridMajorLineEvery).toInt();
    out.portHitThreshold = settings.value(kPortHitThresholdKey, defaults.portHitThreshold).toDouble();

    QString error;
    if (!out.isValid(&error)) {
        qCWarning(nodecanvaslog).noquote()
            << "Ignoring editor settings from" << settings.fileName() << ":" << error;
        return defaults;
    }
    return out;
}

EditorSettings EditorSettings::loadFromFile(const QString& iniPath)
{
    const QSettings settings(iniPath, QSettings::IniFormat);
    return load(settings);
}

void EditorSettings::save(QSettings& settings) const
{
    settings.setValue(kMinZoomKey, minZoom);
    settings.setValue(kMaxZoomKey, maxZoom);
    settings.setValue(kZoomStepKey, zoomStep);
    settings.setValue(kGridCellSizeKey, gridCellSize);
    settings.setValue(kGridMajorLineEveryKey, gridMajorLineEvery);
    settings.setValue(kPortHitThresholdKey, portHitThreshold);
    settings.sync();
}

} // namespace NodeCanvas
