// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "nodecanvas/NodeCanvasConstants.hpp"
#include "nodecanvas/NodeCanvasGlobal.hpp"

#include <QtCore/QString>

QT_BEGIN_NAMESPACE
class QSettings;
QT_END_NAMESPACE

namespace NodeCanvas {

// Editor preferences read from QSettings. Nothing about the graph itself is persisted.
struct NODECANVAS_EXPORT EditorSettings final {
    double minZoom = Constants::kMinZoom;
    double maxZoom = Constants::kMaxZoom;
    double zoomStep = Constants::kZoomStep;
    double gridCellSize = Constants::kGridCellSize;
    int gridMajorLineEvery = Constants::kGridMajorLineEvery;
    double portHitThreshold = Constants::kPortHitThreshold;

    bool isValid(QString* error = nullptr) const;

    // Falls back to the defaults (and logs a warning) when the stored values are invalid.
    static EditorSettings load(const QSettings& settings);
    static EditorSettings loadFromFile(const QString& iniPath);
    void save(QSettings& settings) const;
};

} // namespace NodeCanvas
