// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(NODECANVAS_BUILD_SHARED) && (NODECANVAS_BUILD_SHARED == 1)
#	if defined(NODECANVAS_LIBRARY)
#		define NODECANVAS_EXPORT Q_DECL_EXPORT
#	else
#		define NODECANVAS_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define NODECANVAS_EXPORT
#endif

NODECANVAS_EXPORT Q_DECLARE_LOGGING_CATEGORY(nodecanvaslog)
