// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(SKETCH_BUILD_SHARED) && (SKETCH_BUILD_SHARED == 1)
#	if defined(SKETCH_LIBRARY)
#		define SKETCH_EXPORT Q_DECL_EXPORT
#	else
#		define SKETCH_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define SKETCH_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(sketchlog)
