// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(CADBRIDGE_BUILD_SHARED) && (CADBRIDGE_BUILD_SHARED == 1)
#	if defined(CADBRIDGE_LIBRARY)
#		define CADBRIDGE_EXPORT Q_DECL_EXPORT
#	else
#		define CADBRIDGE_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define CADBRIDGE_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(cadbridgelog)
Q_DECLARE_LOGGING_CATEGORY(transferlog)
