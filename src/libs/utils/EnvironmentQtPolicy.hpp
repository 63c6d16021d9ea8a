// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Environment.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QSettings>

#include <memory>

namespace Utils {

// QSettings/INI backed persistence: <config>/<app>/global.ini and <workspace>/.sketchbridge/workspace.ini.
class UTILS_EXPORT QtEnvironmentPersistencePolicy final {
public:
	struct SettingsHandle final {
		std::unique_ptr<QSettings> settings;
	};

	EnvironmentPaths resolvePaths(const EnvironmentConfig& cfg) const;

	SettingsHandle openSettings(EnvironmentScope scope, const EnvironmentPaths& paths) const;
	QVariant settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const;
	void setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const;
	void removeSettingsKey(SettingsHandle& h, QStringView key) const;
	bool settingsContains(const SettingsHandle& h, QStringView key) const;
	void syncSettings(SettingsHandle& h) const;

	static QString settingsFilePath(EnvironmentScope scope, const EnvironmentPaths& paths);
};

using Environment = BasicEnvironment<QtEnvironmentPersistencePolicy>;

UTILS_EXPORT Environment makeEnvironment(const QString& applicationName,
										 const QString& workspaceRootDir = {});

} // namespace Utils
