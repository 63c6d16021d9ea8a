// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/EnvironmentQtPolicy.hpp"

#include <QtCore/QDir>
#include <QtCore/QStandardPaths>

Q_LOGGING_CATEGORY(utilslog, "sketchbridge.utils")

namespace Utils {

EnvironmentPaths QtEnvironmentPersistencePolicy::resolvePaths(const EnvironmentConfig& cfg) const
{
    EnvironmentPaths out;

    const QString appCfg =
        !cfg.globalConfigRootOverride.isEmpty()
            ? cfg.globalConfigRootOverride
            : QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);

    const QString globalBase = QDir(appCfg).filePath(cfg.applicationName.isEmpty()
                                                        ? QStringLiteral("SketchBridge")
                                                        : cfg.applicationName);
    out.globalConfigDir = QDir(globalBase).absolutePath();

    if (!cfg.workspaceRootDir.isEmpty()) {
        out.workspaceConfigDir = QDir(cfg.workspaceRootDir).filePath(QStringLiteral(".sketchbridge"));
        out.workspaceConfigDir = QDir(out.workspaceConfigDir).absolutePath();
    }

    qCDebug(utilslog).noquote() << "Environment paths"
                                << "global=" << out.globalConfigDir
                                << "workspace=" << (out.workspaceConfigDir.isEmpty()
                                                        ? QStringLiteral("<none>")
                                                        : out.workspaceConfigDir);
    return out;
}

QString QtEnvironmentPersistencePolicy::settingsFilePath(EnvironmentScope scope, const EnvironmentPaths& paths)
{
    switch (scope) {
    case EnvironmentScope::Global:
        return QDir(paths.globalConfigDir).filePath(QStringLiteral("global.ini"));
    case EnvironmentScope::Workspace:
        return QDir(paths.workspaceConfigDir).filePath(QStringLiteral("workspace.ini"));
    }
    return QDir(paths.globalConfigDir).filePath(QStringLiteral("global.ini"));
}

QtEnvironmentPersistencePolicy::SettingsHandle
QtEnvironmentPersistencePolicy::openSettings(EnvironmentScope scope, const EnvironmentPaths& paths) const
{
    auto h = SettingsHandle{};
    const QString path = settingsFilePath(scope, paths);
    h.settings = std::make_unique<QSettings>(path, QSettings::IniFormat);
    h.settings->setFallbacksEnabled(false);
    return h;
}

QVariant QtEnvironmentPersistencePolicy::settingsValue(const SettingsHandle& h, QStringView key, const QVariant& def) const
{
    return h.settings ? h.settings->value(key.toString(), def) : def;
}

void QtEnvironmentPersistencePolicy::setSettingsValue(SettingsHandle& h, QStringView key, const QVariant& value) const
{
    if (!h.settings) return;
    h.settings->setValue(key.toString(), value);
}

void QtEnvironmentPersistencePolicy::removeSettingsKey(SettingsHandle& h, QStringView key) const
{
    if (!h.settings) return;
    h.settings->remove(key.toString());
}

bool QtEnvironmentPersistencePolicy::settingsContains(const SettingsHandle& h, QStringView key) const
{
    return h.settings ? h.settings->contains(key.toString()) : false;
}

void QtEnvironmentPersistencePolicy::syncSettings(SettingsHandle& h) const
{
    if (!h.settings) return;
    h.settings->sync();
    if (h.settings->status() != QSettings::NoError) {
        qCWarning(utilslog).noquote() << "Failed to write settings file" << h.settings->fileName();
    }
}

Environment makeEnvironment(const QString& applicationName, const QString& workspaceRootDir)
{
    EnvironmentConfig cfg;
    cfg.organizationName = QStringLiteral("SketchBridge");
    cfg.applicationName = applicationName;
    cfg.workspaceRootDir = workspaceRootDir;
    return Environment(cfg);
}

} // namespace Utils
