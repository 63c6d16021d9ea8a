// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QString>
#include <QtCore/QStringView>
#include <QtCore/QVariant>

#include <array>
#include <utility>

namespace Utils {

// Workspace settings override Global ones when read through effectiveSetting().
enum class EnvironmentScope : unsigned char {
    Global,
    Workspace
};

struct EnvironmentConfig final {
    QString organizationName;
    QString applicationName;

    QString workspaceRootDir;
    QString globalConfigRootOverride;
};

struct EnvironmentPaths final {
    QString globalConfigDir;    // resolved absolute
    QString workspaceConfigDir; // resolved absolute or empty
};

template <typename PersistencePolicy>
class BasicEnvironment final {
public:
    using Policy = PersistencePolicy;
    using SettingsHandle = typename Policy::SettingsHandle;

    explicit BasicEnvironment(EnvironmentConfig config, Policy policy = Policy{})
        : m_config(std::move(config))
        , m_policy(std::move(policy))
        , m_paths(m_policy.resolvePaths(m_config))
    {}

    const EnvironmentConfig& config() const noexcept { return m_config; }
    const EnvironmentPaths& paths()  const noexcept { return m_paths; }
    const Policy& policy() const noexcept { return m_policy; }

    bool hasWorkspace() const noexcept { return !m_paths.workspaceConfigDir.isEmpty(); }

    QVariant setting(EnvironmentScope scope, QStringView key, const QVariant& def = {}) const
    {
        if (!scopeAvailable(scope))
            return def;
        auto h = m_policy.openSettings(scope, m_paths);
        return m_policy.settingsValue(h, key, def);
    }

    // Most specific scope first: a key present in the workspace file shadows the global one.
    QVariant effectiveSetting(QStringView key, const QVariant& def = {}) const
    {
        static constexpr std::array<EnvironmentScope, 2> kLookupOrder{
            EnvironmentScope::Workspace,
            EnvironmentScope::Global
        };

        for (const EnvironmentScope scope : kLookupOrder) {
            if (hasSetting(scope, key))
                return setting(scope, key, def);
        }
        return def;
    }

    void setSetting(EnvironmentScope scope, QStringView key, const QVariant& value)
    {
        if (!scopeAvailable(scope))
            return;
        auto h = m_policy.openSettings(scope, m_paths);
        m_policy.setSettingsValue(h, key, value);
        m_policy.syncSettings(h);
    }

    void removeSetting(EnvironmentScope scope, QStringView key)
    {
        if (!scopeAvailable(scope))
            return;
        auto h = m_policy.openSettings(scope, m_paths);
        m_policy.removeSettingsKey(h, key);
        m_policy.syncSettings(h);
    }

    bool hasSetting(EnvironmentScope scope, QStringView key) const
    {
        if (!scopeAvailable(scope))
            return false;
        auto h = m_policy.openSettings(scope, m_paths);
        return m_policy.settingsContains(h, key);
    }

private:
    bool scopeAvailable(EnvironmentScope scope) const noexcept
    {
        return scope != EnvironmentScope::Workspace || hasWorkspace();
    }

    EnvironmentConfig m_config;
    Policy m_policy;
    EnvironmentPaths m_paths;
};

} // namespace Utils
