// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/CadSystem.hpp"

#include <utils/Environment.hpp>
#include <utils/Result.hpp>

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>

#include <array>

namespace CadBridge {

enum class ProbeStrategyKind : unsigned char {
    Pooled,
    Inline
};

// How a probe treats a backend the manager already believes is connected.
enum class ConnectedProbePolicy : unsigned char {
    TrustCached,
    Revalidate
};

inline constexpr int kDefaultProbeIntervalMs = 5000;
inline constexpr int kDefaultProbeTimeoutMs = 1000;
inline constexpr int kDefaultConnectTimeoutMs = 5000;
inline constexpr int kMinimumIntervalMs = 50;

struct CadBridgeSettings final {
    int probeIntervalMs = kDefaultProbeIntervalMs;
    int probeTimeoutMs = kDefaultProbeTimeoutMs;
    int connectTimeoutMs = kDefaultConnectTimeoutMs;
    ProbeStrategyKind probeStrategy = ProbeStrategyKind::Pooled;
    ConnectedProbePolicy connectedProbePolicy = ConnectedProbePolicy::TrustCached;
    std::array<CadEndpoint, kCadSystemCount> endpoints{
        defaultCadEndpoint(CadSystem::FreeCAD),
        defaultCadEndpoint(CadSystem::Inventor),
        defaultCadEndpoint(CadSystem::SolidWorks),
        defaultCadEndpoint(CadSystem::Fusion)
    };

    const CadEndpoint& endpoint(CadSystem system) const { return endpoints[cadSystemIndex(system)]; }
    void setEndpoint(CadSystem system, CadEndpoint value) { endpoints[cadSystemIndex(system)] = std::move(value); }

    friend bool operator==(const CadBridgeSettings&, const CadBridgeSettings&) = default;
};

CADBRIDGE_EXPORT QString probeStrategyToString(ProbeStrategyKind kind);
CADBRIDGE_EXPORT bool probeStrategyFromString(const QString& text, ProbeStrategyKind& out);
CADBRIDGE_EXPORT QString connectedProbePolicyToString(ConnectedProbePolicy policy);
CADBRIDGE_EXPORT bool connectedProbePolicyFromString(const QString& text, ConnectedProbePolicy& out);

// Every settings key this library reads, e.g. "cadBridge/probeIntervalMs", "cadBridge/freecad/port".
CADBRIDGE_EXPORT QStringList cadBridgeSettingsKeys();

// Keys missing from values keep their defaults. Bad values keep their defaults and are reported;
// intervals and timeouts below kMinimumIntervalMs are raised to it.
CADBRIDGE_EXPORT Utils::Result cadBridgeSettingsFromValues(const QVariantMap& values, CadBridgeSettings& out);
CADBRIDGE_EXPORT QVariantMap cadBridgeSettingsToValues(const CadBridgeSettings& settings);

template <typename Policy>
Utils::Result loadCadBridgeSettings(const Utils::BasicEnvironment<Policy>& env, CadBridgeSettings& out)
{
    QVariantMap values;
    for (const QString& key : cadBridgeSettingsKeys()) {
        const QVariant value = env.effectiveSetting(key);
        if (value.isValid())
            values.insert(key, value);
    }
    return cadBridgeSettingsFromValues(values, out);
}

template <typename Policy>
void saveCadBridgeSettings(Utils::BasicEnvironment<Policy>& env,
                           const CadBridgeSettings& settings,
                           Utils::EnvironmentScope scope = Utils::EnvironmentScope::Global)
{
    const QVariantMap values = cadBridgeSettingsToValues(settings);
    for (auto it = values.cbegin(); it != values.cend(); ++it)
        env.setSetting(scope, it.key(), it.value());
}

} // namespace CadBridge
