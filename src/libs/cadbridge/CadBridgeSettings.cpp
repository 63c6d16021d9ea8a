// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/CadBridgeSettings.hpp"

#include <algorithm>
#include <limits>

namespace CadBridge {

namespace {

using namespace Qt::StringLiterals;

const QString kProbeIntervalKey = u"cadBridge/probeIntervalMs"_s;
const QString kProbeTimeoutKey = u"cadBridge/probeTimeoutMs"_s;
const QString kConnectTimeoutKey = u"cadBridge/connectTimeoutMs"_s;
const QString kProbeStrategyKey = u"cadBridge/probeStrategy"_s;
const QString kConnectedProbePolicyKey = u"cadBridge/connectedProbePolicy"_s;

QString hostKey(CadSystem system)
{
    return u"cadBridge/%1/host"_s.arg(cadSystemKey(system));
}

QString portKey(CadSystem system)
{
    return u"cadBridge/%1/port"_s.arg(cadSystemKey(system));
}

void readInterval(const QVariantMap& values, const QString& key, int& out, QStringList& errors)
{
    const auto it = values.constFind(key);
    if (it == values.cend())
        return;

    bool ok = false;
    const int value = it.value().toInt(&ok);
    if (!ok) {
        errors.push_back(QStringLiteral("%1 must be an integer number of milliseconds: '%2'")
                             .arg(key, it.value().toString()));
        return;
    }
    out = std::max(value, kMinimumIntervalMs);
}

} // namespace

QString probeStrategyToString(ProbeStrategyKind kind)
{
    switch (kind) {
        case ProbeStrategyKind::Pooled: return u"pooled"_s;
        case ProbeStrategyKind::Inline: return u"inline"_s;
    }
    return u"pooled"_s;
}

bool probeStrategyFromString(const QString& text, ProbeStrategyKind& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"pooled"_s) {
        out = ProbeStrategyKind::Pooled;
        return true;
    }
    if (key == u"inline"_s) {
        out = ProbeStrategyKind::Inline;
        return true;
    }
    return false;
}

QString connectedProbePolicyToString(ConnectedProbePolicy policy)
{
    switch (policy) {
        case ConnectedProbePolicy::TrustCached: return u"trustCached"_s;
        case ConnectedProbePolicy::Revalidate: return u"revalidate"_s;
    }
    return u"trustCached"_s;
}

bool connectedProbePolicyFromString(const QString& text, ConnectedProbePolicy& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"trustcached"_s) {
        out = ConnectedProbePolicy::TrustCached;
        return true;
    }
    if (key == u"revalidate"_s) {
        out = ConnectedProbePolicy::Revalidate;
        return true;
    }
    return false;
}

QStringList cadBridgeSettingsKeys()
{
    QStringList keys{kProbeIntervalKey, kProbeTimeoutKey, kConnectTimeoutKey,
                     kProbeStrategyKey, kConnectedProbePolicyKey};
    for (const CadSystem system : allCadSystems()) {
        keys.push_back(hostKey(system));
        keys.push_back(portKey(system));
    }
    return keys;
}

Utils::Result cadBridgeSettingsFromValues(const QVariantMap& values, CadBridgeSettings& out)
{
    out = CadBridgeSettings{};
    QStringList errors;

    readInterval(values, kProbeIntervalKey, out.probeIntervalMs, errors);
    readInterval(values, kProbeTimeoutKey, out.probeTimeoutMs, errors);
    readInterval(values, kConnectTimeoutKey, out.connectTimeoutMs, errors);

    if (values.contains(kProbeStrategyKey)) {
        const QString text = values.value(kProbeStrategyKey).toString();
        if (!probeStrategyFromString(text, out.probeStrategy))
            errors.push_back(QStringLiteral("Unknown probe strategy: '%1'").arg(text));
    }

    if (values.contains(kConnectedProbePolicyKey)) {
        const QString text = values.value(kConnectedProbePolicyKey).toString();
        if (!connectedProbePolicyFromString(text, out.connectedProbePolicy))
            errors.push_back(QStringLiteral("Unknown connected probe policy: '%1'").arg(text));
    }

    for (const CadSystem system : allCadSystems()) {
        CadEndpoint endpoint = out.endpoint(system);

        const QString host = values.value(hostKey(system)).toString().trimmed();
        if (!host.isEmpty())
            endpoint.host = host;

        const auto portIt = values.constFind(portKey(system));
        if (portIt != values.cend()) {
            bool ok = false;
            const int port = portIt.value().toInt(&ok);
            if (!ok || port <= 0 || port > std::numeric_limits<quint16>::max())
                errors.push_back(QStringLiteral("%1 is not a valid port: '%2'")
                                     .arg(portKey(system), portIt.value().toString()));
            else
                endpoint.port = static_cast<quint16>(port);
        }

        out.setEndpoint(system, std::move(endpoint));
    }

    if (!errors.isEmpty())
        return Utils::Result::failure(errors);
    return Utils::Result::success();
}

QVariantMap cadBridgeSettingsToValues(const CadBridgeSettings& settings)
{
    QVariantMap values;
    values.insert(kProbeIntervalKey, settings.probeIntervalMs);
    values.insert(kProbeTimeoutKey, settings.probeTimeoutMs);
    values.insert(kConnectTimeoutKey, settings.connectTimeoutMs);
    values.insert(kProbeStrategyKey, probeStrategyToString(settings.probeStrategy));
    values.insert(kConnectedProbePolicyKey, connectedProbePolicyToString(settings.connectedProbePolicy));
    for (const CadSystem system : allCadSystems()) {
        const CadEndpoint& endpoint = settings.endpoint(system);
        values.insert(hostKey(system), endpoint.host);
        values.insert(portKey(system), static_cast<int>(endpoint.port));
    }
    return values;
}

} // namespace CadBridge
