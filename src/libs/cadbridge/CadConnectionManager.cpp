// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/CadConnectionManager.hpp"

#include <QtCore/QMetaType>

#include <algorithm>
#include <exception>

Q_LOGGING_CATEGORY(cadbridgelog, "sketchbridge.cadbridge")

namespace CadBridge {

void registerCadBridgeMetaTypes()
{
    qRegisterMetaType<CadBridge::CadSystem>("CadBridge::CadSystem");
    qRegisterMetaType<CadBridge::CadStatus>("CadBridge::CadStatus");
    qRegisterMetaType<CadBridge::SketchInfo>("CadBridge::SketchInfo");
    qRegisterMetaType<CadBridge::PlaneInfo>("CadBridge::PlaneInfo");
    qRegisterMetaType<Sketch::SketchDocument>("Sketch::SketchDocument");
}

CadConnectionManager::CadConnectionManager(CadClientFactories factories,
                                           CadBridgeSettings settings,
                                           QObject* parent)
    : QObject(parent)
    , m_settings(std::move(settings))
    , m_probeIntervalMs(std::max(m_settings.probeIntervalMs, kMinimumIntervalMs))
{
    registerCadBridgeMetaTypes();

    for (const CadSystem system : allCadSystems()) {
        m_clients[cadSystemIndex(system)] = std::make_unique<LazyCadClient>(
            system, m_settings.endpoint(system), factories.factory(system));
    }

    m_strategy = makeProbeStrategy(m_settings.probeStrategy, this);

    QObject::connect(&m_timer, &QTimer::timeout, this, &CadConnectionManager::runProbeCycle);

    qCDebug(cadbridgelog).noquote() << "Connection manager ready, strategy"
                                    << probeStrategyToString(m_settings.probeStrategy)
                                    << "connected policy"
                                    << connectedProbePolicyToString(m_settings.connectedProbePolicy);
}

CadConnectionManager::~CadConnectionManager()
{
    m_timer.stop();
    m_strategy.reset();
}

LazyCadClient& CadConnectionManager::client(CadSystem system)
{
    return *m_clients[cadSystemIndex(system)];
}

Internal::CadConnectionState& CadConnectionManager::state(CadSystem system)
{
    return m_states[cadSystemIndex(system)];
}

const Internal::CadConnectionState& CadConnectionManager::state(CadSystem system) const
{
    return m_states[cadSystemIndex(system)];
}

void CadConnectionManager::start()
{
    start(m_settings.probeIntervalMs);
}

void CadConnectionManager::start(int intervalMs)
{
    m_probeIntervalMs = std::max(intervalMs, kMinimumIntervalMs);
    qCInfo(cadbridgelog) << "Monitoring CAD backends every" << m_probeIntervalMs << "ms";

    runProbeCycle();
    m_timer.start(m_probeIntervalMs);
}

void CadConnectionManager::stop()
{
    if (m_timer.isActive())
        qCInfo(cadbridgelog) << "Stopped monitoring CAD backends";
    m_timer.stop();
}

void CadConnectionManager::probeNow()
{
    runProbeCycle();
}

void CadConnectionManager::runProbeCycle()
{
    if (m_probeInFlight) {
        qCDebug(cadbridgelog) << "Probe cycle still collecting, skipping tick";
        return;
    }

    QVector<ProbeJob> jobs;
    jobs.reserve(static_cast<qsizetype>(kCadSystemCount));
    for (const CadSystem system : allCadSystems()) {
        const Internal::CadConnectionState& record = state(system);
        jobs.push_back(ProbeJob{system, &client(system), record.isConnected(), record.generation()});
    }

    m_probeInFlight = true;
    m_pendingProbes = static_cast<int>(jobs.size());

    const ProbeOptions options{m_settings.probeTimeoutMs, m_settings.connectedProbePolicy};
    m_strategy->dispatch(jobs, options, [this](const ProbeResult& result) { reconcileProbe(result); });
}

void CadConnectionManager::reconcileProbe(const ProbeResult& result)
{
    Internal::CadConnectionState& record = state(result.system);

    if (result.generation != record.generation()) {
        qCDebug(cadbridgelog).noquote() << "Discarding stale probe for" << cadSystemDisplayName(result.system);
    } else if (result.connected) {
        setConnected(result.system, result.status, false);
    } else {
        if (!result.error.isEmpty()) {
            qCDebug(cadbridgelog).noquote() << "Probe of" << cadSystemDisplayName(result.system)
                                            << "failed:" << result.error;
        }
        setDisconnected(result.system, false);
    }

    if (--m_pendingProbes <= 0) {
        m_pendingProbes = 0;
        m_probeInFlight = false;
    }
}

void CadConnectionManager::setConnected(CadSystem system, CadStatus status, bool alwaysNotify)
{
    Internal::CadConnectionState& record = state(system);
    const bool changed = record.markConnected(std::move(status));

    if (changed)
        qCInfo(cadbridgelog).noquote() << cadSystemDisplayName(system) << "connected";

    if (!record.status().isEmpty())
        emit statusUpdated(system, record.status());

    if (changed || alwaysNotify)
        emit connectionChanged(system, true);
}

void CadConnectionManager::setDisconnected(CadSystem system, bool alwaysNotify)
{
    const bool changed = state(system).markDisconnected();

    if (changed)
        qCInfo(cadbridgelog).noquote() << cadSystemDisplayName(system) << "disconnected";

    if (changed || alwaysNotify)
        emit connectionChanged(system, false);
}

bool CadConnectionManager::connect(CadSystem system)
{
    return connect(system, m_settings.connectTimeoutMs);
}

bool CadConnectionManager::connect(CadSystem system, int timeoutMs)
{
    state(system).bumpGeneration();

    bool connected = false;
    CadStatus status;
    try {
        connected = client(system).connect(timeoutMs);
        if (connected)
            status = client(system).status();
    } catch (const std::exception& e) {
        qCDebug(cadbridgelog).noquote() << "Connecting to" << cadSystemDisplayName(system)
                                        << "failed:" << e.what();
        connected = false;
    } catch (...) {
        qCDebug(cadbridgelog).noquote() << "Connecting to" << cadSystemDisplayName(system)
                                        << "failed with an unknown error";
        connected = false;
    }

    if (connected)
        setConnected(system, std::move(status), true);
    else
        setDisconnected(system, true);

    return connected;
}

void CadConnectionManager::disconnect(CadSystem system)
{
    state(system).bumpGeneration();

    try {
        client(system).disconnect();
    } catch (const std::exception& e) {
        qCWarning(cadbridgelog).noquote() << "Disconnecting from" << cadSystemDisplayName(system)
                                          << "raised:" << e.what();
    } catch (...) {
        qCWarning(cadbridgelog).noquote() << "Disconnecting from" << cadSystemDisplayName(system)
                                          << "raised an unknown error";
    }

    setDisconnected(system, true);
}

bool CadConnectionManager::isConnected(CadSystem system) const
{
    return state(system).isConnected();
}

CadStatus CadConnectionManager::status(CadSystem system) const
{
    return state(system).status();
}

QVector<SketchInfo> CadConnectionManager::listSketches(CadSystem system)
{
    if (!isConnected(system))
        return {};

    try {
        return client(system).listSketches();
    } catch (const std::exception& e) {
        qCWarning(cadbridgelog).noquote() << "Listing sketches in" << cadSystemDisplayName(system)
                                          << "failed:" << e.what();
    } catch (...) {
        qCWarning(cadbridgelog).noquote() << "Listing sketches in" << cadSystemDisplayName(system)
                                          << "failed with an unknown error";
    }
    return {};
}

QVector<PlaneInfo> CadConnectionManager::listPlanes(CadSystem system)
{
    if (!isConnected(system))
        return {};

    try {
        return client(system).listPlanes();
    } catch (const std::exception& e) {
        qCWarning(cadbridgelog).noquote() << "Listing planes in" << cadSystemDisplayName(system)
                                          << "failed:" << e.what();
    } catch (...) {
        qCWarning(cadbridgelog).noquote() << "Listing planes in" << cadSystemDisplayName(system)
                                          << "failed with an unknown error";
    }
    return {};
}

std::optional<Sketch::SketchDocument> CadConnectionManager::exportSketch(CadSystem system, const QString& name)
{
    if (!isConnected(system))
        return std::nullopt;

    try {
        return client(system).exportSketch(name);
    } catch (const std::exception& e) {
        qCWarning(cadbridgelog).noquote() << "Exporting" << name << "from" << cadSystemDisplayName(system)
                                          << "failed:" << e.what();
    } catch (...) {
        qCWarning(cadbridgelog).noquote() << "Exporting" << name << "from" << cadSystemDisplayName(system)
                                          << "failed with an unknown error";
    }
    return std::nullopt;
}

std::optional<QString> CadConnectionManager::importSketch(CadSystem system,
                                                          const Sketch::SketchDocument& doc,
                                                          const std::optional<QString>& name,
                                                          const std::optional<QString>& plane)
{
    if (!isConnected(system))
        return std::nullopt;

    QString createdName;
    try {
        createdName = client(system).importSketch(doc, name, plane);
    } catch (const std::exception& e) {
        qCWarning(cadbridgelog).noquote() << "Importing" << doc.name() << "into" << cadSystemDisplayName(system)
                                          << "failed:" << e.what();
        return std::nullopt;
    } catch (...) {
        qCWarning(cadbridgelog).noquote() << "Importing" << doc.name() << "into" << cadSystemDisplayName(system)
                                          << "failed with an unknown error";
        return std::nullopt;
    }

    try {
        if (!client(system).openSketch(createdName)) {
            qCWarning(cadbridgelog).noquote() << cadSystemDisplayName(system) << "did not open" << createdName;
        }
    } catch (const std::exception& e) {
        qCWarning(cadbridgelog).noquote() << "Opening" << createdName << "in" << cadSystemDisplayName(system)
                                          << "failed:" << e.what();
    } catch (...) {
        qCWarning(cadbridgelog).noquote() << "Opening" << createdName << "in" << cadSystemDisplayName(system)
                                          << "failed with an unknown error";
    }

    return createdName;
}

} // namespace CadBridge
