// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/CadBridgeSettings.hpp"
#include "cadbridge/CadProbeStrategy.hpp"
#include "cadbridge/CadSystem.hpp"
#include "cadbridge/LazyCadClient.hpp"
#include "cadbridge/api/CadBridgeTypes.hpp"
#include "cadbridge/internal/CadConnectionState.hpp"

#include <sketch/SketchDocument.hpp>

#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <array>
#include <memory>
#include <optional>

namespace CadBridge {

CADBRIDGE_EXPORT void registerCadBridgeMetaTypes();

/// Keeps one session per CAD backend and tracks which backends are reachable.
///
/// A periodic probe cycle reconnects unreachable backends and refreshes the status of
/// reachable ones. Probes never run concurrently with each other: a tick that arrives while
/// a cycle is still collecting results is skipped. Connection records are only written on the
/// thread that owns the manager.
///
/// Notifications: probes emit connectionChanged only when a backend's reachability flips;
/// connect() and disconnect() always emit it. statusUpdated is emitted whenever a probe or a
/// manual connect yields a non-empty status for a connected backend.
///
/// Adapter failures never leave the manager. Operations against a backend that is not
/// connected, or whose adapter throws, return an empty or absent result.
class CADBRIDGE_EXPORT CadConnectionManager final : public QObject
{
    Q_OBJECT

public:
    explicit CadConnectionManager(CadClientFactories factories,
                                  CadBridgeSettings settings = {},
                                  QObject* parent = nullptr);
    ~CadConnectionManager() override;

    const CadBridgeSettings& settings() const noexcept { return m_settings; }

    void start();
    void start(int intervalMs);
    void stop();

    bool connect(CadSystem system);
    bool connect(CadSystem system, int timeoutMs);
    void disconnect(CadSystem system);

    bool isConnected(CadSystem system) const;
    CadStatus status(CadSystem system) const;

    QVector<SketchInfo> listSketches(CadSystem system);
    QVector<PlaneInfo> listPlanes(CadSystem system);
    std::optional<Sketch::SketchDocument> exportSketch(CadSystem system, const QString& name);
    std::optional<QString> importSketch(CadSystem system,
                                        const Sketch::SketchDocument& doc,
                                        const std::optional<QString>& name = std::nullopt,
                                        const std::optional<QString>& plane = std::nullopt);

    void probeNow();
    bool isProbeInFlight() const noexcept { return m_probeInFlight; }
    bool isMonitoring() const { return m_timer.isActive(); }
    int probeIntervalMs() const noexcept { return m_probeIntervalMs; }

signals:
    void connectionChanged(CadBridge::CadSystem system, bool connected);
    void statusUpdated(CadBridge::CadSystem system, const CadBridge::CadStatus& status);

private:
    LazyCadClient& client(CadSystem system);
    Internal::CadConnectionState& state(CadSystem system);
    const Internal::CadConnectionState& state(CadSystem system) const;

    void runProbeCycle();
    void reconcileProbe(const ProbeResult& result);
    void setConnected(CadSystem system, CadStatus status, bool alwaysNotify);
    void setDisconnected(CadSystem system, bool alwaysNotify);

    CadBridgeSettings m_settings;
    std::array<std::unique_ptr<LazyCadClient>, kCadSystemCount> m_clients;
    std::array<Internal::CadConnectionState, kCadSystemCount> m_states;
    // Declared after m_clients: destroying it waits for workers that still use the clients.
    std::unique_ptr<ICadProbeStrategy> m_strategy;

    QTimer m_timer;
    int m_probeIntervalMs = kDefaultProbeIntervalMs;
    bool m_probeInFlight = false;
    int m_pendingProbes = 0;
};

} // namespace CadBridge
