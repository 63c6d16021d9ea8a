// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/CadBridgeSettings.hpp"
#include "cadbridge/CadSystem.hpp"
#include "cadbridge/api/ICadClient.hpp"

#include <QtCore/QPointer>
#include <QtCore/QThreadPool>
#include <QtCore/QVector>

#include <functional>
#include <memory>

namespace CadBridge {

struct ProbeJob final {
    CadSystem system = CadSystem::FreeCAD;
    Api::ICadClient* client = nullptr;
    bool believedConnected = false;
    quint64 generation = 0;
};

struct ProbeResult final {
    CadSystem system = CadSystem::FreeCAD;
    bool connected = false;
    CadStatus status;
    quint64 generation = 0;
    QString error;
};

struct ProbeOptions final {
    int timeoutMs = kDefaultProbeTimeoutMs;
    ConnectedProbePolicy connectedPolicy = ConnectedProbePolicy::TrustCached;
};

// One liveness check against one backend. Adapter exceptions become a disconnected result.
CADBRIDGE_EXPORT ProbeResult probeBackend(const ProbeJob& job, const ProbeOptions& options);

class CADBRIDGE_EXPORT ICadProbeStrategy
{
public:
    using ResultHandler = std::function<void(const ProbeResult&)>;

    virtual ~ICadProbeStrategy() = default;

    // Calls handler exactly once per job, always on the control thread.
    // The handler may run before dispatch() returns.
    virtual void dispatch(const QVector<ProbeJob>& jobs, const ProbeOptions& options, ResultHandler handler) = 0;
};

// Runs each probe on a private pool; results are posted back to the context object's thread.
class CADBRIDGE_EXPORT PooledProbeStrategy final : public ICadProbeStrategy
{
public:
    static constexpr int kWorkerCount = 4;

    explicit PooledProbeStrategy(QObject* context);
    ~PooledProbeStrategy() override;

    void dispatch(const QVector<ProbeJob>& jobs, const ProbeOptions& options, ResultHandler handler) override;

private:
    QPointer<QObject> m_context;
    QThreadPool m_pool;
};

// Runs every probe on the calling thread, one after another.
class CADBRIDGE_EXPORT InlineProbeStrategy final : public ICadProbeStrategy
{
public:
    void dispatch(const QVector<ProbeJob>& jobs, const ProbeOptions& options, ResultHandler handler) override;
};

CADBRIDGE_EXPORT std::unique_ptr<ICadProbeStrategy> makeProbeStrategy(ProbeStrategyKind kind, QObject* context);

} // namespace CadBridge
