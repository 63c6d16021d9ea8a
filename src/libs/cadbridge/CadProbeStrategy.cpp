// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/CadProbeStrategy.hpp"

#include <utils/async/AsyncTask.hpp>

#include <exception>

namespace CadBridge {

namespace {

ProbeResult failedProbe(const ProbeJob& job, QString error)
{
    ProbeResult result;
    result.system = job.system;
    result.generation = job.generation;
    result.error = std::move(error);
    return result;
}

} // namespace

ProbeResult probeBackend(const ProbeJob& job, const ProbeOptions& options)
{
    if (!job.client)
        return failedProbe(job, QStringLiteral("No client"));

    ProbeResult result;
    result.system = job.system;
    result.generation = job.generation;

    try {
        bool connected = true;
        if (!job.believedConnected)
            connected = job.client->connect(options.timeoutMs);
        else if (options.connectedPolicy == ConnectedProbePolicy::Revalidate && !job.client->isConnected())
            connected = job.client->connect(options.timeoutMs);

        if (connected) {
            result.status = job.client->status();
            result.connected = true;
        }
    } catch (const std::exception& e) {
        result.connected = false;
        result.status.clear();
        result.error = QString::fromUtf8(e.what());
    } catch (...) {
        result.connected = false;
        result.status.clear();
        result.error = QStringLiteral("Unknown adapter error");
    }

    return result;
}

PooledProbeStrategy::PooledProbeStrategy(QObject* context)
    : m_context(context)
{
    m_pool.setMaxThreadCount(kWorkerCount);
}

PooledProbeStrategy::~PooledProbeStrategy()
{
    m_pool.waitForDone();
}

void PooledProbeStrategy::dispatch(const QVector<ProbeJob>& jobs, const ProbeOptions& options, ResultHandler handler)
{
    for (const ProbeJob& job : jobs) {
        const bool queued = Utils::Async::run<ProbeResult>(
            m_context.data(),
            [job, options]() { return probeBackend(job, options); },
            [job, handler](Utils::Async::TaskOutcome<ProbeResult> outcome) {
                if (outcome.ok())
                    handler(*outcome.value);
                else
                    handler(failedProbe(job, outcome.error));
            },
            &m_pool);

        if (!queued)
            handler(failedProbe(job, QStringLiteral("Probe could not be queued")));
    }
}

void InlineProbeStrategy::dispatch(const QVector<ProbeJob>& jobs, const ProbeOptions& options, ResultHandler handler)
{
    for (const ProbeJob& job : jobs)
        handler(probeBackend(job, options));
}

std::unique_ptr<ICadProbeStrategy> makeProbeStrategy(ProbeStrategyKind kind, QObject* context)
{
    switch (kind) {
        case ProbeStrategyKind::Inline:
            return std::make_unique<InlineProbeStrategy>();
        case ProbeStrategyKind::Pooled:
            break;
    }
    return std::make_unique<PooledProbeStrategy>(context);
}

} // namespace CadBridge
