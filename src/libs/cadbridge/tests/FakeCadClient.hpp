// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/LazyCadClient.hpp"
#include "cadbridge/api/ICadClient.hpp"

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>

#include <atomic>
#include <memory>

namespace CadBridge::Testing {

// Thrown instead of CadClientError when a backend mimics an RPC layer with its own error types.
struct ForeignAdapterError final {
    int code = 0;
};

// Scriptable stand-in for one CAD application. Shared by every FakeCadClient built for it.
struct FakeCadBackend final {
    std::atomic<bool> reachable{true};
    std::atomic<bool> sessionOpen{false};
    std::atomic<int> connectDelayMs{0};

    std::atomic<bool> throwOnConnect{false};
    std::atomic<bool> throwOnStatus{false};
    std::atomic<bool> throwOnDisconnect{false};
    std::atomic<bool> throwOnList{false};
    std::atomic<bool> throwOnExport{false};
    std::atomic<bool> throwOnImport{false};
    std::atomic<bool> throwOnOpen{false};
    std::atomic<bool> throwForeignErrors{false};

    std::atomic<int> factoryCalls{0};
    std::atomic<int> connectCalls{0};
    std::atomic<int> isConnectedCalls{0};
    std::atomic<int> statusCalls{0};
    std::atomic<int> disconnectCalls{0};
    std::atomic<int> listCalls{0};
    std::atomic<int> exportCalls{0};
    std::atomic<int> importCalls{0};
    std::atomic<int> openCalls{0};

    mutable QMutex mutex;
    CadStatus status;
    QVector<SketchInfo> sketches;
    QVector<PlaneInfo> planes;
    QHash<QString, Sketch::SketchDocument> documents;
    QStringList failingExports;
    QVector<Sketch::SketchDocument> imported;
    QStringList exportedNames;
    QStringList openedNames;
    CadEndpoint lastEndpoint;

    void setStatus(CadStatus value)
    {
        QMutexLocker locker(&mutex);
        status = std::move(value);
    }

    void addSketch(const QString& name, Sketch::SketchDocument doc)
    {
        QMutexLocker locker(&mutex);
        sketches.push_back(SketchInfo{name, name, static_cast<int>(doc.primitiveCount()),
                                      static_cast<int>(doc.constraints().size())});
        documents.insert(name, std::move(doc));
    }

    int totalAdapterCalls() const
    {
        return connectCalls + isConnectedCalls + statusCalls + disconnectCalls
             + listCalls + exportCalls + importCalls + openCalls;
    }
};

class FakeCadClient final : public Api::ICadClient
{
public:
    explicit FakeCadClient(std::shared_ptr<FakeCadBackend> backend)
        : m_backend(std::move(backend))
    {}

    [[noreturn]] void fail(const QString& message) const
    {
        if (m_backend->throwForeignErrors)
            throw ForeignAdapterError{42};
        throw CadClientError(message);
    }

    bool connect(int timeoutMs) override
    {
        Q_UNUSED(timeoutMs);
        ++m_backend->connectCalls;
        if (const int delay = m_backend->connectDelayMs; delay > 0)
            QThread::msleep(static_cast<unsigned long>(delay));
        if (m_backend->throwOnConnect)
            fail(QStringLiteral("connection refused"));
        m_backend->sessionOpen = m_backend->reachable.load();
        return m_backend->sessionOpen;
    }

    void disconnect() override
    {
        ++m_backend->disconnectCalls;
        if (m_backend->throwOnDisconnect)
            fail(QStringLiteral("socket already closed"));
        m_backend->sessionOpen = false;
    }

    bool isConnected() override
    {
        ++m_backend->isConnectedCalls;
        return m_backend->sessionOpen && m_backend->reachable;
    }

    CadStatus status() override
    {
        ++m_backend->statusCalls;
        if (m_backend->throwOnStatus || !m_backend->reachable)
            fail(QStringLiteral("status unavailable"));
        QMutexLocker locker(&m_backend->mutex);
        return m_backend->status;
    }

    QVector<SketchInfo> listSketches() override
    {
        ++m_backend->listCalls;
        if (m_backend->throwOnList)
            fail(QStringLiteral("list failed"));
        QMutexLocker locker(&m_backend->mutex);
        return m_backend->sketches;
    }

    QVector<PlaneInfo> listPlanes() override
    {
        ++m_backend->listCalls;
        if (m_backend->throwOnList)
            fail(QStringLiteral("list failed"));
        QMutexLocker locker(&m_backend->mutex);
        return m_backend->planes;
    }

    Sketch::SketchDocument exportSketch(const QString& name) override
    {
        ++m_backend->exportCalls;
        QMutexLocker locker(&m_backend->mutex);
        m_backend->exportedNames.push_back(name);
        if (m_backend->throwOnExport || m_backend->failingExports.contains(name)
            || !m_backend->documents.contains(name)) {
            fail(QStringLiteral("cannot export %1").arg(name));
        }
        return m_backend->documents.value(name);
    }

    QString importSketch(const Sketch::SketchDocument& doc,
                         const std::optional<QString>& name,
                         const std::optional<QString>& plane) override
    {
        Q_UNUSED(plane);
        ++m_backend->importCalls;
        if (m_backend->throwOnImport)
            fail(QStringLiteral("import rejected"));
        QMutexLocker locker(&m_backend->mutex);
        m_backend->imported.push_back(doc);
        return name.value_or(doc.name().isEmpty() ? QStringLiteral("Sketch") : doc.name());
    }

    bool openSketch(const QString& name) override
    {
        ++m_backend->openCalls;
        if (m_backend->throwOnOpen)
            fail(QStringLiteral("no UI"));
        QMutexLocker locker(&m_backend->mutex);
        m_backend->openedNames.push_back(name);
        return true;
    }

private:
    std::shared_ptr<FakeCadBackend> m_backend;
};

inline CadClientFactory fakeFactory(const std::shared_ptr<FakeCadBackend>& backend)
{
    return [backend](const CadEndpoint& endpoint) -> std::unique_ptr<Api::ICadClient> {
        ++backend->factoryCalls;
        {
            QMutexLocker locker(&backend->mutex);
            backend->lastEndpoint = endpoint;
        }
        return std::make_unique<FakeCadClient>(backend);
    };
}

} // namespace CadBridge::Testing
