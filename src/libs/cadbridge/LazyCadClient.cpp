// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/LazyCadClient.hpp"

#include <QtCore/QMutexLocker>

namespace CadBridge {

void CadClientFactories::registerFactory(CadSystem system, CadClientFactory factory)
{
    m_factories[cadSystemIndex(system)] = std::move(factory);
}

bool CadClientFactories::hasFactory(CadSystem system) const
{
    return static_cast<bool>(m_factories[cadSystemIndex(system)]);
}

CadClientFactory CadClientFactories::factory(CadSystem system) const
{
    return m_factories[cadSystemIndex(system)];
}

LazyCadClient::LazyCadClient(CadSystem system, CadEndpoint endpoint, CadClientFactory factory)
    : m_system(system)
    , m_endpoint(std::move(endpoint))
    , m_factory(std::move(factory))
{
}

LazyCadClient::~LazyCadClient() = default;

bool LazyCadClient::isConstructed() const
{
    QMutexLocker locker(&m_mutex);
    return m_client != nullptr;
}

Api::ICadClient& LazyCadClient::adapter()
{
    if (m_client)
        return *m_client;

    if (!m_factory) {
        throw CadClientError(QStringLiteral("No adapter is available for %1")
                                 .arg(cadSystemDisplayName(m_system)));
    }

    std::unique_ptr<Api::ICadClient> client = m_factory(m_endpoint);
    if (!client) {
        throw CadClientError(QStringLiteral("Adapter factory for %1 returned no client")
                                 .arg(cadSystemDisplayName(m_system)));
    }

    qCDebug(cadbridgelog).noquote() << "Created adapter for" << cadSystemDisplayName(m_system)
                                    << "at" << m_endpoint.host << m_endpoint.port;
    m_client = std::move(client);
    return *m_client;
}

bool LazyCadClient::connect(int timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    return adapter().connect(timeoutMs);
}

void LazyCadClient::disconnect()
{
    QMutexLocker locker(&m_mutex);
    if (m_client)
        m_client->disconnect();
}

bool LazyCadClient::isConnected()
{
    QMutexLocker locker(&m_mutex);
    return m_client && m_client->isConnected();
}

CadStatus LazyCadClient::status()
{
    QMutexLocker locker(&m_mutex);
    return adapter().status();
}

QVector<SketchInfo> LazyCadClient::listSketches()
{
    QMutexLocker locker(&m_mutex);
    return adapter().listSketches();
}

QVector<PlaneInfo> LazyCadClient::listPlanes()
{
    QMutexLocker locker(&m_mutex);
    return adapter().listPlanes();
}

Sketch::SketchDocument LazyCadClient::exportSketch(const QString& name)
{
    QMutexLocker locker(&m_mutex);
    return adapter().exportSketch(name);
}

QString LazyCadClient::importSketch(const Sketch::SketchDocument& doc,
                                    const std::optional<QString>& name,
                                    const std::optional<QString>& plane)
{
    QMutexLocker locker(&m_mutex);
    return adapter().importSketch(doc, name, plane);
}

bool LazyCadClient::openSketch(const QString& name)
{
    QMutexLocker locker(&m_mutex);
    return adapter().openSketch(name);
}

} // namespace CadBridge
