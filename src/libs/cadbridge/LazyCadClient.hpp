// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/CadSystem.hpp"
#include "cadbridge/api/ICadClient.hpp"

#include <QtCore/QMutex>

#include <array>
#include <functional>
#include <memory>

namespace CadBridge {

using CadClientFactory = std::function<std::unique_ptr<Api::ICadClient>(const CadEndpoint&)>;

// One optional adapter factory per backend, supplied by the embedding application.
class CADBRIDGE_EXPORT CadClientFactories final
{
public:
    void registerFactory(CadSystem system, CadClientFactory factory);
    bool hasFactory(CadSystem system) const;
    CadClientFactory factory(CadSystem system) const;

private:
    std::array<CadClientFactory, kCadSystemCount> m_factories;
};

// Builds the concrete adapter on first real use and serializes every call into it,
// so a background probe and a manual call never touch the same adapter at once.
class CADBRIDGE_EXPORT LazyCadClient final : public Api::ICadClient
{
public:
    LazyCadClient(CadSystem system, CadEndpoint endpoint, CadClientFactory factory);
    ~LazyCadClient() override;

    CadSystem system() const noexcept { return m_system; }
    const CadEndpoint& endpoint() const noexcept { return m_endpoint; }
    bool isConstructed() const;

    bool connect(int timeoutMs) override;
    // No-op until the adapter exists.
    void disconnect() override;
    // False until the adapter exists; never constructs it.
    bool isConnected() override;

    CadStatus status() override;
    QVector<SketchInfo> listSketches() override;
    QVector<PlaneInfo> listPlanes() override;

    Sketch::SketchDocument exportSketch(const QString& name) override;
    QString importSketch(const Sketch::SketchDocument& doc,
                         const std::optional<QString>& name,
                         const std::optional<QString>& plane) override;
    bool openSketch(const QString& name) override;

private:
    Api::ICadClient& adapter();

    const CadSystem m_system;
    const CadEndpoint m_endpoint;
    CadClientFactory m_factory;

    mutable QMutex m_mutex;
    std::unique_ptr<Api::ICadClient> m_client;
};

} // namespace CadBridge
