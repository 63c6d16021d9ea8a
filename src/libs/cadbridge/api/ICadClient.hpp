// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/api/CadBridgeTypes.hpp"

#include <sketch/SketchDocument.hpp>

#include <optional>

namespace CadBridge::Api {

// RPC adapter for one CAD backend. Every call may block on I/O and may throw.
class CADBRIDGE_EXPORT ICadClient
{
public:
    virtual ~ICadClient() = default;

    virtual bool connect(int timeoutMs) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() = 0;

    virtual CadStatus status() = 0;
    virtual QVector<SketchInfo> listSketches() = 0;
    virtual QVector<PlaneInfo> listPlanes() = 0;

    virtual Sketch::SketchDocument exportSketch(const QString& name) = 0;
    // Returns the name the backend gave the created sketch.
    virtual QString importSketch(const Sketch::SketchDocument& doc,
                                 const std::optional<QString>& name,
                                 const std::optional<QString>& plane) = 0;
    virtual bool openSketch(const QString& name) = 0;
};

} // namespace CadBridge::Api
