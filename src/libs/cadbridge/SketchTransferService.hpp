// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/CadSystem.hpp"
#include "cadbridge/api/CadBridgeTypes.hpp"

#include <sketch/SketchDocument.hpp>
#include <sketch/SketchTransform.hpp>

#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <functional>
#include <optional>

namespace CadBridge {

class CadConnectionManager;

enum class CollectStatus : unsigned char {
    Collected,
    NoSketches,
    NothingSelected,
    ExportFailed
};

struct CollectResult final {
    CollectStatus status = CollectStatus::NoSketches;
    int count = 0;
    QVector<Sketch::SketchDocument> documents;
    QStringList failedNames;
};

struct DeliveryRequest final {
    std::optional<QString> name;
    std::optional<QString> plane;
    Sketch::TransformRequest transform;
};

// Picks which of several listed sketches to collect. An empty pick cancels the collect.
using SketchSelector = std::function<QVector<SketchInfo>(CadSystem system, const QVector<SketchInfo>& available)>;

// Moves sketches in and out of CAD backends through a CadConnectionManager.
class CADBRIDGE_EXPORT SketchTransferService final
{
public:
    explicit SketchTransferService(CadConnectionManager& manager);

    CollectResult collect(CadSystem system, const SketchSelector& selector = {});

    // Transforms first when the request moves geometry or strips constraints.
    std::optional<QString> deliver(CadSystem system,
                                   const Sketch::SketchDocument& sketch,
                                   const DeliveryRequest& request = {});

private:
    CadConnectionManager& m_manager;
};

} // namespace CadBridge
