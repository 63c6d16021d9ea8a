// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/SketchTransferService.hpp"

#include "cadbridge/CadConnectionManager.hpp"

Q_LOGGING_CATEGORY(transferlog, "sketchbridge.transfer")

namespace CadBridge {

SketchTransferService::SketchTransferService(CadConnectionManager& manager)
    : m_manager(manager)
{
}

CollectResult SketchTransferService::collect(CadSystem system, const SketchSelector& selector)
{
    CollectResult result;
    const QString systemName = cadSystemDisplayName(system);

    const QVector<SketchInfo> available = m_manager.listSketches(system);
    if (available.isEmpty()) {
        qCInfo(transferlog).noquote() << "No sketches available in" << systemName;
        result.status = CollectStatus::NoSketches;
        return result;
    }

    QVector<SketchInfo> selected;
    if (available.size() == 1) {
        selected = available;
    } else if (selector) {
        selected = selector(system, available);
    }

    if (selected.isEmpty()) {
        qCInfo(transferlog).noquote() << "No sketches selected from" << systemName;
        result.status = CollectStatus::NothingSelected;
        return result;
    }

    for (const SketchInfo& info : selected) {
        std::optional<Sketch::SketchDocument> doc = m_manager.exportSketch(system, info.name);
        if (!doc) {
            result.failedNames.push_back(info.name);
            continue;
        }
        result.documents.push_back(std::move(*doc));
        ++result.count;
    }

    if (result.count > 0) {
        result.status = CollectStatus::Collected;
        qCInfo(transferlog).noquote() << "Collected" << result.count << "sketch(es) from" << systemName;
    } else {
        result.status = CollectStatus::ExportFailed;
        qCWarning(transferlog).noquote() << "Could not collect sketches from" << systemName;
    }

    if (!result.failedNames.isEmpty() && result.count > 0) {
        qCWarning(transferlog).noquote() << "Failed to export from" << systemName << ":"
                                         << result.failedNames.join(QStringLiteral(", "));
    }

    return result;
}

std::optional<QString> SketchTransferService::deliver(CadSystem system,
                                                      const Sketch::SketchDocument& sketch,
                                                      const DeliveryRequest& request)
{
    const QString systemName = cadSystemDisplayName(system);

    std::optional<QString> created;
    if (request.transform.isIdentity()) {
        created = m_manager.importSketch(system, sketch, request.name, request.plane);
    } else {
        const Sketch::SketchDocument transformed = Sketch::transformSketch(sketch, request.transform);
        created = m_manager.importSketch(system, transformed, request.name, request.plane);
    }

    if (created) {
        qCInfo(transferlog).noquote() << "Exported" << sketch.name() << "to" << systemName << "as" << *created;
    } else {
        qCWarning(transferlog).noquote() << "Could not export" << sketch.name() << "to" << systemName;
    }
    return created;
}

} // namespace CadBridge
