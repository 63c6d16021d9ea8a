// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVariantMap>
#include <QtCore/QVector>

#include <stdexcept>

namespace CadBridge {

// Free-form status reported by a backend. Only meaningful while the backend is connected.
using CadStatus = QVariantMap;

inline constexpr QLatin1StringView kStatusActiveDocumentKey{"active_document"};
inline constexpr QLatin1StringView kStatusSketchCountKey{"sketch_count"};

struct SketchInfo final {
    QString name;
    QString label;
    int geometryCount = 0;
    int constraintCount = 0;

    friend bool operator==(const SketchInfo&, const SketchInfo&) = default;
};

struct PlaneInfo final {
    QString id;
    QString name;
    QString type;

    friend bool operator==(const PlaneInfo&, const PlaneInfo&) = default;
};

// Thrown by adapters (and by LazyCadClient for a backend with no adapter).
class CADBRIDGE_EXPORT CadClientError : public std::runtime_error
{
public:
    explicit CadClientError(const QString& message)
        : std::runtime_error(message.toStdString())
    {}
};

// Standard construction planes, for when a backend lists none.
CADBRIDGE_EXPORT QVector<PlaneInfo> defaultPlanes();

// "<document> | <n> sketches", or "Connected" when the status carries neither.
CADBRIDGE_EXPORT QString statusSummary(const CadStatus& status);

} // namespace CadBridge

Q_DECLARE_METATYPE(CadBridge::SketchInfo)
Q_DECLARE_METATYPE(CadBridge::PlaneInfo)
