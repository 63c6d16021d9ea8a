// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <array>
#include <cstddef>
#include <optional>

namespace CadBridge {

enum class CadSystem : unsigned char {
    FreeCAD,
    Inventor,
    SolidWorks,
    Fusion
};

inline constexpr std::size_t kCadSystemCount = 4;

struct CadEndpoint final {
    QString host;
    quint16 port = 0;

    friend bool operator==(const CadEndpoint&, const CadEndpoint&) = default;
};

CADBRIDGE_EXPORT const std::array<CadSystem, kCadSystemCount>& allCadSystems();

constexpr std::size_t cadSystemIndex(CadSystem system) noexcept
{
    return static_cast<std::size_t>(system);
}

CADBRIDGE_EXPORT QString cadSystemDisplayName(CadSystem system);
CADBRIDGE_EXPORT QString cadSystemKey(CadSystem system);
CADBRIDGE_EXPORT CadEndpoint defaultCadEndpoint(CadSystem system);

// Accepts display names and settings keys in any case, plus "fusion360" / "fusion 360".
CADBRIDGE_EXPORT std::optional<CadSystem> cadSystemFromString(const QString& text);

} // namespace CadBridge

Q_DECLARE_METATYPE(CadBridge::CadSystem)
