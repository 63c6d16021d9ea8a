// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "cadbridge/CadBridgeGlobal.hpp"
#include "cadbridge/api/CadBridgeTypes.hpp"

#include <QtCore/QtGlobal>

namespace CadBridge::Internal {

// Cached connectivity of one backend. Status is non-empty only while connected.
class CADBRIDGE_EXPORT CadConnectionState final
{
public:
    bool isConnected() const noexcept { return m_connected; }
    const CadStatus& status() const noexcept { return m_status; }
    quint64 generation() const noexcept { return m_generation; }

    // Both return true when the connected flag flipped.
    bool markConnected(CadStatus status);
    bool markDisconnected();

    // Invalidates probe results dispatched before this call.
    quint64 bumpGeneration() noexcept { return ++m_generation; }

private:
    bool m_connected = false;
    CadStatus m_status;
    quint64 m_generation = 0;
};

} // namespace CadBridge::Internal
