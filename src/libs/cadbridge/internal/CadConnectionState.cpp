// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/internal/CadConnectionState.hpp"

namespace CadBridge::Internal {

bool CadConnectionState::markConnected(CadStatus status)
{
    const bool changed = !m_connected;
    m_connected = true;
    m_status = std::move(status);
    return changed;
}

bool CadConnectionState::markDisconnected()
{
    const bool changed = m_connected;
    m_connected = false;
    m_status.clear();
    return changed;
}

} // namespace CadBridge::Internal
