// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/CadSystem.hpp"

namespace CadBridge {

namespace {

using namespace Qt::StringLiterals;

constexpr std::array<CadSystem, kCadSystemCount> kAllSystems{
    CadSystem::FreeCAD,
    CadSystem::Inventor,
    CadSystem::SolidWorks,
    CadSystem::Fusion
};

const QString kDefaultHost = u"localhost"_s;

} // namespace

const std::array<CadSystem, kCadSystemCount>& allCadSystems()
{
    return kAllSystems;
}

QString cadSystemDisplayName(CadSystem system)
{
    switch (system) {
        case CadSystem::FreeCAD: return u"FreeCAD"_s;
        case CadSystem::Inventor: return u"Inventor"_s;
        case CadSystem::SolidWorks: return u"SolidWorks"_s;
        case CadSystem::Fusion: return u"Fusion 360"_s;
    }
    return {};
}

QString cadSystemKey(CadSystem system)
{
    switch (system) {
        case CadSystem::FreeCAD: return u"freecad"_s;
        case CadSystem::Inventor: return u"inventor"_s;
        case CadSystem::SolidWorks: return u"solidworks"_s;
        case CadSystem::Fusion: return u"fusion"_s;
    }
    return {};
}

CadEndpoint defaultCadEndpoint(CadSystem system)
{
    switch (system) {
        case CadSystem::FreeCAD: return CadEndpoint{kDefaultHost, 9876};
        case CadSystem::Inventor: return CadEndpoint{kDefaultHost, 9877};
        case CadSystem::SolidWorks: return CadEndpoint{kDefaultHost, 9878};
        case CadSystem::Fusion: return CadEndpoint{kDefaultHost, 9879};
    }
    return CadEndpoint{kDefaultHost, 0};
}

std::optional<CadSystem> cadSystemFromString(const QString& text)
{
    const QString key = text.trimmed().toLower();
    if (key.isEmpty())
        return std::nullopt;

    for (const CadSystem system : kAllSystems) {
        if (key == cadSystemKey(system) || key == cadSystemDisplayName(system).toLower())
            return system;
    }

    if (key == u"fusion360"_s)
        return CadSystem::Fusion;

    return std::nullopt;
}

} // namespace CadBridge
