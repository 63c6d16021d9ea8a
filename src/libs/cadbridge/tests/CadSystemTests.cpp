// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "cadbridge/CadSystem.hpp"
#include "cadbridge/api/CadBridgeTypes.hpp"

#include <QtCore/QSet>

using CadBridge::CadStatus;
using CadBridge::CadSystem;

TEST(CadSystemTests, EnumeratesFourBackendsInOrder)
{
    const auto& systems = CadBridge::allCadSystems();
    ASSERT_EQ(systems.size(), 4u);
    EXPECT_EQ(systems[0], CadSystem::FreeCAD);
    EXPECT_EQ(systems[3], CadSystem::Fusion);

    QSet<QString> keys;
    QSet<quint16> ports;
    for (const CadSystem system : systems) {
        keys.insert(CadBridge::cadSystemKey(system));
        ports.insert(CadBridge::defaultCadEndpoint(system).port);
        EXPECT_EQ(CadBridge::defaultCadEndpoint(system).host, QStringLiteral("localhost"));
    }
    EXPECT_EQ(keys.size(), 4);
    EXPECT_EQ(ports.size(), 4);
}

TEST(CadSystemTests, DisplayNamesAndPorts)
{
    EXPECT_EQ(CadBridge::cadSystemDisplayName(CadSystem::FreeCAD), QStringLiteral("FreeCAD"));
    EXPECT_EQ(CadBridge::cadSystemDisplayName(CadSystem::Fusion), QStringLiteral("Fusion 360"));
    EXPECT_EQ(CadBridge::defaultCadEndpoint(CadSystem::FreeCAD).port, 9876);
    EXPECT_EQ(CadBridge::defaultCadEndpoint(CadSystem::Inventor).port, 9877);
    EXPECT_EQ(CadBridge::defaultCadEndpoint(CadSystem::SolidWorks).port, 9878);
    EXPECT_EQ(CadBridge::defaultCadEndpoint(CadSystem::Fusion).port, 9879);
}

TEST(CadSystemTests, ParsesNamesCaseInsensitively)
{
    EXPECT_EQ(CadBridge::cadSystemFromString(QStringLiteral("freecad")), CadSystem::FreeCAD);
    EXPECT_EQ(CadBridge::cadSystemFromString(QStringLiteral(" SolidWorks ")), CadSystem::SolidWorks);
    EXPECT_EQ(CadBridge::cadSystemFromString(QStringLiteral("INVENTOR")), CadSystem::Inventor);
    EXPECT_EQ(CadBridge::cadSystemFromString(QStringLiteral("Fusion 360")), CadSystem::Fusion);
    EXPECT_EQ(CadBridge::cadSystemFromString(QStringLiteral("fusion360")), CadSystem::Fusion);
    EXPECT_EQ(CadBridge::cadSystemFromString(QStringLiteral("fusion")), CadSystem::Fusion);
    EXPECT_FALSE(CadBridge::cadSystemFromString(QStringLiteral("catia")).has_value());
    EXPECT_FALSE(CadBridge::cadSystemFromString(QString()).has_value());
}

TEST(CadSystemTests, DefaultPlanesAreStandardTriad)
{
    const auto planes = CadBridge::defaultPlanes();
    ASSERT_EQ(planes.size(), 3);
    EXPECT_EQ(planes[0].id, QStringLiteral("XY"));
    EXPECT_EQ(planes[1].id, QStringLiteral("XZ"));
    EXPECT_EQ(planes[2].id, QStringLiteral("YZ"));
}

TEST(CadSystemTests, StatusSummary)
{
    EXPECT_EQ(CadBridge::statusSummary(CadStatus{}), QStringLiteral("Connected"));

    CadStatus status;
    status.insert(QStringLiteral("active_document"), QStringLiteral("Bracket"));
    status.insert(QStringLiteral("sketch_count"), 3);
    EXPECT_EQ(CadBridge::statusSummary(status), QStringLiteral("Bracket | 3 sketches"));

    status.remove(QStringLiteral("active_document"));
    EXPECT_EQ(CadBridge::statusSummary(status), QStringLiteral("3 sketches"));
}
