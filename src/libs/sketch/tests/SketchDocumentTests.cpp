// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sketch/SketchDocument.hpp"

using Sketch::Circle;
using Sketch::Constraint;
using Sketch::Line;
using Sketch::Point;
using Sketch::Point2D;
using Sketch::PrimitiveKind;
using Sketch::SketchDocument;
using Sketch::Spline;

TEST(SketchDocumentTests, AddPrimitiveGeneratesUniqueIdsPerKind)
{
    SketchDocument doc(QStringLiteral("Sketch"));
    const QString lineId = doc.addPrimitive(Line{{0.0, 0.0}, {1.0, 0.0}});
    const QString circleId = doc.addPrimitive(Circle{{2.0, 2.0}, 1.0});
    const QString pointId = doc.addPrimitive(Point{{3.0, 3.0}}, true);

    EXPECT_TRUE(lineId.startsWith(QLatin1Char('L')));
    EXPECT_TRUE(circleId.startsWith(QLatin1Char('C')));
    EXPECT_TRUE(pointId.startsWith(QLatin1Char('P')));
    EXPECT_NE(lineId, circleId);

    ASSERT_EQ(doc.primitiveCount(), 3);
    EXPECT_EQ(doc.primitiveIds(), (QStringList{lineId, circleId, pointId}));

    const auto* point = doc.primitive(pointId);
    ASSERT_NE(point, nullptr);
    EXPECT_EQ(point->kind(), PrimitiveKind::Point);
    EXPECT_TRUE(point->construction);
}

TEST(SketchDocumentTests, InsertRejectsEmptyAndDuplicateIds)
{
    SketchDocument doc;
    EXPECT_TRUE(doc.insertPrimitive(QStringLiteral("g1"), Line{}));
    EXPECT_FALSE(doc.insertPrimitive(QStringLiteral("g1"), Circle{}));
    EXPECT_FALSE(doc.insertPrimitive(QStringLiteral("  "), Circle{}));
    EXPECT_EQ(doc.primitiveCount(), 1);
    EXPECT_EQ(doc.primitive(QStringLiteral("g1"))->kind(), PrimitiveKind::Line);
}

TEST(SketchDocumentTests, GeneratedIdsSkipExplicitOnes)
{
    SketchDocument doc;
    ASSERT_TRUE(doc.insertPrimitive(QStringLiteral("L0"), Line{}));
    const QString id = doc.addPrimitive(Line{});
    EXPECT_NE(id, QStringLiteral("L0"));
    EXPECT_TRUE(doc.contains(id));
}

TEST(SketchDocumentTests, RemovePrimitiveKeepsLookupConsistent)
{
    SketchDocument doc;
    const QString a = doc.addPrimitive(Point{{1.0, 1.0}});
    const QString b = doc.addPrimitive(Point{{2.0, 2.0}});
    const QString c = doc.addPrimitive(Point{{3.0, 3.0}});

    EXPECT_TRUE(doc.removePrimitive(b));
    EXPECT_FALSE(doc.removePrimitive(b));
    EXPECT_FALSE(doc.contains(b));

    const auto* last = doc.primitive(c);
    ASSERT_NE(last, nullptr);
    EXPECT_EQ(std::get<Point>(last->geometry).position, (Point2D{3.0, 3.0}));
    EXPECT_EQ(doc.primitiveIds(), (QStringList{a, c}));
}

TEST(SketchDocumentTests, CopiesAreIndependent)
{
    SketchDocument original(QStringLiteral("Original"));
    original.addPrimitive(Spline{{{0.0, 0.0}, {1.0, 2.0}, {3.0, 1.0}}, {}, 2});
    original.addConstraint(Constraint{QStringLiteral("k1"), QStringLiteral("Horizontal"), {}, std::nullopt});

    SketchDocument copy = original;
    EXPECT_EQ(copy, original);

    copy.setName(QStringLiteral("Copy"));
    copy.clearConstraints();
    copy.forEachGeometry([](Sketch::PrimitiveGeometry& geometry) {
        std::get<Spline>(geometry).controlPoints[0] = Point2D{9.0, 9.0};
    });

    EXPECT_EQ(original.name(), QStringLiteral("Original"));
    EXPECT_EQ(original.constraints().size(), 1);
    EXPECT_EQ(std::get<Spline>(original.primitives().front().geometry).controlPoints.front(),
              (Point2D{0.0, 0.0}));
    EXPECT_FALSE(copy == original);
}

TEST(SketchDocumentTests, KindStringsAreCaseInsensitive)
{
    PrimitiveKind kind = PrimitiveKind::Line;
    EXPECT_TRUE(Sketch::primitiveKindFromString(QStringLiteral(" Circle "), kind));
    EXPECT_EQ(kind, PrimitiveKind::Circle);
    EXPECT_TRUE(Sketch::primitiveKindFromString(QStringLiteral("BSpline"), kind));
    EXPECT_EQ(kind, PrimitiveKind::Spline);
    EXPECT_FALSE(Sketch::primitiveKindFromString(QStringLiteral("ellipse"), kind));
    EXPECT_EQ(Sketch::primitiveKindToString(PrimitiveKind::Arc), QStringLiteral("arc"));
}
