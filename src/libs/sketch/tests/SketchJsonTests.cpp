// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "sketch/SketchJson.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QTemporaryDir>

using Sketch::Arc;
using Sketch::Circle;
using Sketch::Constraint;
using Sketch::Line;
using Sketch::SketchDocument;
using Sketch::SolverStatus;
using Sketch::Spline;

namespace {

SketchDocument makeSketch()
{
    SketchDocument doc(QStringLiteral("Bracket"));
    doc.insertPrimitive(QStringLiteral("l1"), Line{{0.0, 0.0}, {4.0, 0.0}});
    doc.insertPrimitive(QStringLiteral("c1"), Circle{{2.0, 2.0}, 0.5}, true);
    doc.insertPrimitive(QStringLiteral("a1"), Arc{{0.0, 0.0}, {1.0, 0.0}, {0.0, 1.0}, 1.0, false});
    doc.insertPrimitive(QStringLiteral("s1"), Spline{{{0.0, 0.0}, {1.0, 1.0}, {2.0, 0.0}}, {0, 0, 0, 1, 1, 1}, 2});
    doc.addConstraint(Constraint{QStringLiteral("k1"), QStringLiteral("Radius"), {QStringLiteral("c1")}, 0.5});
    doc.setSolverStatus(SolverStatus{QStringLiteral("FullyConstrained"), 0});
    return doc;
}

} // namespace

TEST(SketchJsonTests, RoundTripSerializeParse)
{
    const SketchDocument doc = makeSketch();
    const QJsonObject json = Sketch::serializeSketchDocument(doc);

    EXPECT_EQ(json.value(QStringLiteral("schemaVersion")).toInt(), Sketch::kSketchSchemaVersion);
    EXPECT_EQ(json.value(QStringLiteral("primitives")).toArray().size(), 4);

    SketchDocument parsed;
    const Utils::Result result = Sketch::parseSketchDocument(json, parsed);
    ASSERT_TRUE(result.ok) << result.errorString().toStdString();
    EXPECT_EQ(parsed, doc);
}

TEST(SketchJsonTests, SerializesPointsAsObjects)
{
    const QJsonObject json = Sketch::serializeSketchDocument(makeSketch());
    const QJsonObject line = json.value(QStringLiteral("primitives")).toArray().at(0).toObject();

    EXPECT_EQ(line.value(QStringLiteral("type")).toString(), QStringLiteral("line"));
    EXPECT_EQ(line.value(QStringLiteral("id")).toString(), QStringLiteral("l1"));
    EXPECT_DOUBLE_EQ(line.value(QStringLiteral("end")).toObject().value(QStringLiteral("x")).toDouble(), 4.0);
    EXPECT_FALSE(line.contains(QStringLiteral("construction")));
}

TEST(SketchJsonTests, ParseCollectsEveryError)
{
    QJsonObject badLine;
    badLine.insert(QStringLiteral("type"), QStringLiteral("line"));
    badLine.insert(QStringLiteral("start"), QJsonObject{{QStringLiteral("x"), 1.0}});

    QJsonObject unknown;
    unknown.insert(QStringLiteral("type"), QStringLiteral("ellipse"));

    QJsonObject negativeCircle;
    negativeCircle.insert(QStringLiteral("type"), QStringLiteral("circle"));
    negativeCircle.insert(QStringLiteral("center"), QJsonObject{{QStringLiteral("x"), 0.0}, {QStringLiteral("y"), 0.0}});
    negativeCircle.insert(QStringLiteral("radius"), -1.0);

    QJsonObject json;
    json.insert(QStringLiteral("primitives"), QJsonArray{badLine, unknown, negativeCircle});

    SketchDocument parsed;
    const Utils::Result result = Sketch::parseSketchDocument(json, parsed);
    EXPECT_FALSE(result.ok);
    EXPECT_GE(result.errors.size(), 4);
    EXPECT_TRUE(parsed.isEmpty());
}

TEST(SketchJsonTests, NonArrayCollectionsAreReported)
{
    QJsonObject spline;
    spline.insert(QStringLiteral("id"), QStringLiteral("s"));
    spline.insert(QStringLiteral("type"), QStringLiteral("spline"));
    spline.insert(QStringLiteral("controlPoints"), QStringLiteral("0,0 1,1"));
    spline.insert(QStringLiteral("knots"), 3.0);

    QJsonObject json;
    json.insert(QStringLiteral("primitives"), QJsonArray{spline});
    json.insert(QStringLiteral("constraints"), QJsonObject{{QStringLiteral("type"), QStringLiteral("Distance")}});

    SketchDocument parsed;
    const Utils::Result result = Sketch::parseSketchDocument(json, parsed);
    EXPECT_FALSE(result.ok);
    ASSERT_EQ(result.errors.size(), 3) << result.errorString().toStdString();
    EXPECT_TRUE(result.errors.at(0).contains(QStringLiteral("controlPoints must be an array")));
    EXPECT_TRUE(result.errors.at(1).contains(QStringLiteral("knots must be an array")));
    EXPECT_TRUE(result.errors.at(2).contains(QStringLiteral("constraints must be an array")));
    EXPECT_TRUE(parsed.isEmpty());
    EXPECT_TRUE(parsed.constraints().isEmpty());
}

TEST(SketchJsonTests, RejectsDuplicateIdsAndUnknownSchema)
{
    QJsonObject point;
    point.insert(QStringLiteral("id"), QStringLiteral("p"));
    point.insert(QStringLiteral("type"), QStringLiteral("point"));
    point.insert(QStringLiteral("position"), QJsonObject{{QStringLiteral("x"), 1.0}, {QStringLiteral("y"), 2.0}});

    QJsonObject json;
    json.insert(QStringLiteral("schemaVersion"), 7);
    json.insert(QStringLiteral("primitives"), QJsonArray{point, point});

    SketchDocument parsed;
    const Utils::Result result = Sketch::parseSketchDocument(json, parsed);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errors.size(), 2);
    EXPECT_EQ(parsed.primitiveCount(), 1);
}

TEST(SketchJsonTests, MissingIdsAreGenerated)
{
    QJsonObject line;
    line.insert(QStringLiteral("type"), QStringLiteral("line"));
    line.insert(QStringLiteral("start"), QJsonObject{{QStringLiteral("x"), 0.0}, {QStringLiteral("y"), 0.0}});
    line.insert(QStringLiteral("end"), QJsonObject{{QStringLiteral("x"), 1.0}, {QStringLiteral("y"), 0.0}});

    QJsonObject json;
    json.insert(QStringLiteral("primitives"), QJsonArray{line});

    SketchDocument parsed;
    ASSERT_TRUE(Sketch::parseSketchDocument(json, parsed).ok);
    ASSERT_EQ(parsed.primitiveCount(), 1);
    EXPECT_FALSE(parsed.primitiveIds().front().isEmpty());
}

TEST(SketchJsonTests, SaveThenLoadFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("bracket.json"));

    const SketchDocument doc = makeSketch();
    ASSERT_TRUE(Sketch::saveSketchFile(path, doc).ok);

    SketchDocument loaded;
    const Utils::Result result = Sketch::loadSketchFile(path, loaded);
    ASSERT_TRUE(result.ok) << result.errorString().toStdString();
    EXPECT_EQ(loaded, doc);
}

TEST(SketchJsonTests, LoadReportsMalformedJson)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("broken.json"));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ \"primitives\": [");
    file.close();

    SketchDocument loaded;
    EXPECT_FALSE(Sketch::loadSketchFile(path, loaded).ok);
    EXPECT_FALSE(Sketch::loadSketchFile(QDir(dir.path()).filePath(QStringLiteral("missing.json")), loaded).ok);
}
