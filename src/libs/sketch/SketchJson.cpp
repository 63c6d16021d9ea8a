// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sketch/SketchJson.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonValue>
#include <QtCore/QSaveFile>

#include <type_traits>
#include <variant>

namespace Sketch {

namespace {

using namespace Qt::StringLiterals;

constexpr qint64 kMaxSketchFileBytes = 64ll * 1024ll * 1024ll;

QJsonObject pointObject(const Point2D& point)
{
    QJsonObject obj;
    obj.insert(u"x"_s, point.x);
    obj.insert(u"y"_s, point.y);
    return obj;
}

bool readPoint(const QJsonObject& parent, const QString& key, const QString& context,
               Point2D& out, QStringList& errors)
{
    const QJsonValue value = parent.value(key);
    if (!value.isObject()) {
        errors.push_back(QStringLiteral("%1.%2 must be an object with x and y.").arg(context, key));
        return false;
    }

    const QJsonObject obj = value.toObject();
    const QJsonValue x = obj.value(u"x"_s);
    const QJsonValue y = obj.value(u"y"_s);
    if (!x.isDouble() || !y.isDouble()) {
        errors.push_back(QStringLiteral("%1.%2 needs numeric x and y.").arg(context, key));
        return false;
    }

    out = Point2D{x.toDouble(), y.toDouble()};
    return true;
}

bool readNumber(const QJsonObject& parent, const QString& key, const QString& context,
                double& out, QStringList& errors)
{
    const QJsonValue value = parent.value(key);
    if (!value.isDouble()) {
        errors.push_back(QStringLiteral("%1.%2 must be a number.").arg(context, key));
        return false;
    }
    out = value.toDouble();
    return true;
}

QJsonObject geometryObject(const PrimitiveGeometry& geometry)
{
    QJsonObject obj;
    std::visit([&obj](const auto& g) {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, Line>) {
            obj.insert(u"start"_s, pointObject(g.start));
            obj.insert(u"end"_s, pointObject(g.end));
        } else if constexpr (std::is_same_v<T, Circle>) {
            obj.insert(u"center"_s, pointObject(g.center));
            obj.insert(u"radius"_s, g.radius);
        } else if constexpr (std::is_same_v<T, Arc>) {
            obj.insert(u"center"_s, pointObject(g.center));
            obj.insert(u"start"_s, pointObject(g.startPoint));
            obj.insert(u"end"_s, pointObject(g.endPoint));
            obj.insert(u"radius"_s, g.radius);
            obj.insert(u"ccw"_s, g.ccw);
        } else if constexpr (std::is_same_v<T, Point>) {
            obj.insert(u"position"_s, pointObject(g.position));
        } else if constexpr (std::is_same_v<T, Spline>) {
            QJsonArray controlPoints;
            for (const Point2D& cp : g.controlPoints)
                controlPoints.append(pointObject(cp));
            QJsonArray knots;
            for (double k : g.knots)
                knots.append(k);
            obj.insert(u"controlPoints"_s, controlPoints);
            obj.insert(u"knots"_s, knots);
            obj.insert(u"degree"_s, g.degree);
        }
    }, geometry);
    return obj;
}

bool parseGeometry(const QJsonObject& obj, PrimitiveKind kind, const QString& context,
                   PrimitiveGeometry& out, QStringList& errors)
{
    const qsizetype errorsBefore = errors.size();

    switch (kind) {
        case PrimitiveKind::Line: {
            Line line;
            readPoint(obj, u"start"_s, context, line.start, errors);
            readPoint(obj, u"end"_s, context, line.end, errors);
            out = line;
            break;
        }
        case PrimitiveKind::Circle: {
            Circle circle;
            readPoint(obj, u"center"_s, context, circle.center, errors);
            if (readNumber(obj, u"radius"_s, context, circle.radius, errors) && circle.radius < 0.0)
                errors.push_back(QStringLiteral("%1.radius must not be negative.").arg(context));
            out = circle;
            break;
        }
        case PrimitiveKind::Arc: {
            Arc arc;
            readPoint(obj, u"center"_s, context, arc.center, errors);
            readPoint(obj, u"start"_s, context, arc.startPoint, errors);
            readPoint(obj, u"end"_s, context, arc.endPoint, errors);
            if (readNumber(obj, u"radius"_s, context, arc.radius, errors) && arc.radius < 0.0)
                errors.push_back(QStringLiteral("%1.radius must not be negative.").arg(context));
            const QJsonValue ccw = obj.value(u"ccw"_s);
            if (!ccw.isUndefined() && !ccw.isBool())
                errors.push_back(QStringLiteral("%1.ccw must be a boolean.").arg(context));
            arc.ccw = ccw.toBool(true);
            out = arc;
            break;
        }
        case PrimitiveKind::Point: {
            Point point;
            readPoint(obj, u"position"_s, context, point.position, errors);
            out = point;
            break;
        }
        case PrimitiveKind::Spline: {
            Spline spline;
            const QJsonValue controlPointsValue = obj.value(u"controlPoints"_s);
            if (!controlPointsValue.isUndefined() && !controlPointsValue.isArray())
                errors.push_back(QStringLiteral("%1.controlPoints must be an array.").arg(context));
            const QJsonArray controlPoints = controlPointsValue.toArray();
            for (qsizetype i = 0; i < controlPoints.size(); ++i) {
                const QJsonObject wrapper{{u"p"_s, controlPoints.at(i)}};
                Point2D cp;
                if (readPoint(wrapper, u"p"_s, QStringLiteral("%1.controlPoints[%2]").arg(context).arg(i), cp, errors))
                    spline.controlPoints.push_back(cp);
            }
            const QJsonValue knotsValue = obj.value(u"knots"_s);
            if (!knotsValue.isUndefined() && !knotsValue.isArray())
                errors.push_back(QStringLiteral("%1.knots must be an array.").arg(context));
            const QJsonArray knots = knotsValue.toArray();
            for (const QJsonValue& knot : knots) {
                if (!knot.isDouble()) {
                    errors.push_back(QStringLiteral("%1.knots must contain numbers only.").arg(context));
                    break;
                }
                spline.knots.push_back(knot.toDouble());
            }
            const QJsonValue degree = obj.value(u"degree"_s);
            if (!degree.isUndefined()) {
                if (!degree.isDouble() || degree.toInt() < 1)
                    errors.push_back(QStringLiteral("%1.degree must be a positive integer.").arg(context));
                else
                    spline.degree = degree.toInt();
            }
            out = spline;
            break;
        }
    }

    return errors.size() == errorsBefore;
}

} // namespace

QJsonObject serializeSketchDocument(const SketchDocument& doc)
{
    QJsonObject root;
    root.insert(u"schemaVersion"_s, kSketchSchemaVersion);
    root.insert(u"name"_s, doc.name());

    QJsonArray primitives;
    for (const Primitive& primitive : doc.primitives()) {
        QJsonObject obj = geometryObject(primitive.geometry);
        obj.insert(u"id"_s, primitive.id);
        obj.insert(u"type"_s, primitiveKindToString(primitive.kind()));
        if (primitive.construction)
            obj.insert(u"construction"_s, true);
        primitives.append(obj);
    }
    root.insert(u"primitives"_s, primitives);

    QJsonArray constraints;
    for (const Constraint& constraint : doc.constraints()) {
        QJsonObject obj;
        if (!constraint.id.isEmpty())
            obj.insert(u"id"_s, constraint.id);
        obj.insert(u"type"_s, constraint.type);
        obj.insert(u"references"_s, QJsonArray::fromStringList(constraint.references));
        if (constraint.value)
            obj.insert(u"value"_s, *constraint.value);
        constraints.append(obj);
    }
    root.insert(u"constraints"_s, constraints);

    if (const auto& solver = doc.solverStatus()) {
        QJsonObject obj;
        obj.insert(u"status"_s, solver->status);
        obj.insert(u"degreesOfFreedom"_s, solver->degreesOfFreedom);
        root.insert(u"solverStatus"_s, obj);
    }

    return root;
}

Utils::Result parseSketchDocument(const QJsonObject& json, SketchDocument& out)
{
    out = SketchDocument{};
    QStringList errors;

    const QJsonValue schemaValue = json.value(u"schemaVersion"_s);
    if (!schemaValue.isUndefined()) {
        if (!schemaValue.isDouble())
            errors.push_back(QStringLiteral("schemaVersion must be a number."));
        else if (schemaValue.toInt() != kSketchSchemaVersion)
            errors.push_back(QStringLiteral("Unsupported schemaVersion: %1").arg(schemaValue.toInt()));
    }

    out.setName(json.value(u"name"_s).toString());

    const QJsonValue primitivesValue = json.value(u"primitives"_s);
    if (!primitivesValue.isUndefined() && !primitivesValue.isArray())
        errors.push_back(QStringLiteral("primitives must be an array."));

    const QJsonArray primitives = primitivesValue.toArray();
    for (qsizetype i = 0; i < primitives.size(); ++i) {
        const QString context = QStringLiteral("primitives[%1]").arg(i);
        const QJsonObject obj = primitives.at(i).toObject();
        if (obj.isEmpty()) {
            errors.push_back(QStringLiteral("%1 must be an object.").arg(context));
            continue;
        }

        PrimitiveKind kind = PrimitiveKind::Line;
        const QString typeText = obj.value(u"type"_s).toString();
        if (!primitiveKindFromString(typeText, kind)) {
            errors.push_back(QStringLiteral("%1.type '%2' is not a known primitive.").arg(context, typeText));
            continue;
        }

        PrimitiveGeometry geometry;
        if (!parseGeometry(obj, kind, context, geometry, errors))
            continue;

        const bool construction = obj.value(u"construction"_s).toBool(false);
        const QString id = obj.value(u"id"_s).toString().trimmed();
        if (id.isEmpty()) {
            out.addPrimitive(std::move(geometry), construction);
        } else if (!out.insertPrimitive(id, std::move(geometry), construction)) {
            errors.push_back(QStringLiteral("%1.id '%2' is duplicated.").arg(context, id));
        }
    }

    const QJsonValue constraintsValue = json.value(u"constraints"_s);
    if (!constraintsValue.isUndefined() && !constraintsValue.isArray())
        errors.push_back(QStringLiteral("constraints must be an array."));

    const QJsonArray constraints = constraintsValue.toArray();
    for (qsizetype i = 0; i < constraints.size(); ++i) {
        const QJsonObject obj = constraints.at(i).toObject();
        Constraint constraint;
        constraint.id = obj.value(u"id"_s).toString();
        constraint.type = obj.value(u"type"_s).toString();
        if (constraint.type.isEmpty()) {
            errors.push_back(QStringLiteral("constraints[%1].type is required.").arg(i));
            continue;
        }
        for (const QJsonValue& ref : obj.value(u"references"_s).toArray())
            constraint.references.push_back(ref.toString());
        const QJsonValue value = obj.value(u"value"_s);
        if (value.isDouble())
            constraint.value = value.toDouble();
        out.addConstraint(std::move(constraint));
    }

    const QJsonValue solverValue = json.value(u"solverStatus"_s);
    if (solverValue.isObject()) {
        const QJsonObject obj = solverValue.toObject();
        SolverStatus status;
        status.status = obj.value(u"status"_s).toString();
        status.degreesOfFreedom = obj.value(u"degreesOfFreedom"_s).toInt(-1);
        out.setSolverStatus(status);
    }

    if (!errors.isEmpty())
        return Utils::Result::failure(errors);
    return Utils::Result::success();
}

Utils::Result loadSketchFile(const QString& path, SketchDocument& out)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return Utils::Result::failure(QStringLiteral("Failed to open sketch file: %1").arg(path));

    if (file.size() > kMaxSketchFileBytes)
        return Utils::Result::failure(QStringLiteral("Sketch file is too large: %1").arg(path));

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return Utils::Result::failure(QStringLiteral("Invalid sketch JSON in %1: %2")
                                          .arg(path, parseError.errorString()));
    }

    Utils::Result result = parseSketchDocument(doc.object(), out);
    if (!result)
        qCWarning(sketchlog).noquote() << "Sketch file" << path << "has errors:" << result.errorString();
    return result;
}

Utils::Result saveSketchFile(const QString& path, const SketchDocument& doc)
{
    const QByteArray bytes = QJsonDocument(serializeSketchDocument(doc)).toJson(QJsonDocument::Indented);

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return Utils::Result::failure(QStringLiteral("Failed to open sketch file for write: %1").arg(path));

    if (file.write(bytes) != bytes.size()) {
        file.cancelWriting();
        return Utils::Result::failure(QStringLiteral("Failed to write sketch file: %1").arg(path));
    }

    if (!file.commit())
        return Utils::Result::failure(QStringLiteral("Failed to commit sketch file: %1").arg(path));

    return Utils::Result::success();
}

} // namespace Sketch
