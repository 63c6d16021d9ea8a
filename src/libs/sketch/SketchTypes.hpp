// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sketch/SketchGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>
#include <variant>

namespace Sketch {

struct Point2D final {
    double x = 0.0;
    double y = 0.0;

    friend bool operator==(const Point2D&, const Point2D&) = default;
};

struct Line final {
    Point2D start;
    Point2D end;

    friend bool operator==(const Line&, const Line&) = default;
};

struct Circle final {
    Point2D center;
    double radius = 0.0;

    friend bool operator==(const Circle&, const Circle&) = default;
};

struct Arc final {
    Point2D center;
    Point2D startPoint;
    Point2D endPoint;
    double radius = 0.0;
    bool ccw = true;

    friend bool operator==(const Arc&, const Arc&) = default;
};

struct Point final {
    Point2D position;

    friend bool operator==(const Point&, const Point&) = default;
};

struct Spline final {
    QVector<Point2D> controlPoints;
    QVector<double> knots;
    int degree = 3;

    friend bool operator==(const Spline&, const Spline&) = default;
};

using PrimitiveGeometry = std::variant<Line, Circle, Arc, Point, Spline>;

enum class PrimitiveKind : unsigned char {
    Line,
    Circle,
    Arc,
    Point,
    Spline
};

struct Primitive final {
    QString id;
    PrimitiveGeometry geometry;
    bool construction = false;

    PrimitiveKind kind() const noexcept { return static_cast<PrimitiveKind>(geometry.index()); }

    friend bool operator==(const Primitive&, const Primitive&) = default;
};

// Opaque to the transform pipeline; kept so documents survive a round trip intact.
struct Constraint final {
    QString id;
    QString type;
    QStringList references;
    std::optional<double> value;

    friend bool operator==(const Constraint&, const Constraint&) = default;
};

struct SolverStatus final {
    QString status;
    int degreesOfFreedom = -1;

    friend bool operator==(const SolverStatus&, const SolverStatus&) = default;
};

SKETCH_EXPORT QString primitiveKindToString(PrimitiveKind kind);
SKETCH_EXPORT bool primitiveKindFromString(const QString& text, PrimitiveKind& out);

} // namespace Sketch
