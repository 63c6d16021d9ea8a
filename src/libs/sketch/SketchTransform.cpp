// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sketch/SketchTransform.hpp"

#include <QtCore/QtMath>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

Q_LOGGING_CATEGORY(sketchlog, "sketchbridge.sketch")

namespace Sketch {

namespace {

template <typename Fn>
void forEachGeometryPoint(const PrimitiveGeometry& primitiveGeometry, Fn&& fn)
{
    std::visit([&fn](const auto& geometry) {
        using T = std::decay_t<decltype(geometry)>;
        if constexpr (std::is_same_v<T, Line>) {
            fn(geometry.start);
            fn(geometry.end);
        } else if constexpr (std::is_same_v<T, Circle>) {
            fn(geometry.center);
        } else if constexpr (std::is_same_v<T, Arc>) {
            fn(geometry.center);
            fn(geometry.startPoint);
            fn(geometry.endPoint);
        } else if constexpr (std::is_same_v<T, Point>) {
            fn(geometry.position);
        } else if constexpr (std::is_same_v<T, Spline>) {
            for (const Point2D& cp : geometry.controlPoints)
                fn(cp);
        }
    }, primitiveGeometry);
}

template <typename Fn>
void forEachRepresentativePoint(const SketchDocument& doc, Fn&& fn)
{
    for (const Primitive& primitive : doc.primitives())
        forEachGeometryPoint(primitive.geometry, fn);
}

void extendBounds(SketchBounds& bounds, double x, double y)
{
    if (bounds.empty) {
        bounds.minX = bounds.maxX = x;
        bounds.minY = bounds.maxY = y;
        bounds.empty = false;
        return;
    }
    bounds.minX = std::min(bounds.minX, x);
    bounds.minY = std::min(bounds.minY, y);
    bounds.maxX = std::max(bounds.maxX, x);
    bounds.maxY = std::max(bounds.maxY, y);
}

} // namespace

Point2D transformPoint(const Point2D& point, double dx, double dy, double angleDegrees, const Point2D& pivot)
{
    double x = point.x;
    double y = point.y;

    if (angleDegrees != 0.0) {
        const double radians = qDegreesToRadians(angleDegrees);
        const double c = std::cos(radians);
        const double s = std::sin(radians);

        const double relX = x - pivot.x;
        const double relY = y - pivot.y;

        x = relX * c - relY * s + pivot.x;
        y = relX * s + relY * c + pivot.y;
    }

    return Point2D{x + dx, y + dy};
}

QVector<Point2D> representativePoints(const SketchDocument& doc)
{
    QVector<Point2D> points;
    forEachRepresentativePoint(doc, [&points](const Point2D& p) { points.push_back(p); });
    return points;
}

Point2D sketchCentroid(const SketchDocument& doc)
{
    double sumX = 0.0;
    double sumY = 0.0;
    qsizetype count = 0;

    forEachRepresentativePoint(doc, [&](const Point2D& p) {
        sumX += p.x;
        sumY += p.y;
        ++count;
    });

    if (count == 0)
        return Point2D{};

    const auto n = static_cast<double>(count);
    return Point2D{sumX / n, sumY / n};
}

SketchBounds sketchBounds(const SketchDocument& doc)
{
    SketchBounds bounds;

    for (const Primitive& primitive : doc.primitives()) {
        if (const auto* circle = std::get_if<Circle>(&primitive.geometry)) {
            const double r = circle->radius;
            extendBounds(bounds, circle->center.x - r, circle->center.y - r);
            extendBounds(bounds, circle->center.x + r, circle->center.y + r);
            continue;
        }

        // Arcs use center and endpoints only, which can under-report a bulging arc.
        forEachGeometryPoint(primitive.geometry, [&bounds](const Point2D& p) {
            extendBounds(bounds, p.x, p.y);
        });
    }

    return bounds;
}

Point2D resolvePivot(const SketchDocument& doc, const TransformRequest& request)
{
    switch (request.pivotPolicy) {
        case PivotPolicy::Explicit:
            return request.pivot;
        case PivotPolicy::ComputedCentroid:
            return request.angleDegrees != 0.0 ? sketchCentroid(doc) : Point2D{};
        case PivotPolicy::Origin:
            break;
    }
    return Point2D{};
}

SketchDocument transformSketch(const SketchDocument& doc, const TransformRequest& request)
{
    SketchDocument out = doc;

    if (request.stripConstraints && !out.constraints().isEmpty()) {
        qCDebug(sketchlog).noquote() << "Stripping" << out.constraints().size()
                                     << "constraints from" << doc.name();
        out.clearConstraints();
    }

    // Pivot is resolved against the input document.
    const Point2D pivot = resolvePivot(doc, request);
    const double dx = request.dx;
    const double dy = request.dy;
    const double angle = request.angleDegrees;

    auto move = [&](Point2D& p) { p = transformPoint(p, dx, dy, angle, pivot); };

    out.forEachGeometry([&move](PrimitiveGeometry& geometry) {
        std::visit([&move](auto& g) {
            using T = std::decay_t<decltype(g)>;
            if constexpr (std::is_same_v<T, Line>) {
                move(g.start);
                move(g.end);
            } else if constexpr (std::is_same_v<T, Circle>) {
                move(g.center);
            } else if constexpr (std::is_same_v<T, Arc>) {
                move(g.center);
                move(g.startPoint);
                move(g.endPoint);
            } else if constexpr (std::is_same_v<T, Point>) {
                move(g.position);
            } else if constexpr (std::is_same_v<T, Spline>) {
                for (Point2D& cp : g.controlPoints)
                    move(cp);
            }
        }, geometry);
    });

    return out;
}

SketchDocument transformSketch(const SketchDocument& doc,
                               double dx,
                               double dy,
                               double angleDegrees,
                               PivotPolicy pivotPolicy,
                               bool stripConstraints)
{
    TransformRequest request;
    request.dx = dx;
    request.dy = dy;
    request.angleDegrees = angleDegrees;
    request.pivotPolicy = pivotPolicy;
    request.stripConstraints = stripConstraints;
    return transformSketch(doc, request);
}

SketchDocument translateSketch(const SketchDocument& doc, double dx, double dy)
{
    return transformSketch(doc, dx, dy, 0.0, PivotPolicy::Origin, false);
}

SketchDocument rotateSketch(const SketchDocument& doc, double angleDegrees, PivotPolicy pivotPolicy)
{
    return transformSketch(doc, 0.0, 0.0, angleDegrees, pivotPolicy, false);
}

} // namespace Sketch
