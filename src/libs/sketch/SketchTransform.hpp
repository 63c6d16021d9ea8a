// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sketch/SketchDocument.hpp"
#include "sketch/SketchGlobal.hpp"
#include "sketch/SketchTypes.hpp"

#include <QtCore/QVector>

namespace Sketch {

enum class PivotPolicy : unsigned char {
    Origin,
    ComputedCentroid,
    Explicit
};

struct TransformRequest final {
    double dx = 0.0;
    double dy = 0.0;
    double angleDegrees = 0.0;  // counter-clockwise
    PivotPolicy pivotPolicy = PivotPolicy::ComputedCentroid;
    Point2D pivot;              // used with PivotPolicy::Explicit only
    bool stripConstraints = false;

    bool movesGeometry() const noexcept { return dx != 0.0 || dy != 0.0 || angleDegrees != 0.0; }
    bool isIdentity() const noexcept { return !movesGeometry() && !stripConstraints; }
};

struct SketchBounds final {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = 0.0;
    double maxY = 0.0;
    bool empty = true;

    double width() const noexcept { return maxX - minX; }
    double height() const noexcept { return maxY - minY; }
};

// Rotates about pivot first, then translates; the pivot lives in the untransformed frame.
SKETCH_EXPORT Point2D transformPoint(const Point2D& point,
                                     double dx,
                                     double dy,
                                     double angleDegrees,
                                     const Point2D& pivot = {});

// Line endpoints, circle centers, arc centers and endpoints, point positions, spline control points.
SKETCH_EXPORT QVector<Point2D> representativePoints(const SketchDocument& doc);

// Mean of representativePoints(); the origin when the sketch has none.
SKETCH_EXPORT Point2D sketchCentroid(const SketchDocument& doc);

SKETCH_EXPORT SketchBounds sketchBounds(const SketchDocument& doc);

SKETCH_EXPORT Point2D resolvePivot(const SketchDocument& doc, const TransformRequest& request);

/// Returns a transformed copy of doc; doc itself is never modified.
/// Constraints are dropped from the copy when stripConstraints is set.
SKETCH_EXPORT SketchDocument transformSketch(const SketchDocument& doc, const TransformRequest& request);

SKETCH_EXPORT SketchDocument transformSketch(const SketchDocument& doc,
                                             double dx,
                                             double dy,
                                             double angleDegrees,
                                             PivotPolicy pivotPolicy,
                                             bool stripConstraints);

SKETCH_EXPORT SketchDocument translateSketch(const SketchDocument& doc, double dx, double dy);

SKETCH_EXPORT SketchDocument rotateSketch(const SketchDocument& doc,
                                          double angleDegrees,
                                          PivotPolicy pivotPolicy = PivotPolicy::ComputedCentroid);

} // namespace Sketch
