// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sketch/SketchDocument.hpp"
#include "sketch/SketchGlobal.hpp"

#include <utils/Result.hpp>

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Sketch {

inline constexpr int kSketchSchemaVersion = 1;

SKETCH_EXPORT QJsonObject serializeSketchDocument(const SketchDocument& doc);
SKETCH_EXPORT Utils::Result parseSketchDocument(const QJsonObject& json, SketchDocument& out);

SKETCH_EXPORT Utils::Result loadSketchFile(const QString& path, SketchDocument& out);
SKETCH_EXPORT Utils::Result saveSketchFile(const QString& path, const SketchDocument& doc);

} // namespace Sketch
