// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sketch/SketchDocument.hpp"

#include <type_traits>

namespace Sketch {

namespace {

using namespace Qt::StringLiterals;

static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(PrimitiveKind::Line), PrimitiveGeometry>, Line>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(PrimitiveKind::Circle), PrimitiveGeometry>, Circle>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(PrimitiveKind::Arc), PrimitiveGeometry>, Arc>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(PrimitiveKind::Point), PrimitiveGeometry>, Point>);
static_assert(std::is_same_v<std::variant_alternative_t<static_cast<std::size_t>(PrimitiveKind::Spline), PrimitiveGeometry>, Spline>);

QString idPrefix(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Line: return u"L"_s;
        case PrimitiveKind::Circle: return u"C"_s;
        case PrimitiveKind::Arc: return u"A"_s;
        case PrimitiveKind::Point: return u"P"_s;
        case PrimitiveKind::Spline: return u"S"_s;
    }
    return u"G"_s;
}

} // namespace

QString primitiveKindToString(PrimitiveKind kind)
{
    switch (kind) {
        case PrimitiveKind::Line: return u"line"_s;
        case PrimitiveKind::Circle: return u"circle"_s;
        case PrimitiveKind::Arc: return u"arc"_s;
        case PrimitiveKind::Point: return u"point"_s;
        case PrimitiveKind::Spline: return u"spline"_s;
    }
    return u"line"_s;
}

bool primitiveKindFromString(const QString& text, PrimitiveKind& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"line"_s) {
        out = PrimitiveKind::Line;
        return true;
    }
    if (key == u"circle"_s) {
        out = PrimitiveKind::Circle;
        return true;
    }
    if (key == u"arc"_s) {
        out = PrimitiveKind::Arc;
        return true;
    }
    if (key == u"point"_s) {
        out = PrimitiveKind::Point;
        return true;
    }
    if (key == u"spline"_s || key == u"bspline"_s) {
        out = PrimitiveKind::Spline;
        return true;
    }
    return false;
}

SketchDocument::SketchDocument(QString name)
    : m_name(std::move(name))
{
}

QString SketchDocument::addPrimitive(PrimitiveGeometry geometry, bool construction)
{
    const auto kind = static_cast<PrimitiveKind>(geometry.index());
    const QString id = nextPrimitiveId(kind);
    insertPrimitive(id, std::move(geometry), construction);
    return id;
}

bool SketchDocument::insertPrimitive(const QString& id, PrimitiveGeometry geometry, bool construction)
{
    if (id.trimmed().isEmpty() || m_indexById.contains(id))
        return false;

    m_indexById.insert(id, m_primitives.size());
    m_primitives.push_back(Primitive{id, std::move(geometry), construction});
    return true;
}

bool SketchDocument::removePrimitive(const QString& id)
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.constEnd())
        return false;

    m_primitives.removeAt(it.value());
    rebuildIndex();
    return true;
}

const Primitive* SketchDocument::primitive(const QString& id) const
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.constEnd())
        return nullptr;
    return &m_primitives.at(it.value());
}

QStringList SketchDocument::primitiveIds() const
{
    QStringList ids;
    ids.reserve(m_primitives.size());
    for (const Primitive& primitive : m_primitives)
        ids.push_back(primitive.id);
    return ids;
}

QString SketchDocument::nextPrimitiveId(PrimitiveKind kind)
{
    const QString prefix = idPrefix(kind);
    QString candidate;
    do {
        candidate = prefix + QString::number(m_nextSerial++);
    } while (m_indexById.contains(candidate));
    return candidate;
}

void SketchDocument::rebuildIndex()
{
    m_indexById.clear();
    for (qsizetype i = 0; i < m_primitives.size(); ++i)
        m_indexById.insert(m_primitives.at(i).id, i);
}

bool operator==(const SketchDocument& lhs, const SketchDocument& rhs)
{
    return lhs.m_name == rhs.m_name
        && lhs.m_primitives == rhs.m_primitives
        && lhs.m_constraints == rhs.m_constraints
        && lhs.m_solverStatus == rhs.m_solverStatus;
}

} // namespace Sketch
