// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sketch/SketchGlobal.hpp"
#include "sketch/SketchTypes.hpp"

#include <QtCore/QHash>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>
#include <utility>

namespace Sketch {

// Value type: copies are independent (Qt containers detach on write).
// Primitive ids are unique and keep their insertion order.
class SKETCH_EXPORT SketchDocument final {
public:
    SketchDocument() = default;
    explicit SketchDocument(QString name);

    const QString& name() const noexcept { return m_name; }
    void setName(QString name) { m_name = std::move(name); }

    QString addPrimitive(PrimitiveGeometry geometry, bool construction = false);
    bool insertPrimitive(const QString& id, PrimitiveGeometry geometry, bool construction = false);
    bool removePrimitive(const QString& id);

    bool contains(const QString& id) const { return m_indexById.contains(id); }
    const Primitive* primitive(const QString& id) const;
    const QVector<Primitive>& primitives() const noexcept { return m_primitives; }
    QStringList primitiveIds() const;
    qsizetype primitiveCount() const noexcept { return m_primitives.size(); }
    bool isEmpty() const noexcept { return m_primitives.isEmpty(); }

    template <typename Fn>
    void forEachGeometry(Fn&& fn)
    {
        for (Primitive& primitive : m_primitives)
            fn(primitive.geometry);
    }

    const QVector<Constraint>& constraints() const noexcept { return m_constraints; }
    void addConstraint(Constraint constraint) { m_constraints.push_back(std::move(constraint)); }
    void clearConstraints() { m_constraints.clear(); }

    const std::optional<SolverStatus>& solverStatus() const noexcept { return m_solverStatus; }
    void setSolverStatus(std::optional<SolverStatus> status) { m_solverStatus = std::move(status); }

    friend SKETCH_EXPORT bool operator==(const SketchDocument& lhs, const SketchDocument& rhs);

private:
    QString nextPrimitiveId(PrimitiveKind kind);
    void rebuildIndex();

    QString m_name;
    QVector<Primitive> m_primitives;
    QHash<QString, qsizetype> m_indexById;
    QVector<Constraint> m_constraints;
    std::optional<SolverStatus> m_solverStatus;
    int m_nextSerial = 0;
};

} // namespace Sketch

Q_DECLARE_METATYPE(Sketch::SketchDocument)
