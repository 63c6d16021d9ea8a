// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "cadbridge/api/CadBridgeTypes.hpp"

#include <QtCore/QStringList>

namespace CadBridge {

using namespace Qt::StringLiterals;

QVector<PlaneInfo> defaultPlanes()
{
    return {
        PlaneInfo{u"XY"_s, u"XY Plane"_s, u"standard"_s},
        PlaneInfo{u"XZ"_s, u"XZ Plane"_s, u"standard"_s},
        PlaneInfo{u"YZ"_s, u"YZ Plane"_s, u"standard"_s}
    };
}

QString statusSummary(const CadStatus& status)
{
    QStringList parts;

    const QString document = status.value(QString(kStatusActiveDocumentKey)).toString();
    if (!document.isEmpty())
        parts.push_back(document);

    if (status.contains(QString(kStatusSketchCountKey)))
        parts.push_back(QStringLiteral("%1 sketches").arg(status.value(QString(kStatusSketchCountKey)).toInt()));

    if (parts.isEmpty())
        return u"Connected"_s;
    return parts.join(u" | "_s);
}

} // namespace CadBridge
