/*
 * alignment.cpp — Nine-point alignment of a child inside a container
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "alignment.h"

#include <QHash>

namespace Layout {

QPointF Alignment::resolve(const QSizeF &container, const QSizeF &child) const
{
    const qreal halfDx = (container.width() - child.width()) / 2.0;
    const qreal halfDy = (container.height() - child.height()) / 2.0;
    return QPointF(halfDx + x * halfDx, halfDy + y * halfDy);
}

Alignment Alignment::fromName(const QString &name, bool *ok)
{
    static const QHash<QString, Alignment> names = {
        {QStringLiteral("top-left"), topLeft()},
        {QStringLiteral("top-center"), topCenter()},
        {QStringLiteral("top-right"), topRight()},
        {QStringLiteral("center-left"), centerLeft()},
        {QStringLiteral("center"), center()},
        {QStringLiteral("center-right"), centerRight()},
        {QStringLiteral("bottom-left"), bottomLeft()},
        {QStringLiteral("bottom-center"), bottomCenter()},
        {QStringLiteral("bottom-right"), bottomRight()},
    };

    const auto it = names.constFind(name.trimmed().toLower());
    if (ok)
        *ok = (it != names.constEnd());
    return it != names.constEnd() ? it.value() : center();
}

} // namespace Layout
