/*
 * alignment.h — Nine-point alignment of a child inside a container
 *
 * x and y range from -1 (left/top) to 1 (right/bottom); 0 is centered.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_ALIGNMENT_H
#define FOLIO_ALIGNMENT_H

#include <QPointF>
#include <QSizeF>
#include <QString>

namespace Layout {

struct Alignment {
    qreal x = 0;
    qreal y = 0;

    constexpr Alignment() = default;
    constexpr Alignment(qreal ax, qreal ay) : x(ax), y(ay) {}

    static constexpr Alignment topLeft() { return {-1, -1}; }
    static constexpr Alignment topCenter() { return {0, -1}; }
    static constexpr Alignment topRight() { return {1, -1}; }
    static constexpr Alignment centerLeft() { return {-1, 0}; }
    static constexpr Alignment center() { return {0, 0}; }
    static constexpr Alignment centerRight() { return {1, 0}; }
    static constexpr Alignment bottomLeft() { return {-1, 1}; }
    static constexpr Alignment bottomCenter() { return {0, 1}; }
    static constexpr Alignment bottomRight() { return {1, 1}; }

    // Offset of the child's top-left corner inside the container
    QPointF resolve(const QSizeF &container, const QSizeF &child) const;

    // "top-left", "center", "bottom-right", ...; unknown names give center
    static Alignment fromName(const QString &name, bool *ok = nullptr);

    bool operator==(const Alignment &o) const { return x == o.x && y == o.y; }
    bool operator!=(const Alignment &o) const { return !(*this == o); }
};

} // namespace Layout

#endif // FOLIO_ALIGNMENT_H
