/*
 * boxconstraints.h — Box constraints, edge insets and size arithmetic
 *
 * A BoxConstraints value bounds the width and height a parent allows a
 * child to choose.  Values are immutable once built: every helper returns
 * a fresh value.  Insets reuse QMarginsF (left, top, right, bottom).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_BOXCONSTRAINTS_H
#define FOLIO_BOXCONSTRAINTS_H

#include <optional>

#include <QDebug>
#include <QMarginsF>
#include <QSizeF>
#include <QtNumeric>

namespace Layout {

struct BoxConstraints {
    qreal minWidth = 0;
    qreal maxWidth = qInf();
    qreal minHeight = 0;
    qreal maxHeight = qInf();

    BoxConstraints() = default;
    BoxConstraints(qreal minW, qreal maxW, qreal minH, qreal maxH)
        : minWidth(minW), maxWidth(maxW), minHeight(minH), maxHeight(maxH) {}

    // --- Constructors ---

    static BoxConstraints tight(const QSizeF &size);
    static BoxConstraints loose(const QSizeF &size);
    // Fixed on the given axes, unbounded (0..inf) on the others
    static BoxConstraints expand(std::optional<qreal> width = std::nullopt,
                                 std::optional<qreal> height = std::nullopt);
    static BoxConstraints tightFor(std::optional<qreal> width = std::nullopt,
                                   std::optional<qreal> height = std::nullopt);

    // --- Queries ---

    /// min >= 0, max >= min on both axes and finite minimums.
    bool isValid() const;
    bool isTight() const { return minWidth == maxWidth && minHeight == maxHeight; }
    bool hasBoundedWidth() const { return !qIsInf(maxWidth); }
    bool hasBoundedHeight() const { return !qIsInf(maxHeight); }

    QSizeF constrain(const QSizeF &size) const;
    qreal constrainWidth(qreal width) const;
    qreal constrainHeight(qreal height) const;
    bool satisfies(const QSizeF &size) const;

    QSizeF smallest() const { return QSizeF(minWidth, minHeight); }
    // Unbounded axes fall back to their minimum
    QSizeF biggest() const;

    // --- Derivation ---

    BoxConstraints loosen() const;
    BoxConstraints deflate(const QMarginsF &insets) const;

    bool operator==(const BoxConstraints &o) const
    {
        return minWidth == o.minWidth && maxWidth == o.maxWidth
            && minHeight == o.minHeight && maxHeight == o.maxHeight;
    }
    bool operator!=(const BoxConstraints &o) const { return !(*this == o); }
};

QDebug operator<<(QDebug dbg, const BoxConstraints &c);

// --- Edge insets ---

inline QMarginsF insetsAll(qreal v) { return QMarginsF(v, v, v, v); }
inline QMarginsF insetsSymmetric(qreal horizontal, qreal vertical)
{
    return QMarginsF(horizontal, vertical, horizontal, vertical);
}
inline qreal horizontalInsets(const QMarginsF &m) { return m.left() + m.right(); }
inline qreal verticalInsets(const QMarginsF &m) { return m.top() + m.bottom(); }

QSizeF deflateSize(const QSizeF &size, const QMarginsF &insets);
QSizeF inflateSize(const QSizeF &size, const QMarginsF &insets);

} // namespace Layout

#endif // FOLIO_BOXCONSTRAINTS_H
