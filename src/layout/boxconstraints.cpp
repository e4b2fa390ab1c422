/*
 * boxconstraints.cpp — Box constraints, edge insets and size arithmetic
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "boxconstraints.h"

#include <QtGlobal>

namespace Layout {

BoxConstraints BoxConstraints::tight(const QSizeF &size)
{
    return {size.width(), size.width(), size.height(), size.height()};
}

BoxConstraints BoxConstraints::loose(const QSizeF &size)
{
    return {0, size.width(), 0, size.height()};
}

BoxConstraints BoxConstraints::expand(std::optional<qreal> width, std::optional<qreal> height)
{
    return {width.value_or(0), width.value_or(qInf()),
            height.value_or(0), height.value_or(qInf())};
}

BoxConstraints BoxConstraints::tightFor(std::optional<qreal> width, std::optional<qreal> height)
{
    return expand(width, height);
}

bool BoxConstraints::isValid() const
{
    // NaN fails every comparison below, so it is rejected too
    return minWidth >= 0 && maxWidth >= minWidth
        && minHeight >= 0 && maxHeight >= minHeight
        && qIsFinite(minWidth) && qIsFinite(minHeight);
}

qreal BoxConstraints::constrainWidth(qreal width) const
{
    return qMax(minWidth, qMin(maxWidth, width));
}

qreal BoxConstraints::constrainHeight(qreal height) const
{
    return qMax(minHeight, qMin(maxHeight, height));
}

QSizeF BoxConstraints::constrain(const QSizeF &size) const
{
    return QSizeF(constrainWidth(size.width()), constrainHeight(size.height()));
}

bool BoxConstraints::satisfies(const QSizeF &size) const
{
    return size.width() >= minWidth && size.width() <= maxWidth
        && size.height() >= minHeight && size.height() <= maxHeight;
}

QSizeF BoxConstraints::biggest() const
{
    return QSizeF(hasBoundedWidth() ? maxWidth : minWidth,
                  hasBoundedHeight() ? maxHeight : minHeight);
}

BoxConstraints BoxConstraints::loosen() const
{
    return {0, maxWidth, 0, maxHeight};
}

BoxConstraints BoxConstraints::deflate(const QMarginsF &insets) const
{
    const qreal h = horizontalInsets(insets);
    const qreal v = verticalInsets(insets);
    const qreal minW = qMax<qreal>(0, minWidth - h);
    const qreal minH = qMax<qreal>(0, minHeight - v);
    return {minW, qMax(minW, maxWidth - h), minH, qMax(minH, maxHeight - v)};
}

QDebug operator<<(QDebug dbg, const BoxConstraints &c)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "BoxConstraints(w: " << c.minWidth << ".." << c.maxWidth
                  << ", h: " << c.minHeight << ".." << c.maxHeight << ')';
    return dbg;
}

QSizeF deflateSize(const QSizeF &size, const QMarginsF &insets)
{
    return QSizeF(qMax<qreal>(0, size.width() - horizontalInsets(insets)),
                  qMax<qreal>(0, size.height() - verticalInsets(insets)));
}

QSizeF inflateSize(const QSizeF &size, const QMarginsF &insets)
{
    return QSizeF(size.width() + horizontalInsets(insets),
                  size.height() + verticalInsets(insets));
}

} // namespace Layout
