/*
 * align.cpp — Positions a child inside the available space
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "align.h"

namespace Layout {

Align::Align(Alignment alignment, NodePtr child)
    : m_alignment(alignment)
    , m_child(std::move(child))
{
}

std::optional<LayoutResult> Align::layout(const LayoutContext &context)
{
    const BoxConstraints &c = context.constraints;
    const bool shrinkWidth = m_widthFactor.has_value() || !c.hasBoundedWidth();
    const bool shrinkHeight = m_heightFactor.has_value() || !c.hasBoundedHeight();

    LayoutResult result;
    if (!m_child) {
        result.size = c.constrain(QSizeF(shrinkWidth ? 0 : c.maxWidth,
                                         shrinkHeight ? 0 : c.maxHeight));
        return result;
    }

    std::optional<LayoutResult> child = layoutChild(*m_child, context, c.loosen());
    if (!child)
        return std::nullopt;
    m_childSize = child->size;

    const qreal w = shrinkWidth ? m_childSize.width() * m_widthFactor.value_or(1.0) : c.maxWidth;
    const qreal h = shrinkHeight ? m_childSize.height() * m_heightFactor.value_or(1.0) : c.maxHeight;
    result.size = c.constrain(QSizeF(w, h));

    m_childOffset = m_alignment.resolve(result.size, m_childSize);
    if (child->baseline)
        result.baseline = *child->baseline + m_childOffset.y();
    return result;
}

void Align::paint(const PaintContext &context) const
{
    if (m_child)
        paintChild(*m_child, context, m_childOffset, m_childSize);
}

} // namespace Layout
