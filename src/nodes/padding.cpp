/*
 * padding.cpp — Insets a single child by fixed margins
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "padding.h"

namespace Layout {

Padding::Padding(const QMarginsF &insets, NodePtr child)
    : m_insets(insets)
    , m_child(std::move(child))
{
}

std::optional<LayoutResult> Padding::layout(const LayoutContext &context)
{
    const BoxConstraints &c = context.constraints;
    LayoutResult result;

    if (!m_child) {
        m_childSize = QSizeF();
        result.size = c.constrain(inflateSize(QSizeF(0, 0), m_insets));
        return result;
    }

    std::optional<LayoutResult> child = layoutChild(*m_child, context, c.deflate(m_insets));
    if (!child)
        return std::nullopt;
    m_childSize = child->size;

    result.size = c.constrain(inflateSize(child->size, m_insets));
    if (child->baseline)
        result.baseline = *child->baseline + m_insets.top();
    return result;
}

void Padding::paint(const PaintContext &context) const
{
    if (m_child)
        paintChild(*m_child, context, QPointF(m_insets.left(), m_insets.top()), m_childSize);
}

} // namespace Layout
