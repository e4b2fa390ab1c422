/*
 * container.cpp — Decorated box: fill, border, padding, margin, fixed size
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "container.h"
#include "constraintsolver.h"
#include "pagepainter.h"

namespace Layout {

Container::Container(NodePtr child)
    : m_child(std::move(child))
{
}

QMarginsF Container::contentInsets() const
{
    return m_padding + insetsAll(m_borderWidth);
}

std::optional<LayoutResult> Container::layout(const LayoutContext &context)
{
    const BoxConstraints outer = context.constraints.deflate(m_margin);

    ChildRequirements req;
    req.width = m_width;
    req.minWidth = m_width;
    req.height = m_height;
    req.minHeight = m_height;
    const BoxConstraints box = ConstraintSolver::propagateConstraints(outer, req);
    const QMarginsF insets = contentInsets();
    const BoxConstraints inner = box.deflate(insets);

    QSizeF content;
    std::optional<qreal> childBaseline;
    m_childOffset = QPointF(0, 0);

    if (!m_child) {
        m_childSize = QSizeF();
        content = inner.biggest();
    } else if (m_alignment) {
        std::optional<LayoutResult> child = layoutChild(*m_child, context, inner.loosen());
        if (!child)
            return std::nullopt;
        m_childSize = child->size;
        content = inner.constrain(QSizeF(inner.hasBoundedWidth() ? inner.maxWidth : m_childSize.width(),
                                         inner.hasBoundedHeight() ? inner.maxHeight : m_childSize.height()));
        m_childOffset = m_alignment->resolve(content, m_childSize);
        childBaseline = child->baseline;
    } else {
        std::optional<LayoutResult> child = layoutChild(*m_child, context, inner);
        if (!child)
            return std::nullopt;
        m_childSize = child->size;
        content = m_childSize;
        childBaseline = child->baseline;
    }

    const QSizeF boxSize = box.constrain(inflateSize(content, insets));
    m_boxRect = QRectF(QPointF(m_margin.left(), m_margin.top()), boxSize);
    m_childOffset += QPointF(m_margin.left() + insets.left(), m_margin.top() + insets.top());

    LayoutResult result;
    result.size = context.constraints.constrain(inflateSize(boxSize, m_margin));
    if (childBaseline)
        result.baseline = *childBaseline + m_childOffset.y();
    return result;
}

void Container::paint(const PaintContext &context) const
{
    if (context.painter) {
        // The border band lies inside the box
        const qreal half = m_borderWidth / 2;
        if (m_color.isValid())
            context.painter->drawRect(m_boxRect, m_color);
        if (m_borderColor.isValid() && m_borderWidth > 0)
            context.painter->drawRect(m_boxRect.adjusted(half, half, -half, -half),
                                      QColor(), m_borderColor, m_borderWidth);
    }

    if (m_child)
        paintChild(*m_child, context, m_childOffset, m_childSize);
}

} // namespace Layout
