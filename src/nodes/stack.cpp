/*
 * stack.cpp — Overlapping children (Stack) and explicit placement (Positioned)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stack.h"
#include "constraintsolver.h"

namespace Layout {

// --- Positioned ---

Positioned::Positioned(NodePtr child)
    : m_child(std::move(child))
{
}

std::unique_ptr<Positioned> Positioned::fill(NodePtr child, const QMarginsF &insets)
{
    auto p = std::make_unique<Positioned>(std::move(child));
    p->setLeft(insets.left());
    p->setTop(insets.top());
    p->setRight(insets.right());
    p->setBottom(insets.bottom());
    return p;
}

BoxConstraints Positioned::constraintsIn(const QSizeF &stackSize) const
{
    BoxConstraints c;
    if (m_left && m_right) {
        const qreal w = qMax<qreal>(0, stackSize.width() - *m_left - *m_right);
        c.minWidth = c.maxWidth = w;
    } else if (m_width) {
        c.minWidth = c.maxWidth = qMax<qreal>(0, *m_width);
    }
    if (m_top && m_bottom) {
        const qreal h = qMax<qreal>(0, stackSize.height() - *m_top - *m_bottom);
        c.minHeight = c.maxHeight = h;
    } else if (m_height) {
        c.minHeight = c.maxHeight = qMax<qreal>(0, *m_height);
    }
    return c;
}

// Outside a stack a Positioned is transparent
std::optional<LayoutResult> Positioned::layout(const LayoutContext &context)
{
    LayoutResult result;
    if (!m_child) {
        result.size = context.constraints.smallest();
        return result;
    }

    std::optional<LayoutResult> child = layoutChild(*m_child, context, context.constraints);
    if (!child)
        return std::nullopt;
    m_childSize = child->size;
    result.size = child->size;
    result.baseline = child->baseline;
    return result;
}

void Positioned::paint(const PaintContext &context) const
{
    if (m_child)
        paintChild(*m_child, context, QPointF(0, 0), m_childSize);
}

// --- Stack ---

Stack *Stack::addChild(NodePtr child)
{
    if (child)
        m_children.push_back(std::move(child));
    return this;
}

std::optional<LayoutResult> Stack::layout(const LayoutContext &context)
{
    const BoxConstraints &c = context.constraints;
    const int count = static_cast<int>(m_children.size());
    m_childSizes = QList<QSizeF>(count);
    m_childOffsets = QList<QPointF>(count);

    BoxConstraints childConstraints;
    switch (m_fit) {
    case StackFit::Loose:
        childConstraints = c.loosen();
        break;
    case StackFit::Expand:
        childConstraints = BoxConstraints::tight(c.biggest());
        break;
    case StackFit::Passthrough:
        childConstraints = c;
        break;
    }

    // Non-positioned children decide the stack's size
    QList<LayoutResult> sizing;
    for (int i = 0; i < count; ++i) {
        if (dynamic_cast<Positioned *>(m_children[i].get()))
            continue;
        std::optional<LayoutResult> r = layoutChild(*m_children[i], context, childConstraints);
        if (!r)
            return std::nullopt;
        m_childSizes[i] = r->size;
        sizing.append(*r);
    }

    const QSizeF size = sizing.isEmpty()
        ? c.biggest()
        : ConstraintSolver::negotiateSize(sizing, c, SizeStrategy::Fit);

    for (int i = 0; i < count; ++i) {
        auto *positioned = dynamic_cast<Positioned *>(m_children[i].get());
        if (!positioned) {
            m_childOffsets[i] = m_alignment.resolve(size, m_childSizes[i]);
            continue;
        }

        std::optional<LayoutResult> r = layoutChild(*positioned, context,
                                                    positioned->constraintsIn(size));
        if (!r)
            return std::nullopt;
        const QSizeF childSize = r->size;
        m_childSizes[i] = childSize;

        const QPointF aligned = m_alignment.resolve(size, childSize);
        qreal x = aligned.x();
        if (positioned->left())
            x = *positioned->left();
        else if (positioned->right())
            x = size.width() - *positioned->right() - childSize.width();

        qreal y = aligned.y();
        if (positioned->top())
            y = *positioned->top();
        else if (positioned->bottom())
            y = size.height() - *positioned->bottom() - childSize.height();

        m_childOffsets[i] = QPointF(x, y);
    }

    LayoutResult result;
    result.size = size;
    return result;
}

void Stack::paint(const PaintContext &context) const
{
    const int count = qMin(static_cast<int>(m_children.size()), static_cast<int>(m_childSizes.size()));
    for (int i = 0; i < count; ++i) {
        if (!paintChild(*m_children[i], context, m_childOffsets[i], m_childSizes[i]))
            return;
    }
}

QList<QRectF> Stack::childRects() const
{
    QList<QRectF> rects;
    for (int i = 0; i < m_childSizes.size(); ++i)
        rects.append(QRectF(m_childOffsets[i], m_childSizes[i]));
    return rects;
}

} // namespace Layout
