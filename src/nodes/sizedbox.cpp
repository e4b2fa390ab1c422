/*
 * sizedbox.cpp — Fixed-size box, optionally around a child
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sizedbox.h"
#include "constraintsolver.h"

namespace Layout {

SizedBox::SizedBox(std::optional<qreal> width, std::optional<qreal> height, NodePtr child)
    : m_width(width)
    , m_height(height)
    , m_child(std::move(child))
{
}

std::optional<LayoutResult> SizedBox::layout(const LayoutContext &context)
{
    ChildRequirements req;
    req.width = m_width;
    req.minWidth = m_width;
    req.height = m_height;
    req.minHeight = m_height;
    const BoxConstraints inner = ConstraintSolver::propagateConstraints(context.constraints, req);

    if (!m_child) {
        LayoutResult result;
        result.size = inner.smallest();
        return result;
    }

    std::optional<LayoutResult> child = layoutChild(*m_child, context, inner);
    if (!child)
        return std::nullopt;
    m_childSize = child->size;

    LayoutResult result;
    result.size = child->size;
    result.baseline = child->baseline;
    return result;
}

void SizedBox::paint(const PaintContext &context) const
{
    if (m_child)
        paintChild(*m_child, context, QPointF(0, 0), m_childSize);
}

} // namespace Layout
