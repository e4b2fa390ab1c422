/*
 * node.cpp — Layout protocol helpers
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "node.h"
#include "constraintsolver.h"
#include "pagepainter.h"

#include <QDebug>

namespace Layout {

Node::~Node() = default;

QString Node::identity() const
{
    if (!m_key.isEmpty())
        return m_key;
    if (!m_debugLabel.isEmpty())
        return m_debugLabel;
    return typeName();
}

std::optional<LayoutResult> layoutChild(Node &child, const LayoutContext &parent,
                                        const BoxConstraints &constraints)
{
    LayoutContext ctx = parent.withConstraints(constraints);
    if (ctx.solver)
        return ctx.solver->solveLayout(child, ctx);

    if (!constraints.isValid()) {
        qWarning() << "Layout: invalid constraints for" << child.identity() << constraints;
        return std::nullopt;
    }
    return child.layout(ctx);
}

bool paintChild(const Node &child, const PaintContext &parent,
                const QPointF &offset, const QSizeF &childSize)
{
    Render::PagePainter *painter = parent.painter;
    if (!painter) {
        child.paint(parent.withSize(childSize));
        return true;
    }

    const int depthBefore = painter->depth();
    painter->saveContext();
    painter->translate(offset.x(), offset.y());
    child.paint(parent.withSize(childSize));
    const bool restored = painter->restoreContext();

    // A failed restore means the child already popped our save
    int residual = painter->depth() - depthBefore;
    if (!restored)
        --residual;
    if (residual != 0) {
        painter->reportUnbalanced(child.identity(), residual);
        return false;
    }
    return true;
}

} // namespace Layout
