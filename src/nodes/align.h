/*
 * align.h — Positions a child inside the available space
 *
 * Align takes all the space it is offered on a bounded axis and places its
 * child by Alignment.  On an unbounded axis, or when a size factor is set,
 * it shrink-wraps the child instead.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_ALIGN_H
#define FOLIO_ALIGN_H

#include "alignment.h"
#include "node.h"

namespace Layout {

class Align : public Node
{
public:
    Align(Alignment alignment, NodePtr child = nullptr);

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Align"); }

    Alignment alignment() const { return m_alignment; }

    // Size as a multiple of the child's size on that axis
    void setWidthFactor(std::optional<qreal> factor) { m_widthFactor = factor; }
    void setHeightFactor(std::optional<qreal> factor) { m_heightFactor = factor; }

    Node *child() const { return m_child.get(); }

private:
    Alignment m_alignment;
    std::optional<qreal> m_widthFactor;
    std::optional<qreal> m_heightFactor;
    NodePtr m_child;
    QSizeF m_childSize;
    QPointF m_childOffset;
};

class Center : public Align
{
public:
    explicit Center(NodePtr child = nullptr)
        : Align(Alignment::center(), std::move(child))
    {
    }

    QString typeName() const override { return QStringLiteral("Center"); }
};

} // namespace Layout

#endif // FOLIO_ALIGN_H
