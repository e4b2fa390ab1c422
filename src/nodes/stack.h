/*
 * stack.h — Overlapping children (Stack) and explicit placement (Positioned)
 *
 * Non-positioned children size the stack; Positioned children are then
 * placed against its edges.  Each child paints in its own saved frame, so
 * siblings never see each other's transforms.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_STACK_H
#define FOLIO_STACK_H

#include <vector>

#include "alignment.h"
#include "node.h"

namespace Layout {

enum class StackFit {
    Loose,       // children may be smaller than the stack
    Expand,      // children are forced to the biggest allowed size
    Passthrough, // children get the stack's own constraints
};

class Positioned : public Node
{
public:
    explicit Positioned(NodePtr child);

    // Fills the stack, inset by the given margins
    static std::unique_ptr<Positioned> fill(NodePtr child, const QMarginsF &insets = QMarginsF());

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Positioned"); }

    void setLeft(std::optional<qreal> v) { m_left = v; }
    void setTop(std::optional<qreal> v) { m_top = v; }
    void setRight(std::optional<qreal> v) { m_right = v; }
    void setBottom(std::optional<qreal> v) { m_bottom = v; }
    void setWidth(std::optional<qreal> v) { m_width = v; }
    void setHeight(std::optional<qreal> v) { m_height = v; }

    std::optional<qreal> left() const { return m_left; }
    std::optional<qreal> top() const { return m_top; }
    std::optional<qreal> right() const { return m_right; }
    std::optional<qreal> bottom() const { return m_bottom; }
    std::optional<qreal> width() const { return m_width; }
    std::optional<qreal> height() const { return m_height; }

    Node *child() const { return m_child.get(); }

    // Constraints for this child inside a stack of the given size
    BoxConstraints constraintsIn(const QSizeF &stackSize) const;

private:
    NodePtr m_child;
    std::optional<qreal> m_left;
    std::optional<qreal> m_top;
    std::optional<qreal> m_right;
    std::optional<qreal> m_bottom;
    std::optional<qreal> m_width;
    std::optional<qreal> m_height;
    QSizeF m_childSize;
};

class Stack : public Node
{
public:
    Stack() = default;

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Stack"); }

    Stack *addChild(NodePtr child);
    const std::vector<NodePtr> &children() const { return m_children; }

    void setFit(StackFit fit) { m_fit = fit; }
    void setAlignment(Alignment alignment) { m_alignment = alignment; }
    StackFit fit() const { return m_fit; }
    Alignment alignment() const { return m_alignment; }

    QList<QRectF> childRects() const;

private:
    StackFit m_fit = StackFit::Loose;
    Alignment m_alignment = Alignment::topLeft();
    std::vector<NodePtr> m_children;
    QList<QSizeF> m_childSizes;
    QList<QPointF> m_childOffsets;
};

} // namespace Layout

#endif // FOLIO_STACK_H
