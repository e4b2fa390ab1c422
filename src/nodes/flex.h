/*
 * flex.h — Linear layout of children along one axis (Row, Column)
 *
 * Children are laid out in two passes.  Inflexible children get the
 * cross-axis constraint and an unbounded main axis; Expanded children then
 * share whatever main-axis space is left, in proportion to their flex
 * factors.  Flex children on an unbounded main axis are treated as
 * inflexible.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_FLEX_H
#define FOLIO_FLEX_H

#include <vector>

#include "constraintsolver.h"
#include "node.h"

namespace Layout {

enum class MainAxisAlignment {
    Start,
    End,
    Center,
    SpaceBetween,
    SpaceAround,
    SpaceEvenly,
};

enum class CrossAxisAlignment {
    Start,
    End,
    Center,
    Stretch,
};

enum class MainAxisSize {
    Min, // shrink-wrap the children
    Max, // take the whole bounded main axis
};

// Marks a Flex child that fills the remaining main-axis space
class Expanded : public Node
{
public:
    explicit Expanded(NodePtr child, int flex = 1);

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Expanded"); }

    int flex() const { return m_flex; }
    Node *child() const { return m_child.get(); }

private:
    NodePtr m_child;
    int m_flex;
    QSizeF m_childSize;
};

class Flex : public Node
{
public:
    explicit Flex(Axis direction);

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Flex"); }

    Flex *addChild(NodePtr child);
    const std::vector<NodePtr> &children() const { return m_children; }

    Axis direction() const { return m_direction; }

    void setMainAxisAlignment(MainAxisAlignment a) { m_mainAxisAlignment = a; }
    void setCrossAxisAlignment(CrossAxisAlignment a) { m_crossAxisAlignment = a; }
    void setMainAxisSize(MainAxisSize s) { m_mainAxisSize = s; }
    void setSpacing(qreal spacing) { m_spacing = spacing; }

    MainAxisAlignment mainAxisAlignment() const { return m_mainAxisAlignment; }
    CrossAxisAlignment crossAxisAlignment() const { return m_crossAxisAlignment; }
    MainAxisSize mainAxisSize() const { return m_mainAxisSize; }
    qreal spacing() const { return m_spacing; }

    // Child placement from the last layout, in this node's frame
    QList<QRectF> childRects() const;

private:
    qreal mainOf(const QSizeF &s) const;
    qreal crossOf(const QSizeF &s) const;
    QSizeF sizeFor(qreal main, qreal cross) const;
    BoxConstraints constraintsFor(qreal minMain, qreal maxMain,
                                  qreal minCross, qreal maxCross) const;

    Axis m_direction;
    MainAxisAlignment m_mainAxisAlignment = MainAxisAlignment::Start;
    CrossAxisAlignment m_crossAxisAlignment = CrossAxisAlignment::Center;
    MainAxisSize m_mainAxisSize = MainAxisSize::Max;
    qreal m_spacing = 0;

    std::vector<NodePtr> m_children;
    QList<QSizeF> m_childSizes;
    QList<QPointF> m_childOffsets;
};

class Row : public Flex
{
public:
    Row() : Flex(Axis::Horizontal) {}
    QString typeName() const override { return QStringLiteral("Row"); }
};

class Column : public Flex
{
public:
    Column() : Flex(Axis::Vertical) {}
    QString typeName() const override { return QStringLiteral("Column"); }
};

} // namespace Layout

#endif // FOLIO_FLEX_H
