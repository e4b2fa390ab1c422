/*
 * flex.cpp — Linear layout of children along one axis (Row, Column)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "flex.h"

#include <QDebug>

namespace Layout {

// --- Expanded ---

Expanded::Expanded(NodePtr child, int flex)
    : m_child(std::move(child))
    , m_flex(qMax(1, flex))
{
}

std::optional<LayoutResult> Expanded::layout(const LayoutContext &context)
{
    const BoxConstraints &c = context.constraints;
    LayoutResult result;
    if (!m_child) {
        result.size = c.biggest();
        return result;
    }

    std::optional<LayoutResult> child = layoutChild(*m_child, context, c);
    if (!child)
        return std::nullopt;
    m_childSize = child->size;
    result.size = child->size;
    result.baseline = child->baseline;
    return result;
}

void Expanded::paint(const PaintContext &context) const
{
    if (m_child)
        paintChild(*m_child, context, QPointF(0, 0), m_childSize);
}

// --- Flex ---

Flex::Flex(Axis direction)
    : m_direction(direction)
{
}

Flex *Flex::addChild(NodePtr child)
{
    if (child)
        m_children.push_back(std::move(child));
    return this;
}

qreal Flex::mainOf(const QSizeF &s) const
{
    return m_direction == Axis::Horizontal ? s.width() : s.height();
}

qreal Flex::crossOf(const QSizeF &s) const
{
    return m_direction == Axis::Horizontal ? s.height() : s.width();
}

QSizeF Flex::sizeFor(qreal main, qreal cross) const
{
    return m_direction == Axis::Horizontal ? QSizeF(main, cross) : QSizeF(cross, main);
}

BoxConstraints Flex::constraintsFor(qreal minMain, qreal maxMain,
                                    qreal minCross, qreal maxCross) const
{
    if (m_direction == Axis::Horizontal)
        return BoxConstraints(minMain, maxMain, minCross, maxCross);
    return BoxConstraints(minCross, maxCross, minMain, maxMain);
}

std::optional<LayoutResult> Flex::layout(const LayoutContext &context)
{
    const BoxConstraints &c = context.constraints;
    const bool horizontal = m_direction == Axis::Horizontal;
    const qreal maxMain = horizontal ? c.maxWidth : c.maxHeight;
    const qreal minCross = horizontal ? c.minHeight : c.minWidth;
    const qreal maxCross = horizontal ? c.maxHeight : c.maxWidth;
    const bool mainBounded = !qIsInf(maxMain);
    const bool stretch = m_crossAxisAlignment == CrossAxisAlignment::Stretch && !qIsInf(maxCross);

    const int count = static_cast<int>(m_children.size());
    m_childSizes = QList<QSizeF>(count);
    m_childOffsets = QList<QPointF>(count);

    const qreal crossLo = stretch ? maxCross : 0;
    const qreal gaps = count > 1 ? m_spacing * (count - 1) : 0;

    // Pass 1: inflexible children
    qreal allocated = gaps;
    int totalFlex = 0;
    QList<LayoutResult> results(count);
    for (int i = 0; i < count; ++i) {
        auto *expanded = dynamic_cast<Expanded *>(m_children[i].get());
        if (expanded && mainBounded) {
            totalFlex += expanded->flex();
            continue;
        }
        std::optional<LayoutResult> r = layoutChild(*m_children[i], context,
                                                    constraintsFor(0, qInf(), crossLo, maxCross));
        if (!r)
            return std::nullopt;
        results[i] = *r;
        allocated += mainOf(r->size);
    }

    // Pass 2: flexible children share the free space
    if (totalFlex > 0) {
        const qreal free = qMax<qreal>(0, maxMain - allocated);
        const qreal perFlex = free / totalFlex;
        for (int i = 0; i < count; ++i) {
            auto *expanded = dynamic_cast<Expanded *>(m_children[i].get());
            if (!expanded)
                continue;
            const qreal main = perFlex * expanded->flex();
            std::optional<LayoutResult> r = layoutChild(*m_children[i], context,
                                                        constraintsFor(main, main, crossLo, maxCross));
            if (!r)
                return std::nullopt;
            results[i] = *r;
            allocated += main;
        }
    }

    qreal crossExtent = 0;
    for (const LayoutResult &r : results)
        crossExtent = qMax(crossExtent, crossOf(r.size));
    if (stretch)
        crossExtent = maxCross;
    crossExtent = qMax(crossExtent, minCross);

    const qreal idealMain = (m_mainAxisSize == MainAxisSize::Max && mainBounded) ? maxMain : allocated;
    const QSizeF size = c.constrain(sizeFor(idealMain, crossExtent));
    const qreal actualMain = mainOf(size);
    const qreal actualCross = crossOf(size);

    // Main-axis distribution
    const qreal remaining = qMax<qreal>(0, actualMain - allocated);
    qreal leading = 0;
    qreal between = m_spacing;
    switch (m_mainAxisAlignment) {
    case MainAxisAlignment::Start:
        break;
    case MainAxisAlignment::End:
        leading = remaining;
        break;
    case MainAxisAlignment::Center:
        leading = remaining / 2;
        break;
    case MainAxisAlignment::SpaceBetween:
        if (count > 1)
            between += remaining / (count - 1);
        break;
    case MainAxisAlignment::SpaceAround:
        if (count > 0) {
            leading = remaining / count / 2;
            between += remaining / count;
        }
        break;
    case MainAxisAlignment::SpaceEvenly:
        if (count > 0) {
            leading = remaining / (count + 1);
            between += remaining / (count + 1);
        }
        break;
    }

    qreal pos = leading;
    std::optional<qreal> baseline;
    for (int i = 0; i < count; ++i) {
        const QSizeF childSize = results[i].size;
        const qreal childCross = crossOf(childSize);
        qreal crossPos = 0;
        switch (m_crossAxisAlignment) {
        case CrossAxisAlignment::Start:
        case CrossAxisAlignment::Stretch:
            break;
        case CrossAxisAlignment::End:
            crossPos = actualCross - childCross;
            break;
        case CrossAxisAlignment::Center:
            crossPos = (actualCross - childCross) / 2;
            break;
        }

        m_childSizes[i] = childSize;
        m_childOffsets[i] = horizontal ? QPointF(pos, crossPos) : QPointF(crossPos, pos);
        if (!baseline && results[i].baseline)
            baseline = *results[i].baseline + m_childOffsets[i].y();
        pos += mainOf(childSize) + between;
    }

    if (allocated > actualMain + 0.01)
        qDebug() << "Flex:" << identity() << "overflows its main axis by" << allocated - actualMain;

    LayoutResult result;
    result.size = size;
    result.baseline = baseline;
    return result;
}

void Flex::paint(const PaintContext &context) const
{
    const int count = qMin(static_cast<int>(m_children.size()), static_cast<int>(m_childSizes.size()));
    for (int i = 0; i < count; ++i) {
        if (!paintChild(*m_children[i], context, m_childOffsets[i], m_childSizes[i]))
            return;
    }
}

QList<QRectF> Flex::childRects() const
{
    QList<QRectF> rects;
    for (int i = 0; i < m_childSizes.size(); ++i)
        rects.append(QRectF(m_childOffsets[i], m_childSizes[i]));
    return rects;
}

} // namespace Layout
