/*
 * container.h — Decorated box: fill, border, padding, margin, fixed size
 *
 * Layout order, outside in: margin, then the decorated box (optionally
 * fixed width/height), then border width and padding, then the child.
 * With an alignment set, the box fills the space it is offered and the
 * child is placed inside it.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_CONTAINER_H
#define FOLIO_CONTAINER_H

#include <QColor>
#include <QMarginsF>

#include "alignment.h"
#include "node.h"

namespace Layout {

class Container : public Node
{
public:
    explicit Container(NodePtr child = nullptr);

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Container"); }

    void setColor(const QColor &color) { m_color = color; }
    void setBorder(const QColor &color, qreal width)
    {
        m_borderColor = color;
        m_borderWidth = width;
    }
    void setPadding(const QMarginsF &padding) { m_padding = padding; }
    void setMargin(const QMarginsF &margin) { m_margin = margin; }
    void setAlignment(std::optional<Alignment> alignment) { m_alignment = alignment; }
    void setWidth(std::optional<qreal> width) { m_width = width; }
    void setHeight(std::optional<qreal> height) { m_height = height; }

    QColor color() const { return m_color; }
    QColor borderColor() const { return m_borderColor; }
    qreal borderWidth() const { return m_borderWidth; }
    QMarginsF padding() const { return m_padding; }
    QMarginsF margin() const { return m_margin; }
    Node *child() const { return m_child.get(); }

    // Rectangle of the decorated box within the node, after the last layout
    QRectF boxRect() const { return m_boxRect; }

private:
    QMarginsF contentInsets() const;

    NodePtr m_child;
    QColor m_color;
    QColor m_borderColor;
    qreal m_borderWidth = 0;
    QMarginsF m_padding;
    QMarginsF m_margin;
    std::optional<Alignment> m_alignment;
    std::optional<qreal> m_width;
    std::optional<qreal> m_height;

    QRectF m_boxRect;
    QPointF m_childOffset;
    QSizeF m_childSize;
};

} // namespace Layout

#endif // FOLIO_CONTAINER_H
