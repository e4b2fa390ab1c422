/*
 * sizedbox.h — Fixed-size box, optionally around a child
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_SIZEDBOX_H
#define FOLIO_SIZEDBOX_H

#include "node.h"

namespace Layout {

class SizedBox : public Node
{
public:
    SizedBox(std::optional<qreal> width, std::optional<qreal> height,
             NodePtr child = nullptr);

    // A box with no size of its own, used as a gap in rows and columns
    static NodePtr shrink() { return std::make_unique<SizedBox>(0, 0); }

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("SizedBox"); }

    std::optional<qreal> width() const { return m_width; }
    std::optional<qreal> height() const { return m_height; }
    Node *child() const { return m_child.get(); }

private:
    std::optional<qreal> m_width;
    std::optional<qreal> m_height;
    NodePtr m_child;
    QSizeF m_childSize;
};

} // namespace Layout

#endif // FOLIO_SIZEDBOX_H
