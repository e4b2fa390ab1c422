/*
 * padding.h — Insets a single child by fixed margins
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PADDING_H
#define FOLIO_PADDING_H

#include <QMarginsF>

#include "node.h"

namespace Layout {

class Padding : public Node
{
public:
    Padding(const QMarginsF &insets, NodePtr child = nullptr);

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Padding"); }

    QMarginsF insets() const { return m_insets; }
    Node *child() const { return m_child.get(); }

private:
    QMarginsF m_insets;
    NodePtr m_child;
    QSizeF m_childSize;
};

} // namespace Layout

#endif // FOLIO_PADDING_H
