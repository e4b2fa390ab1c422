/*
 * node.h — Layout protocol: contexts, results and the Node interface
 *
 * Every node answers two calls.  layout() chooses a size inside the
 * constraints it is given (and positions its children); paint() draws that
 * committed size onto the page.  Layout and paint are separate passes over
 * the tree: paint never triggers layout.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_NODE_H
#define FOLIO_NODE_H

#include <memory>
#include <optional>

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include "boxconstraints.h"

class FontMetrics;
struct Theme;

namespace Pdf { class FontRegistry; }
namespace Render { class PagePainter; }

namespace Layout {

class ConstraintSolver;

enum class TextDirection {
    LeftToRight,
    RightToLeft,
};

struct LayoutContext {
    BoxConstraints constraints;
    TextDirection textDirection = TextDirection::LeftToRight;
    const Theme *theme = nullptr;
    const FontMetrics *fontMetrics = nullptr;
    ConstraintSolver *solver = nullptr; // routes child layout when set

    LayoutContext withConstraints(const BoxConstraints &c) const
    {
        LayoutContext ctx = *this;
        ctx.constraints = c;
        return ctx;
    }
};

struct LayoutResult {
    QSizeF size;
    std::optional<qreal> baseline; // distance from the top edge
    bool needsRepaint = true;

    bool operator==(const LayoutResult &o) const
    {
        return size == o.size && baseline == o.baseline && needsRepaint == o.needsRepaint;
    }
};

struct PaintContext {
    QSizeF size;                           // the node's own committed size
    const Theme *theme = nullptr;
    Render::PagePainter *painter = nullptr; // owned by the page being painted
    Pdf::FontRegistry *fonts = nullptr;
    QSizeF pageSize;
    QRectF contentArea;

    PaintContext withSize(const QSizeF &s) const
    {
        PaintContext ctx = *this;
        ctx.size = s;
        return ctx;
    }
};

class Node
{
public:
    virtual ~Node();

    // std::nullopt means a descendant failed; the solver holds the reason
    virtual std::optional<LayoutResult> layout(const LayoutContext &context) = 0;
    virtual void paint(const PaintContext &context) const = 0;

    // Short kind name ("Padding", "Row", ...) used when no key/label is set
    virtual QString typeName() const = 0;

    QString key() const { return m_key; }
    void setKey(const QString &key) { m_key = key; }
    QString debugLabel() const { return m_debugLabel; }
    void setDebugLabel(const QString &label) { m_debugLabel = label; }

    // key, else debug label, else kind
    QString identity() const;

private:
    QString m_key;
    QString m_debugLabel;
};

using NodePtr = std::unique_ptr<Node>;

// Lay out a child under new constraints, through the solver when the
// context carries one.
std::optional<LayoutResult> layoutChild(Node &child, const LayoutContext &parent,
                                        const BoxConstraints &constraints);

// Paint a child in its own local frame at offset, bracketed by a
// save/restore pair.  Returns false if the child left the graphics state
// stack unbalanced.
bool paintChild(const Node &child, const PaintContext &parent,
                const QPointF &offset, const QSizeF &childSize);

} // namespace Layout

#endif // FOLIO_NODE_H
