/*
 * textnode.h — Word-wrapped run of text in a single style
 *
 * Lines break at ICU line-break opportunities and at '\n'.  A word wider
 * than the available width is kept on a line of its own and overflows.
 * Horizontal alignment follows Qt's convention: AlignLeft/AlignRight
 * follow the text direction unless Qt::AlignAbsolute is set.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_TEXTNODE_H
#define FOLIO_TEXTNODE_H

#include <QList>
#include <QString>

#include "node.h"
#include "theme.h"

namespace Layout {

class Text : public Node
{
public:
    struct Line {
        QString text;
        qreal width = 0;
    };

    explicit Text(const QString &text);
    Text(const QString &text, const TextStyle &style);

    std::optional<LayoutResult> layout(const LayoutContext &context) override;
    void paint(const PaintContext &context) const override;
    QString typeName() const override { return QStringLiteral("Text"); }

    QString text() const { return m_text; }

    // Without an explicit style the theme's default text style is used
    void setStyle(const TextStyle &style) { m_style = style; }
    std::optional<TextStyle> style() const { return m_style; }

    void setAlignment(Qt::Alignment alignment) { m_alignment = alignment; }
    Qt::Alignment alignment() const { return m_alignment; }

    // Result of the last layout
    QList<Line> lines() const { return m_lines; }
    qreal lineAdvance() const { return m_lineAdvance; }

    // UTF-16 offsets where a line may start, always including 0 and the length
    static QList<int> breakOpportunities(const QString &text);

    static QList<Line> breakLines(const QString &text, const FontMetrics &metrics,
                                  const TextStyle &style, qreal maxWidth);

private:
    TextStyle resolvedStyle(const Theme *theme) const;
    qreal lineOffset(const Line &line, qreal width) const;

    QString m_text;
    std::optional<TextStyle> m_style;
    Qt::Alignment m_alignment = Qt::AlignLeft;

    TextStyle m_resolved;
    TextDirection m_direction = TextDirection::LeftToRight;
    QList<Line> m_lines;
    qreal m_lineAdvance = 0;
    qreal m_baselineOffset = 0;
};

} // namespace Layout

#endif // FOLIO_TEXTNODE_H
