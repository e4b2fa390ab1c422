/*
 * textnode.cpp — Word-wrapped run of text in a single style
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textnode.h"
#include "pagepainter.h"

#include <QDebug>

#include <memory>

#include <unicode/brkiter.h>
#include <unicode/unistr.h>

namespace Layout {

static QString chopTrailingSpaces(const QString &s)
{
    int end = s.size();
    while (end > 0 && s.at(end - 1).isSpace())
        --end;
    return s.left(end);
}

Text::Text(const QString &text)
    : m_text(text)
{
}

Text::Text(const QString &text, const TextStyle &style)
    : m_text(text)
    , m_style(style)
{
}

TextStyle Text::resolvedStyle(const Theme *theme) const
{
    if (m_style)
        return *m_style;
    if (theme)
        return theme->defaultTextStyle;
    return TextStyle();
}

// --- Line breaking ---

QList<int> Text::breakOpportunities(const QString &text)
{
    QList<int> positions;
    positions.append(0);
    if (text.isEmpty())
        return positions;

    UErrorCode err = U_ZERO_ERROR;
    icu::UnicodeString ustr(reinterpret_cast<const UChar *>(text.utf16()), text.length());
    std::unique_ptr<icu::BreakIterator> lineBreakIter(
        icu::BreakIterator::createLineInstance(icu::Locale::getDefault(), err));

    if (U_FAILURE(err) || !lineBreakIter) {
        qWarning() << "Text: ICU line breaker unavailable:" << u_errorName(err);
        // Fall back to breaking after runs of spaces
        for (int i = 1; i < text.size(); ++i) {
            if (text.at(i - 1).isSpace() && !text.at(i).isSpace())
                positions.append(i);
        }
        positions.append(text.size());
        return positions;
    }

    lineBreakIter->setText(ustr);
    for (int32_t pos = lineBreakIter->next(); pos != icu::BreakIterator::DONE;
         pos = lineBreakIter->next()) {
        positions.append(pos);
    }
    if (positions.last() != text.size())
        positions.append(text.size());
    return positions;
}

QList<Text::Line> Text::breakLines(const QString &text, const FontMetrics &metrics,
                                   const TextStyle &style, qreal maxWidth)
{
    QList<Line> lines;
    auto commit = [&](const QString &s) {
        Line line;
        line.text = chopTrailingSpaces(s);
        line.width = metrics.textWidth(style.font, line.text, style.fontSize);
        lines.append(line);
    };

    const QStringList paragraphs = text.split(QLatin1Char('\n'));
    for (const QString &para : paragraphs) {
        if (para.isEmpty()) {
            lines.append(Line());
            continue;
        }

        const QList<int> breaks = breakOpportunities(para);
        int lineStart = 0;
        int lineEnd = 0; // last accepted break on the current line
        for (int k = 1; k < breaks.size(); ++k) {
            const int pos = breaks.at(k);
            const QString candidate = chopTrailingSpaces(para.mid(lineStart, pos - lineStart));
            const qreal w = metrics.textWidth(style.font, candidate, style.fontSize);
            if (w > maxWidth && lineEnd > lineStart) {
                commit(para.mid(lineStart, lineEnd - lineStart));
                lineStart = lineEnd;
            }
            lineEnd = pos;
        }
        commit(para.mid(lineStart));
    }
    return lines;
}

// --- Layout ---

std::optional<LayoutResult> Text::layout(const LayoutContext &context)
{
    if (!context.fontMetrics) {
        qWarning() << "Text: no font metrics available for" << identity();
        return std::nullopt;
    }

    const FontMetrics &metrics = *context.fontMetrics;
    const BoxConstraints &c = context.constraints;
    m_resolved = resolvedStyle(context.theme);
    m_direction = context.textDirection;
    m_lines = breakLines(m_text, metrics, m_resolved, c.maxWidth);

    const qreal size = m_resolved.fontSize;
    const qreal ascent = metrics.ascent(m_resolved.font, size);
    const qreal descent = metrics.descent(m_resolved.font, size);
    m_lineAdvance = size * m_resolved.lineHeight;
    // Half-leading above and below the glyph box
    m_baselineOffset = (m_lineAdvance - (ascent + descent)) / 2 + ascent;

    qreal width = 0;
    for (const Line &line : std::as_const(m_lines))
        width = qMax(width, line.width);

    LayoutResult result;
    result.size = c.constrain(QSizeF(width, m_lineAdvance * m_lines.size()));
    result.baseline = m_baselineOffset;
    return result;
}

// --- Paint ---

qreal Text::lineOffset(const Line &line, qreal width) const
{
    Qt::Alignment h = m_alignment & Qt::AlignHorizontal_Mask;
    if (m_direction == TextDirection::RightToLeft && !(h & Qt::AlignAbsolute)) {
        if (h & Qt::AlignLeft)
            h = Qt::AlignRight;
        else if (h & Qt::AlignRight)
            h = Qt::AlignLeft;
    }

    const qreal slack = qMax<qreal>(0, width - line.width);
    if (h & Qt::AlignHCenter)
        return slack / 2;
    if (h & Qt::AlignRight)
        return slack;
    return 0;
}

void Text::paint(const PaintContext &context) const
{
    if (!context.painter)
        return;

    const qreal width = context.size.width();
    for (int i = 0; i < m_lines.size(); ++i) {
        const Line &line = m_lines.at(i);
        if (line.text.isEmpty())
            continue;
        const QPointF origin(lineOffset(line, width), i * m_lineAdvance + m_baselineOffset);
        context.painter->drawText(origin, line.text, m_resolved.font,
                                  m_resolved.fontSize, m_resolved.color);
    }
}

} // namespace Layout
