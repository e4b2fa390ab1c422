/*
 * graphics.h — PDF content stream builder (one drawing surface per page)
 *
 * Operates in PDF user space: origin at the bottom-left, Y up.  Callers
 * that author top-down go through Render::PagePainter instead.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_GRAPHICS_H
#define FOLIO_GRAPHICS_H

#include <QByteArray>
#include <QList>
#include <QSet>
#include <QTransform>

#include "pdfcolor.h"

namespace Pdf {

enum class LineCap { Butt = 0, Round = 1, Square = 2 };
enum class LineJoin { Miter = 0, Round = 1, Bevel = 2 };

enum class TextRenderingMode {
    Fill = 0,
    Stroke = 1,
    FillAndStroke = 2,
    Invisible = 3,
    FillAndClip = 4,
    StrokeAndClip = 5,
    FillStrokeAndClip = 6,
    Clip = 7,
};

class Graphics
{
public:
    // verbose adds a "%" comment line in front of every operator group
    explicit Graphics(bool verbose = false);

    // --- Graphics state ---

    void saveContext();
    // Emits Q only when a matching q exists; returns false otherwise
    bool restoreContext();
    int depth() const { return m_depth; }

    void setTransform(const QTransform &m); // cm, concatenated onto the CTM
    void setLineWidth(qreal width);
    void setLineCap(LineCap cap);
    void setLineJoin(LineJoin join);
    void setLineDashPattern(const QList<qreal> &dashes, qreal phase = 0);
    void setFillColor(const Color &color);
    void setStrokeColor(const Color &color);

    // --- Paths ---

    void moveTo(qreal x, qreal y);
    void lineTo(qreal x, qreal y);
    void curveTo(qreal x1, qreal y1, qreal x2, qreal y2, qreal x3, qreal y3);
    void drawRect(qreal x, qreal y, qreal w, qreal h);
    void closePath();

    void fillPath(bool evenOdd = false);
    void strokePath(bool close = false);
    void fillAndStrokePath(bool evenOdd = false, bool close = false);
    void clipPath(bool evenOdd = false);

    // --- Text ---

    void beginText();
    void endText();
    void moveTextPosition(qreal x, qreal y);
    // resourceName without the leading '/'
    void setFont(const QByteArray &resourceName, qreal size,
                 qreal charSpace = 0, qreal wordSpace = 0, qreal scale = 100,
                 qreal rise = 0, TextRenderingMode mode = TextRenderingMode::Fill);
    // operand is an already-encoded string: "(...)" or "<...>"
    void showText(const QByteArray &operand);
    // Convenience for single-byte text
    void drawString(const QByteArray &text) { showText(toLiteral(text)); }

    void comment(const QByteArray &text);

    QByteArray content() const { return m_content; }
    QSet<QByteArray> fontsUsed() const { return m_fontsUsed; }
    bool isVerbose() const { return m_verbose; }

private:
    static QByteArray toLiteral(const QByteArray &text);
    void op(const QByteArray &line);

    QByteArray m_content;
    QSet<QByteArray> m_fontsUsed;
    int m_depth = 0;
    bool m_verbose = false;
};

} // namespace Pdf

#endif // FOLIO_GRAPHICS_H
