/*
 * graphics.cpp — PDF content stream builder
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "graphics.h"
#include "pdfwriter.h"

#include <QDebug>

namespace Pdf {

static QByteArray n(qreal v)
{
    return toPdfNumber(v);
}

Graphics::Graphics(bool verbose)
    : m_verbose(verbose)
{
}

void Graphics::op(const QByteArray &line)
{
    m_content += line;
    m_content += '\n';
}

void Graphics::comment(const QByteArray &text)
{
    if (m_verbose)
        op("% " + text);
}

QByteArray Graphics::toLiteral(const QByteArray &text)
{
    return toLiteralString(text);
}

// --- Graphics state ---

void Graphics::saveContext()
{
    comment("save graphics state");
    op("q");
    ++m_depth;
}

bool Graphics::restoreContext()
{
    if (m_depth == 0) {
        qWarning() << "Graphics: restore without matching save ignored";
        return false;
    }
    comment("restore graphics state");
    op("Q");
    --m_depth;
    return true;
}

void Graphics::setTransform(const QTransform &m)
{
    comment("transform");
    op(n(m.m11()) + ' ' + n(m.m12()) + ' ' + n(m.m21()) + ' ' + n(m.m22()) + ' '
       + n(m.dx()) + ' ' + n(m.dy()) + " cm");
}

void Graphics::setLineWidth(qreal width)
{
    op(n(width) + " w");
}

void Graphics::setLineCap(LineCap cap)
{
    op(toPdf(static_cast<int>(cap)) + " J");
}

void Graphics::setLineJoin(LineJoin join)
{
    op(toPdf(static_cast<int>(join)) + " j");
}

void Graphics::setLineDashPattern(const QList<qreal> &dashes, qreal phase)
{
    QByteArray array("[");
    for (int i = 0; i < dashes.size(); ++i) {
        if (i > 0)
            array += ' ';
        array += n(dashes[i]);
    }
    array += ']';
    op(array + ' ' + n(phase) + " d");
}

void Graphics::setFillColor(const Color &color)
{
    op(color.toOperands() + " rg");
}

void Graphics::setStrokeColor(const Color &color)
{
    op(color.toOperands() + " RG");
}

// --- Paths ---

void Graphics::moveTo(qreal x, qreal y)
{
    op(n(x) + ' ' + n(y) + " m");
}

void Graphics::lineTo(qreal x, qreal y)
{
    op(n(x) + ' ' + n(y) + " l");
}

void Graphics::curveTo(qreal x1, qreal y1, qreal x2, qreal y2, qreal x3, qreal y3)
{
    op(n(x1) + ' ' + n(y1) + ' ' + n(x2) + ' ' + n(y2) + ' '
       + n(x3) + ' ' + n(y3) + " c");
}

void Graphics::drawRect(qreal x, qreal y, qreal w, qreal h)
{
    comment("rectangle");
    op(n(x) + ' ' + n(y) + ' ' + n(w) + ' ' + n(h) + " re");
}

void Graphics::closePath()
{
    op("h");
}

void Graphics::fillPath(bool evenOdd)
{
    op(evenOdd ? "f*" : "f");
}

void Graphics::strokePath(bool close)
{
    op(close ? "s" : "S");
}

void Graphics::fillAndStrokePath(bool evenOdd, bool close)
{
    if (close)
        op(evenOdd ? "b*" : "b");
    else
        op(evenOdd ? "B*" : "B");
}

void Graphics::clipPath(bool evenOdd)
{
    op(evenOdd ? "W* n" : "W n");
}

// --- Text ---

void Graphics::beginText()
{
    comment("begin text");
    op("BT");
}

void Graphics::endText()
{
    op("ET");
}

void Graphics::moveTextPosition(qreal x, qreal y)
{
    op(n(x) + ' ' + n(y) + " Td");
}

void Graphics::setFont(const QByteArray &resourceName, qreal size,
                       qreal charSpace, qreal wordSpace, qreal scale,
                       qreal rise, TextRenderingMode mode)
{
    m_fontsUsed.insert(resourceName);
    op(toName(resourceName) + ' ' + n(size) + " Tf");
    op(n(charSpace) + " Tc " + n(wordSpace) + " Tw " + n(scale) + " Tz");
    if (rise != 0)
        op(n(rise) + " Ts");
    op(toPdf(static_cast<int>(mode)) + " Tr");
}

void Graphics::showText(const QByteArray &operand)
{
    op(operand + " Tj");
}

} // namespace Pdf
