/*
 * pagepainter.cpp — Top-down drawing surface for nodes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagepainter.h"
#include "fontregistry.h"
#include "graphics.h"

#include <QDebug>

namespace Render {

PagePainter::PagePainter(Pdf::Graphics *graphics, Pdf::FontRegistry *fonts, qreal pageHeight)
    : m_graphics(graphics)
    , m_fonts(fonts)
    , m_pageHeight(pageHeight)
{
}

// --- State ---

void PagePainter::saveContext()
{
    m_graphics->saveContext();
    m_transforms.push();
}

bool PagePainter::restoreContext()
{
    if (!m_graphics->restoreContext())
        return false;
    m_transforms.pop();
    return true;
}

int PagePainter::depth() const
{
    return m_graphics->depth();
}

void PagePainter::setTransform(const QTransform &m)
{
    if (m.isIdentity())
        return;
    m_transforms.concat(m);
    m_graphics->setTransform(CoordinateSpace::toPdf(m, m_pageHeight));
}

void PagePainter::translate(qreal dx, qreal dy)
{
    if (dx == 0 && dy == 0)
        return;
    setTransform(QTransform::fromTranslate(dx, dy));
}

void PagePainter::scale(qreal sx, qreal sy)
{
    setTransform(QTransform::fromScale(sx, sy));
}

void PagePainter::rotate(qreal degrees)
{
    setTransform(QTransform().rotate(degrees));
}

void PagePainter::setFillColor(const QColor &color)
{
    m_graphics->setFillColor(Pdf::Color::fromQColor(color));
}

void PagePainter::setStrokeColor(const QColor &color)
{
    m_graphics->setStrokeColor(Pdf::Color::fromQColor(color));
}

void PagePainter::setLineWidth(qreal width)
{
    m_graphics->setLineWidth(width);
}

// --- Paths ---

void PagePainter::moveTo(const QPointF &p)
{
    const QPointF o = out(p);
    m_graphics->moveTo(o.x(), o.y());
}

void PagePainter::lineTo(const QPointF &p)
{
    const QPointF o = out(p);
    m_graphics->lineTo(o.x(), o.y());
}

void PagePainter::curveTo(const QPointF &c1, const QPointF &c2, const QPointF &end)
{
    const QPointF o1 = out(c1);
    const QPointF o2 = out(c2);
    const QPointF o3 = out(end);
    m_graphics->curveTo(o1.x(), o1.y(), o2.x(), o2.y(), o3.x(), o3.y());
}

void PagePainter::closePath()
{
    m_graphics->closePath();
}

void PagePainter::drawRect(const QRectF &rect)
{
    const QRectF r = CoordinateSpace::toPdf(rect, m_pageHeight);
    m_graphics->drawRect(r.x(), r.y(), r.width(), r.height());
}

void PagePainter::fillPath(bool evenOdd)
{
    m_graphics->fillPath(evenOdd);
}

void PagePainter::strokePath(bool close)
{
    m_graphics->strokePath(close);
}

void PagePainter::fillAndStrokePath(bool evenOdd)
{
    m_graphics->fillAndStrokePath(evenOdd);
}

void PagePainter::clip(bool evenOdd)
{
    m_graphics->clipPath(evenOdd);
}

void PagePainter::drawRect(const QRectF &rect, const QColor &fill,
                           const QColor &stroke, qreal strokeWidth)
{
    const bool doFill = fill.isValid() && fill.alpha() > 0;
    const bool doStroke = stroke.isValid() && stroke.alpha() > 0 && strokeWidth > 0;
    if (!doFill && !doStroke)
        return;

    m_graphics->saveContext();
    if (doFill)
        setFillColor(fill);
    if (doStroke) {
        setStrokeColor(stroke);
        setLineWidth(strokeWidth);
    }
    drawRect(rect);
    if (doFill && doStroke)
        m_graphics->fillAndStrokePath();
    else if (doFill)
        m_graphics->fillPath();
    else
        m_graphics->strokePath();
    m_graphics->restoreContext();
}

void PagePainter::drawLine(const QPointF &from, const QPointF &to,
                           const QColor &color, qreal width)
{
    m_graphics->saveContext();
    setStrokeColor(color);
    setLineWidth(width);
    moveTo(from);
    lineTo(to);
    m_graphics->strokePath();
    m_graphics->restoreContext();
}

// --- Text ---

void PagePainter::drawText(const QPointF &origin, const QString &text,
                           const FontSpec &font, qreal size, const QColor &color)
{
    if (text.isEmpty())
        return;

    Pdf::Font *pdfFont = m_fonts->resolve(font);
    const QPointF o = out(origin);

    setFillColor(color.isValid() ? color : QColor(Qt::black));
    m_graphics->beginText();
    m_graphics->setFont(pdfFont->resourceName, size);
    m_graphics->moveTextPosition(o.x(), o.y());
    m_graphics->showText(m_fonts->encodeText(pdfFont, text));
    m_graphics->endText();
}

// --- Diagnostics ---

void PagePainter::reportUnbalanced(const QString &identity, int residual)
{
    const QString message = residual > 0
        ? QStringLiteral("%1 left %2 unmatched save(s) on the graphics stack").arg(identity).arg(residual)
        : QStringLiteral("%1 restored %2 graphics state(s) it never saved").arg(identity).arg(-residual);
    if (m_errorString.isEmpty())
        m_errorString = message;
    qWarning().noquote() << "PagePainter:" << message;
}

} // namespace Render
