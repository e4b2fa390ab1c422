/*
 * pagepainter.h — Top-down drawing surface for nodes
 *
 * Wraps a page's Pdf::Graphics.  Every coordinate goes through
 * CoordinateSpace::toPdf() on its way out, and every transform is emitted
 * in its PDF-space form, so nodes never see the bottom-up coordinate
 * system.  saveContext()/restoreContext() map onto q/Q and must balance.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PAGEPAINTER_H
#define FOLIO_PAGEPAINTER_H

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QString>
#include <QTransform>

#include "coordinatespace.h"
#include "fontmetrics.h"

namespace Pdf {
class FontRegistry;
class Graphics;
}

namespace Render {

class PagePainter
{
public:
    PagePainter(Pdf::Graphics *graphics, Pdf::FontRegistry *fonts, qreal pageHeight);

    // --- State ---

    void saveContext();
    bool restoreContext();
    int depth() const;

    // Transforms apply inside the current frame (like QPainter with combine)
    void setTransform(const QTransform &m);
    void translate(qreal dx, qreal dy);
    void scale(qreal sx, qreal sy);
    void rotate(qreal degrees);
    QTransform currentTransform() const { return m_transforms.current(); }

    void setFillColor(const QColor &color);
    void setStrokeColor(const QColor &color);
    void setLineWidth(qreal width);

    // --- Paths ---

    void moveTo(const QPointF &p);
    void lineTo(const QPointF &p);
    void curveTo(const QPointF &c1, const QPointF &c2, const QPointF &end);
    void closePath();
    void drawRect(const QRectF &rect);

    void fillPath(bool evenOdd = false);
    void strokePath(bool close = false);
    void fillAndStrokePath(bool evenOdd = false);
    void clip(bool evenOdd = false);

    // Fill and/or stroke a rectangle; invalid colors skip that part
    void drawRect(const QRectF &rect, const QColor &fill,
                  const QColor &stroke = QColor(), qreal strokeWidth = 0);
    void drawLine(const QPointF &from, const QPointF &to,
                  const QColor &color, qreal width);

    // --- Text ---

    // origin is the left end of the baseline
    void drawText(const QPointF &origin, const QString &text,
                  const FontSpec &font, qreal size, const QColor &color);

    // --- Diagnostics ---

    void reportUnbalanced(const QString &identity, int residual);
    bool hasUnbalancedState() const { return !m_errorString.isEmpty(); }
    QString errorString() const { return m_errorString; }

    qreal pageHeight() const { return m_pageHeight; }
    Pdf::Graphics *graphics() const { return m_graphics; }

private:
    QPointF out(const QPointF &p) const { return CoordinateSpace::toPdf(p, m_pageHeight); }

    Pdf::Graphics *m_graphics;
    Pdf::FontRegistry *m_fonts;
    qreal m_pageHeight;
    TransformStack m_transforms;
    QString m_errorString;
};

} // namespace Render

#endif // FOLIO_PAGEPAINTER_H
