/*
 * coordinatespace.h — Top-down authoring space vs. bottom-up PDF space
 *
 * Nodes author geometry with the origin at the top-left and Y growing
 * downwards.  PDF user space has its origin at the bottom-left with Y
 * growing upwards.  With F(x, y) = (x, h - y), a point p maps to F(p), and
 * an authoring transform M maps to F * M * F so nested transforms compose
 * exactly as they did while authoring.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_COORDINATESPACE_H
#define FOLIO_COORDINATESPACE_H

#include <QList>
#include <QPointF>
#include <QRectF>
#include <QTransform>

namespace Render {

namespace CoordinateSpace {

constexpr qreal kPointsPerInch = 72.0;
constexpr qreal kMillimetersPerInch = 25.4;

QPointF toPdf(const QPointF &p, qreal pageHeight);
QPointF fromPdf(const QPointF &p, qreal pageHeight);

// PDF rects keep their size; their origin becomes the lower-left corner
QRectF toPdf(const QRectF &r, qreal pageHeight);
QRectF fromPdf(const QRectF &r, qreal pageHeight);

QTransform toPdf(const QTransform &m, qreal pageHeight);

inline qreal mmToPoints(qreal mm) { return mm * kPointsPerInch / kMillimetersPerInch; }
inline qreal pointsToMm(qreal pt) { return pt * kMillimetersPerInch / kPointsPerInch; }
inline qreal inchesToPoints(qreal in) { return in * kPointsPerInch; }

} // namespace CoordinateSpace

// --- Bounds helpers ---

QRectF transformBounds(const QRectF &bounds, const QTransform &m);
// Touching edges count as intersecting
bool boundsIntersect(const QRectF &a, const QRectF &b);
QRectF unionBounds(const QList<QRectF> &bounds);

// --- Transform stack ---

class TransformStack
{
public:
    void push() { m_saved.append(m_current); }
    bool pop();
    // Applies m inside the current frame
    void concat(const QTransform &m) { m_current = m * m_current; }
    void reset();

    QTransform current() const { return m_current; }
    int depth() const { return m_saved.size(); }

private:
    QTransform m_current;
    QList<QTransform> m_saved;
};

} // namespace Render

#endif // FOLIO_COORDINATESPACE_H
