/*
 * coordinatespace.cpp — Top-down authoring space vs. bottom-up PDF space
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "coordinatespace.h"

#include <QDebug>

namespace Render {

namespace CoordinateSpace {

QPointF toPdf(const QPointF &p, qreal pageHeight)
{
    return QPointF(p.x(), pageHeight - p.y());
}

QPointF fromPdf(const QPointF &p, qreal pageHeight)
{
    return QPointF(p.x(), pageHeight - p.y());
}

QRectF toPdf(const QRectF &r, qreal pageHeight)
{
    return QRectF(r.x(), pageHeight - r.y() - r.height(), r.width(), r.height());
}

QRectF fromPdf(const QRectF &r, qreal pageHeight)
{
    return QRectF(r.x(), pageHeight - r.y() - r.height(), r.width(), r.height());
}

QTransform toPdf(const QTransform &m, qreal pageHeight)
{
    // F * M * F with F = [1 0 0 -1 0 h]; linear terms keep their magnitude,
    // the off-diagonal ones change sign because the Y axis is mirrored.
    const qreal h = pageHeight;
    return QTransform(m.m11(), -m.m12(),
                      -m.m21(), m.m22(),
                      m.dx() + m.m21() * h,
                      h - m.m22() * h - m.dy());
}

} // namespace CoordinateSpace

QRectF transformBounds(const QRectF &bounds, const QTransform &m)
{
    return m.mapRect(bounds);
}

bool boundsIntersect(const QRectF &a, const QRectF &b)
{
    return a.left() <= b.right() && b.left() <= a.right()
        && a.top() <= b.bottom() && b.top() <= a.bottom();
}

QRectF unionBounds(const QList<QRectF> &bounds)
{
    if (bounds.isEmpty())
        return {};
    QRectF result = bounds.first();
    for (int i = 1; i < bounds.size(); ++i) {
        const QRectF &r = bounds[i];
        const qreal left = qMin(result.left(), r.left());
        const qreal top = qMin(result.top(), r.top());
        const qreal right = qMax(result.right(), r.right());
        const qreal bottom = qMax(result.bottom(), r.bottom());
        result = QRectF(QPointF(left, top), QPointF(right, bottom));
    }
    return result;
}

bool TransformStack::pop()
{
    if (m_saved.isEmpty()) {
        qWarning() << "TransformStack: pop on empty stack";
        return false;
    }
    m_current = m_saved.takeLast();
    return true;
}

void TransformStack::reset()
{
    m_current.reset();
    m_saved.clear();
}

} // namespace Render
