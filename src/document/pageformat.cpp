/*
 * pageformat.cpp — Page size, orientation and margins (points)
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pageformat.h"

QSizeF PageFormat::pageSizePoints() const
{
    if (customSize)
        return *customSize;

    QSizeF full = QPageSize(pageSizeId).sizePoints();
    if (orientation == QPageLayout::Landscape)
        full.transpose();
    return full;
}

QRectF PageFormat::contentRect() const
{
    const QSizeF full = pageSizePoints();
    return QRectF(margins.left(), margins.top(),
                  qMax<qreal>(0, full.width() - margins.left() - margins.right()),
                  qMax<qreal>(0, full.height() - margins.top() - margins.bottom()));
}

bool PageFormat::isValid() const
{
    const QSizeF full = pageSizePoints();
    if (!(full.width() > 0) || !(full.height() > 0) || qIsInf(full.width()) || qIsInf(full.height()))
        return false;
    if (margins.left() < 0 || margins.top() < 0 || margins.right() < 0 || margins.bottom() < 0)
        return false;
    return margins.left() + margins.right() <= full.width()
        && margins.top() + margins.bottom() <= full.height();
}

QList<QPageSize::PageSizeId> PageFormat::supportedSizes()
{
    return {QPageSize::A3, QPageSize::A4, QPageSize::A5, QPageSize::Letter, QPageSize::Legal};
}

std::optional<QPageSize::PageSizeId> PageFormat::sizeIdFromName(const QString &name)
{
    for (QPageSize::PageSizeId id : supportedSizes()) {
        if (sizeName(id).compare(name, Qt::CaseInsensitive) == 0)
            return id;
    }
    return std::nullopt;
}

QString PageFormat::sizeName(QPageSize::PageSizeId id)
{
    return QPageSize::key(id);
}
