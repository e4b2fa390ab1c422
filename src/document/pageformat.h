/*
 * pageformat.h — Page size, orientation and margins (points)
 *
 * Named sizes come from QPageSize's point table, so an A4 page is exactly
 * 595 x 842 and a Letter page 612 x 792.  An explicit size overrides the
 * named one.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PAGEFORMAT_H
#define FOLIO_PAGEFORMAT_H

#include <optional>

#include <QList>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QRectF>
#include <QSizeF>
#include <QString>

struct PageFormat
{
    static constexpr qreal kDefaultMargin = 20.0;

    QPageSize::PageSizeId pageSizeId = QPageSize::A4;
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    std::optional<QSizeF> customSize; // points, used as given
    QMarginsF margins{kDefaultMargin, kDefaultMargin, kDefaultMargin, kDefaultMargin};

    QSizeF pageSizePoints() const;

    // Page rectangle minus margins, top-left origin
    QRectF contentRect() const;

    bool isValid() const;

    static QList<QPageSize::PageSizeId> supportedSizes();
    static std::optional<QPageSize::PageSizeId> sizeIdFromName(const QString &name);
    static QString sizeName(QPageSize::PageSizeId id);
};

#endif // FOLIO_PAGEFORMAT_H
