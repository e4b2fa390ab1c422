/*
 * documentoptions.h — Document-wide settings and per-page requests
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_DOCUMENTOPTIONS_H
#define FOLIO_DOCUMENTOPTIONS_H

#include <functional>
#include <optional>

#include <QDateTime>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QSizeF>
#include <QString>

#include "node.h"
#include "pageformat.h"
#include "theme.h"

struct DocumentOptions {
    // Info dictionary
    QString title;
    QString author;
    QString subject;
    QString keywords;
    QString creator;
    QDateTime creationDate = QDateTime::currentDateTime();

    bool compress = true; // FlateDecode content and font streams
    bool verbose = false; // operator comments + layout tracing

    PageFormat defaultFormat; // A4 portrait, 20pt margins
    Theme theme;
};

// Anything left unset falls back to DocumentOptions::defaultFormat
struct PageOptions {
    using Builder = std::function<Layout::NodePtr()>;

    std::optional<QPageSize::PageSizeId> pageSizeId;
    std::optional<QSizeF> size; // explicit width/height in points
    std::optional<QPageLayout::Orientation> orientation;
    std::optional<QMarginsF> margins;
    Builder builder;

    static PageOptions withFormat(QPageSize::PageSizeId id, Builder builder = nullptr)
    {
        PageOptions o;
        o.pageSizeId = id;
        o.builder = std::move(builder);
        return o;
    }

    static PageOptions withSize(const QSizeF &size, Builder builder = nullptr)
    {
        PageOptions o;
        o.size = size;
        o.builder = std::move(builder);
        return o;
    }

    PageFormat resolve(const PageFormat &defaults) const
    {
        PageFormat pf = defaults;
        if (pageSizeId) {
            pf.pageSizeId = *pageSizeId;
            pf.customSize.reset();
        }
        if (size)
            pf.customSize = *size;
        if (orientation)
            pf.orientation = *orientation;
        if (margins)
            pf.margins = *margins;
        return pf;
    }
};

#endif // FOLIO_DOCUMENTOPTIONS_H
