/*
 * page.h — One page: fixed geometry and its drawing surface
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PAGE_H
#define FOLIO_PAGE_H

#include <QMarginsF>
#include <QRectF>
#include <QSizeF>

#include "graphics.h"
#include "pageformat.h"
#include "pdfgenerator.h"

class Page
{
public:
    Page(int index, const PageFormat &format, bool verbose = false);

    int index() const { return m_index; }
    PageFormat format() const { return m_format; }
    QSizeF size() const { return m_size; }
    QMarginsF margins() const { return m_format.margins; }
    QRectF contentArea() const { return m_contentArea; }

    Pdf::Graphics &graphics() { return m_graphics; }
    const Pdf::Graphics &graphics() const { return m_graphics; }

    Pdf::PageData toPageData() const;

private:
    int m_index;
    PageFormat m_format;
    QSizeF m_size;
    QRectF m_contentArea;
    Pdf::Graphics m_graphics;
};

#endif // FOLIO_PAGE_H
