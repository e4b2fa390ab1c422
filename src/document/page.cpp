/*
 * page.cpp — One page: fixed geometry and its drawing surface
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "page.h"

Page::Page(int index, const PageFormat &format, bool verbose)
    : m_index(index)
    , m_format(format)
    , m_size(format.pageSizePoints())
    , m_contentArea(format.contentRect())
    , m_graphics(verbose)
{
}

Pdf::PageData Page::toPageData() const
{
    Pdf::PageData data;
    data.size = m_size;
    data.content = m_graphics.content();
    data.fontsUsed = m_graphics.fontsUsed();
    return data;
}
