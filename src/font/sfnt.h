/*
 * sfnt.h — TrueType/OpenType subsetting for PDF embedding
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_SFNT_H
#define FOLIO_SFNT_H

#include <optional>

#include <QByteArray>
#include <QSet>

namespace sfnt {

// Drops every glyph outside glyphIds (.notdef always stays).  Glyph ids
// are retained so Identity-H content streams need no remapping.
std::optional<QByteArray> subset(const QByteArray &fontData, int faceIndex,
                                 const QSet<uint> &glyphIds);

} // namespace sfnt

#endif // FOLIO_SFNT_H
