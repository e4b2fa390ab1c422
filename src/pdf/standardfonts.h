/*
 * standardfonts.h — The standard Type1 fonts every PDF reader provides
 *
 * Advance widths come from the Adobe AFM files for the printable ASCII
 * range; other WinAnsi codes use a per-font default width.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_STANDARDFONTS_H
#define FOLIO_STANDARDFONTS_H

#include <optional>

#include <QByteArray>
#include <QString>

#include "fontmetrics.h"

namespace Pdf {

enum class StandardFont {
    Helvetica,
    HelveticaBold,
    HelveticaOblique,
    HelveticaBoldOblique,
    TimesRoman,
    TimesBold,
    TimesItalic,
    TimesBoldItalic,
    Courier,
    CourierBold,
    CourierOblique,
    CourierBoldOblique,
};

struct StandardFontMetrics {
    const char *baseFont;
    const short *asciiWidths; // 95 entries, codes 32..126
    short defaultWidth;
    short ascender;
    short descender;          // negative, font units
    short capHeight;
    short xHeight;
    short stemV;
    qreal italicAngle;
    int flags;                // FontDescriptor /Flags
    short bbox[4];
};

const StandardFontMetrics &standardFontMetrics(StandardFont font);

// Maps a family/weight/style request onto a standard font.  Recognizes the
// base names ("Helvetica-Bold", "Times-Roman", ...) and the usual aliases
// (Arial, Times New Roman, Courier New, sans-serif, serif, monospace).
std::optional<StandardFont> standardFontFor(const FontSpec &spec);

// Encodes text as WinAnsiEncoding bytes; unmappable characters become '?'
QByteArray toWinAnsi(const QString &text);

// Advance width in 1/1000 em units for one WinAnsi code
int standardGlyphWidth(StandardFont font, uchar code);

// Width in points of WinAnsi-encoded text at the given size
qreal standardTextWidth(StandardFont font, const QByteArray &winAnsi, qreal size);

} // namespace Pdf

#endif // FOLIO_STANDARDFONTS_H
