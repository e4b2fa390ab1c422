/*
 * standardfonts.cpp — The standard Type1 fonts every PDF reader provides
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "standardfonts.h"

#include <QHash>

namespace Pdf {

// --- AFM advance widths, codes 32..126 ---

static const short kHelveticaWidths[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    278, 278, 584, 584, 584, 556, 1015,
    667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    278, 278, 278, 469, 556, 333,
    556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,
    556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,
    334, 260, 334, 584,
};

static const short kHelveticaBoldWidths[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    333, 333, 584, 584, 584, 611, 975,
    722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    333, 278, 333, 584, 556, 333,
    556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889,
    611, 611, 611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500,
    389, 280, 389, 584,
};

static const short kTimesRomanWidths[95] = {
    250, 333, 408, 500, 500, 833, 778, 180, 333, 333, 500, 564, 250, 333, 250, 278,
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500,
    278, 278, 564, 564, 564, 444, 921,
    722, 667, 667, 722, 611, 556, 722, 722, 333, 389, 722, 611, 889,
    722, 722, 556, 722, 667, 556, 611, 722, 722, 944, 722, 722, 611,
    333, 278, 333, 469, 500, 333,
    444, 500, 444, 500, 444, 333, 500, 500, 278, 278, 500, 278, 778,
    500, 500, 500, 500, 333, 389, 278, 500, 500, 722, 500, 500, 444,
    480, 200, 480, 541,
};

static const short kTimesBoldWidths[95] = {
    250, 333, 555, 500, 500, 1000, 833, 278, 333, 333, 500, 570, 250, 333, 250, 278,
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500,
    333, 333, 570, 570, 570, 500, 930,
    722, 667, 722, 722, 667, 611, 778, 778, 389, 500, 778, 667, 944,
    722, 778, 611, 778, 722, 556, 667, 722, 722, 1000, 722, 722, 667,
    333, 278, 333, 581, 500, 333,
    500, 556, 444, 556, 444, 333, 500, 556, 278, 333, 556, 278, 833,
    556, 500, 556, 556, 444, 389, 333, 556, 500, 722, 500, 500, 444,
    394, 220, 394, 520,
};

static const short kTimesItalicWidths[95] = {
    250, 333, 420, 500, 500, 833, 778, 214, 333, 333, 500, 675, 250, 333, 250, 278,
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500,
    333, 333, 675, 675, 675, 500, 920,
    611, 611, 667, 722, 611, 611, 722, 722, 333, 444, 667, 556, 833,
    667, 722, 611, 722, 611, 500, 556, 722, 611, 833, 611, 556, 556,
    389, 278, 389, 422, 500, 333,
    500, 500, 444, 500, 444, 278, 500, 500, 278, 278, 444, 278, 722,
    500, 500, 500, 500, 389, 389, 278, 500, 444, 667, 444, 444, 389,
    400, 275, 400, 541,
};

static const short kTimesBoldItalicWidths[95] = {
    250, 389, 555, 500, 500, 833, 778, 278, 333, 333, 500, 570, 250, 333, 250, 278,
    500, 500, 500, 500, 500, 500, 500, 500, 500, 500,
    333, 333, 570, 570, 570, 500, 832,
    667, 667, 667, 722, 667, 667, 722, 778, 389, 500, 667, 611, 889,
    722, 722, 611, 722, 667, 556, 611, 722, 667, 889, 667, 611, 611,
    333, 278, 333, 570, 500, 333,
    500, 500, 444, 500, 444, 333, 500, 556, 278, 278, 500, 278, 778,
    556, 500, 500, 500, 389, 389, 278, 556, 444, 667, 500, 444, 389,
    348, 220, 348, 570,
};

// Courier is monospaced
static const short kCourierWidths[95] = {
    600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600, 600,
    600, 600, 600, 600,
};

// PDF32000-2008 Table 123: 1 FixedPitch, 2 Serif, 32 Nonsymbolic, 64 Italic
static const StandardFontMetrics kMetrics[] = {
    {"Helvetica",             kHelveticaWidths,       556, 718, -207, 718, 523,  88,   0.0, 32, {-166, -225, 1000, 931}},
    {"Helvetica-Bold",        kHelveticaBoldWidths,   556, 718, -207, 718, 532, 140,   0.0, 32, {-170, -228, 1003, 962}},
    {"Helvetica-Oblique",     kHelveticaWidths,       556, 718, -207, 718, 523,  88, -12.0, 96, {-170, -225, 1116, 931}},
    {"Helvetica-BoldOblique", kHelveticaBoldWidths,   556, 718, -207, 718, 532, 140, -12.0, 96, {-174, -228, 1114, 962}},
    {"Times-Roman",           kTimesRomanWidths,      500, 683, -217, 662, 450,  84,   0.0, 34, {-168, -218, 1000, 898}},
    {"Times-Bold",            kTimesBoldWidths,       500, 683, -217, 676, 461, 139,   0.0, 34, {-168, -218, 1000, 935}},
    {"Times-Italic",          kTimesItalicWidths,     500, 683, -217, 653, 441,  76, -15.5, 98, {-169, -217, 1010, 883}},
    {"Times-BoldItalic",      kTimesBoldItalicWidths, 500, 683, -217, 669, 462, 121, -15.0, 98, {-200, -218,  996, 921}},
    {"Courier",               kCourierWidths,         600, 629, -157, 562, 426,  51,   0.0, 33, { -23, -250,  715, 805}},
    {"Courier-Bold",          kCourierWidths,         600, 629, -157, 562, 439, 106,   0.0, 33, {-113, -250,  749, 801}},
    {"Courier-Oblique",       kCourierWidths,         600, 629, -157, 562, 426,  51, -12.0, 97, { -27, -250,  849, 805}},
    {"Courier-BoldOblique",   kCourierWidths,         600, 629, -157, 562, 439, 106, -12.0, 97, { -57, -250,  869, 801}},
};

const StandardFontMetrics &standardFontMetrics(StandardFont font)
{
    return kMetrics[static_cast<int>(font)];
}

// --- Family resolution ---

enum class Family { Helvetica, Times, Courier };

static StandardFont variantOf(Family family, bool bold, bool italic)
{
    const int base = family == Family::Helvetica ? 0 : family == Family::Times ? 4 : 8;
    const int style = (bold ? 1 : 0) + (italic ? 2 : 0);
    return static_cast<StandardFont>(base + style);
}

std::optional<StandardFont> standardFontFor(const FontSpec &spec)
{
    const QString family = spec.family.trimmed().toLower();

    // Exact base font names carry their own style
    for (int i = 0; i < int(sizeof(kMetrics) / sizeof(kMetrics[0])); ++i) {
        if (family == QString::fromLatin1(kMetrics[i].baseFont).toLower())
            return static_cast<StandardFont>(i);
    }

    static const QHash<QString, Family> aliases = {
        {QStringLiteral("helvetica"),       Family::Helvetica},
        {QStringLiteral("arial"),           Family::Helvetica},
        {QStringLiteral("sans-serif"),      Family::Helvetica},
        {QStringLiteral("times"),           Family::Times},
        {QStringLiteral("times new roman"), Family::Times},
        {QStringLiteral("serif"),           Family::Times},
        {QStringLiteral("courier"),         Family::Courier},
        {QStringLiteral("courier new"),     Family::Courier},
        {QStringLiteral("monospace"),       Family::Courier},
    };

    auto it = aliases.constFind(family);
    if (it == aliases.constEnd())
        return std::nullopt;
    return variantOf(it.value(), spec.isBold(), spec.italic);
}

// --- Encoding and measurement ---

static char winAnsiSpecial(ushort u)
{
    switch (u) {
    case 0x20AC: return '\x80';
    case 0x201A: return '\x82';
    case 0x0192: return '\x83';
    case 0x201E: return '\x84';
    case 0x2026: return '\x85';
    case 0x2020: return '\x86';
    case 0x2021: return '\x87';
    case 0x02C6: return '\x88';
    case 0x2030: return '\x89';
    case 0x0160: return '\x8a';
    case 0x2039: return '\x8b';
    case 0x0152: return '\x8c';
    case 0x017D: return '\x8e';
    case 0x2018: return '\x91';
    case 0x2019: return '\x92';
    case 0x201C: return '\x93';
    case 0x201D: return '\x94';
    case 0x2022: return '\x95';
    case 0x2013: return '\x96';
    case 0x2014: return '\x97';
    case 0x02DC: return '\x98';
    case 0x2122: return '\x99';
    case 0x0161: return '\x9a';
    case 0x203A: return '\x9b';
    case 0x0153: return '\x9c';
    case 0x017E: return '\x9e';
    case 0x0178: return '\x9f';
    default:     return '?';
    }
}

QByteArray toWinAnsi(const QString &text)
{
    QByteArray result;
    result.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        const ushort u = c.unicode();
        if (c.isLowSurrogate())
            continue; // the high half already produced '?'
        if (u == '\t')
            result.append(' ');
        else if ((u >= 0x20 && u <= 0x7e) || (u >= 0xa0 && u <= 0xff))
            result.append(static_cast<char>(u));
        else
            result.append(winAnsiSpecial(u));
    }
    return result;
}

int standardGlyphWidth(StandardFont font, uchar code)
{
    const StandardFontMetrics &m = standardFontMetrics(font);
    if (code >= 32 && code <= 126)
        return m.asciiWidths[code - 32];
    if (code == 0xa0) // no-break space
        return m.asciiWidths[0];
    return m.defaultWidth;
}

qreal standardTextWidth(StandardFont font, const QByteArray &winAnsi, qreal size)
{
    qint64 units = 0;
    for (char ch : winAnsi)
        units += standardGlyphWidth(font, static_cast<uchar>(ch));
    return units * size / 1000.0;
}

} // namespace Pdf
