/*
 * fontmanager.h — System font lookup, measurement and glyph usage
 *
 * Family names go through fontconfig; FreeType reads the matched file and
 * HarfBuzz turns text into glyph runs.  Each face remembers which glyphs
 * were emitted (and the characters behind them) so the PDF writer can
 * embed a subset with a ToUnicode map.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_FONTMANAGER_H
#define FOLIO_FONTMANAGER_H

#include <memory>
#include <optional>
#include <vector>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <fontconfig/fontconfig.h>
#include <hb.h>

#include "fontmetrics.h"

// FontDescriptor entries, already scaled to 1000 units per em
struct FaceDescriptor {
    QByteArray postScriptName;
    int flags = 32; // Nonsymbolic
    int bbox[4] = {0, 0, 1000, 1000};
    int ascent = 800;
    int descent = -200;
    int capHeight = 700;
    qreal italicAngle = 0;
};

struct FontFace {
    QString filePath;
    int faceIndex = 0;
    QByteArray data; // FreeType reads from this buffer
    FT_Face ftFace = nullptr;
    hb_font_t *hbFont = nullptr;
    qreal unitsPerEm = 1000;
    FaceDescriptor descriptor;

    QSet<uint> usedGlyphs;
    QHash<uint, uint> glyphToUnicode; // glyph id -> first code point seen

    FontFace() = default;
    FontFace(const FontFace &) = delete;
    FontFace &operator=(const FontFace &) = delete;
    ~FontFace();
};

struct ShapedGlyph {
    uint glyphId = 0;
    qreal xAdvance = 0; // points
    int cluster = 0;    // UTF-16 index into the shaped text
};

class FontManager
{
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager &) = delete;
    FontManager &operator=(const FontManager &) = delete;

    // nullptr when fontconfig has no outline font for the family
    FontFace *loadFont(const FontSpec &spec);
    FontFace *loadFontFile(const QString &filePath, int faceIndex = 0);

    // Glyph run for text that is about to be drawn; records glyph usage
    QList<ShapedGlyph> shape(FontFace *face, const QString &text, qreal sizePoints);

    // --- Measurement (points at the given size; no usage recorded) ---

    qreal textWidth(FontFace *face, const QString &text, qreal sizePoints) const;
    qreal ascent(const FontFace *face, qreal sizePoints) const;
    qreal descent(const FontFace *face, qreal sizePoints) const;
    qreal lineHeight(const FontFace *face, qreal sizePoints) const;

    // Unhinted advance in 1000-unit glyph space, for the /W array
    int glyphWidth(const FontFace *face, uint glyphId) const;

    // Program holding only the used glyphs; nullopt if subsetting failed
    std::optional<QByteArray> subset(const FontFace *face) const;

private:
    struct Match {
        QString filePath;
        int faceIndex = 0;
    };

    std::optional<Match> match(const FontSpec &spec) const;
    QList<ShapedGlyph> shapeRun(FontFace *face, const QString &text, qreal sizePoints) const;
    static FaceDescriptor describe(const FontFace &face);

    FT_Library m_ftLibrary = nullptr;
    FcConfig *m_fcConfig = nullptr;
    std::vector<std::unique_ptr<FontFace>> m_faces;
    QHash<QString, FontFace *> m_byFile;       // "path:index"
    QHash<FontSpec, FontFace *> m_bySpec;      // null entries remember misses
};

#endif // FOLIO_FONTMANAGER_H
