/*
 * fontmanager.cpp — System font lookup, measurement and glyph usage
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"
#include "sfnt.h"

#include <QDebug>
#include <QFile>

#include FT_TRUETYPE_TABLES_H
#include FT_TRUETYPE_TAGS_H

#include <hb-ft.h>

FontFace::~FontFace()
{
    if (hbFont)
        hb_font_destroy(hbFont);
    if (ftFace)
        FT_Done_Face(ftFace);
}

FontManager::FontManager()
{
    if (FT_Error err = FT_Init_FreeType(&m_ftLibrary)) {
        qWarning() << "FontManager: FreeType initialization failed:" << err;
        m_ftLibrary = nullptr;
    }
    m_fcConfig = FcInitLoadConfigAndFonts();
    if (!m_fcConfig)
        qWarning() << "FontManager: fontconfig has no configuration; only standard fonts remain";
}

FontManager::~FontManager()
{
    // Faces hold FT_Face handles that must go before the library
    m_bySpec.clear();
    m_byFile.clear();
    m_faces.clear();
    if (m_fcConfig)
        FcConfigDestroy(m_fcConfig);
    if (m_ftLibrary)
        FT_Done_FreeType(m_ftLibrary);
}

// --- Lookup ---

static int cssToFcWeight(int weight)
{
    static const struct { int css; int fc; } table[] = {
        {100, FC_WEIGHT_THIN},   {200, FC_WEIGHT_EXTRALIGHT}, {300, FC_WEIGHT_LIGHT},
        {400, FC_WEIGHT_REGULAR}, {500, FC_WEIGHT_MEDIUM},    {600, FC_WEIGHT_DEMIBOLD},
        {700, FC_WEIGHT_BOLD},   {800, FC_WEIGHT_EXTRABOLD},
    };
    for (const auto &entry : table) {
        if (weight <= entry.css)
            return entry.fc;
    }
    return FC_WEIGHT_BLACK;
}

std::optional<FontManager::Match> FontManager::match(const FontSpec &spec) const
{
    if (!m_fcConfig)
        return std::nullopt;

    const QByteArray family = spec.family.toUtf8();
    FcPattern *pattern = FcPatternCreate();
    FcPatternAddString(pattern, FC_FAMILY, reinterpret_cast<const FcChar8 *>(family.constData()));
    FcPatternAddInteger(pattern, FC_WEIGHT, cssToFcWeight(spec.weight));
    FcPatternAddInteger(pattern, FC_SLANT, spec.italic ? FC_SLANT_ITALIC : FC_SLANT_ROMAN);
    FcPatternAddBool(pattern, FC_OUTLINE, FcTrue);
    FcConfigSubstitute(m_fcConfig, pattern, FcMatchPattern);
    FcDefaultSubstitute(pattern);

    FcResult result = FcResultNoMatch;
    FcPattern *found = FcFontMatch(m_fcConfig, pattern, &result);
    FcPatternDestroy(pattern);
    if (!found)
        return std::nullopt;

    std::optional<Match> m;
    FcChar8 *file = nullptr;
    if (FcPatternGetString(found, FC_FILE, 0, &file) == FcResultMatch && file) {
        m = Match();
        m->filePath = QString::fromUtf8(reinterpret_cast<const char *>(file));
        int index = 0;
        if (FcPatternGetInteger(found, FC_INDEX, 0, &index) == FcResultMatch)
            m->faceIndex = index;
    }
    FcPatternDestroy(found);
    return m;
}

FontFace *FontManager::loadFont(const FontSpec &spec)
{
    auto cached = m_bySpec.constFind(spec);
    if (cached != m_bySpec.constEnd())
        return cached.value();

    FontFace *face = nullptr;
    if (const std::optional<Match> m = match(spec))
        face = loadFontFile(m->filePath, m->faceIndex);
    else
        qWarning() << "FontManager: no system font for" << spec.family << spec.weight << spec.italic;

    m_bySpec.insert(spec, face);
    return face;
}

static bool hasGlyfTable(FT_Face face)
{
    FT_ULong length = 0;
    return FT_Load_Sfnt_Table(face, TTAG_glyf, 0, nullptr, &length) == 0 && length > 0;
}

FontFace *FontManager::loadFontFile(const QString &filePath, int faceIndex)
{
    const QString key = filePath + QLatin1Char(':') + QString::number(faceIndex);
    if (FontFace *existing = m_byFile.value(key))
        return existing;
    if (!m_ftLibrary)
        return nullptr;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FontManager: cannot read" << filePath << file.errorString();
        return nullptr;
    }

    auto face = std::make_unique<FontFace>();
    face->filePath = filePath;
    face->faceIndex = faceIndex;
    face->data = file.readAll();

    if (FT_Error err = FT_New_Memory_Face(m_ftLibrary,
                                          reinterpret_cast<const FT_Byte *>(face->data.constData()),
                                          static_cast<FT_Long>(face->data.size()), faceIndex,
                                          &face->ftFace)) {
        qWarning() << "FontManager: FreeType rejected" << filePath << "error" << err;
        return nullptr;
    }
    // Embedding writes FontFile2, which needs TrueType outlines
    if (!FT_IS_SFNT(face->ftFace) || !FT_IS_SCALABLE(face->ftFace) || !hasGlyfTable(face->ftFace)) {
        qWarning() << "FontManager: not a TrueType-outline font:" << filePath;
        return nullptr;
    }

    face->hbFont = hb_ft_font_create_referenced(face->ftFace);
    if (!face->hbFont) {
        qWarning() << "FontManager: HarfBuzz could not wrap" << filePath;
        return nullptr;
    }
    if (face->ftFace->units_per_EM > 0)
        face->unitsPerEm = face->ftFace->units_per_EM;
    face->descriptor = describe(*face);

    FontFace *raw = face.get();
    m_faces.push_back(std::move(face));
    m_byFile.insert(key, raw);
    return raw;
}

FaceDescriptor FontManager::describe(const FontFace &face)
{
    const FT_Face ft = face.ftFace;
    auto em = [&face](FT_Long units) {
        return qRound(static_cast<qreal>(units) * 1000.0 / face.unitsPerEm);
    };

    FaceDescriptor d;
    const char *psName = FT_Get_Postscript_Name(ft);
    d.postScriptName = psName ? QByteArray(psName) : QByteArray("Unnamed");

    // PDF32000-2008 Table 123
    d.flags = 32;
    if (FT_IS_FIXED_WIDTH(ft))
        d.flags |= 1;
    if (ft->style_flags & FT_STYLE_FLAG_ITALIC)
        d.flags |= 64;

    d.bbox[0] = em(ft->bbox.xMin);
    d.bbox[1] = em(ft->bbox.yMin);
    d.bbox[2] = em(ft->bbox.xMax);
    d.bbox[3] = em(ft->bbox.yMax);
    d.ascent = em(ft->ascender);
    d.descent = em(ft->descender);

    const auto *os2 = static_cast<const TT_OS2 *>(FT_Get_Sfnt_Table(ft, FT_SFNT_OS2));
    d.capHeight = (os2 && os2->version >= 2 && os2->sCapHeight > 0)
        ? em(os2->sCapHeight)
        : qRound(d.ascent * 0.9);

    const auto *post = static_cast<const TT_Postscript *>(FT_Get_Sfnt_Table(ft, FT_SFNT_POST));
    if (post)
        d.italicAngle = post->italicAngle / 65536.0;
    else if (ft->style_flags & FT_STYLE_FLAG_ITALIC)
        d.italicAngle = -12;
    return d;
}

// --- Shaping ---

QList<ShapedGlyph> FontManager::shapeRun(FontFace *face, const QString &text, qreal sizePoints) const
{
    QList<ShapedGlyph> run;
    if (!face || text.isEmpty())
        return run;

    // hb-ft works in 26.6 fixed point
    const int scale = qRound(sizePoints * 64);
    FT_Set_Char_Size(face->ftFace, static_cast<FT_F26Dot6>(scale), 0, 72, 0);
    hb_ft_font_changed(face->hbFont);
    hb_font_set_scale(face->hbFont, scale, scale);

    hb_buffer_t *buffer = hb_buffer_create();
    hb_buffer_add_utf16(buffer, reinterpret_cast<const uint16_t *>(text.utf16()),
                        static_cast<int>(text.size()), 0, static_cast<int>(text.size()));
    hb_buffer_guess_segment_properties(buffer);
    hb_buffer_set_cluster_level(buffer, HB_BUFFER_CLUSTER_LEVEL_MONOTONE_CHARACTERS);
    hb_shape(face->hbFont, buffer, nullptr, 0);

    unsigned int count = 0;
    const hb_glyph_info_t *info = hb_buffer_get_glyph_infos(buffer, &count);
    const hb_glyph_position_t *pos = hb_buffer_get_glyph_positions(buffer, nullptr);
    run.reserve(static_cast<qsizetype>(count));
    for (unsigned int i = 0; i < count; ++i)
        run.append({info[i].codepoint, pos[i].x_advance / 64.0, static_cast<int>(info[i].cluster)});

    hb_buffer_destroy(buffer);
    return run;
}

QList<ShapedGlyph> FontManager::shape(FontFace *face, const QString &text, qreal sizePoints)
{
    const QList<ShapedGlyph> run = shapeRun(face, text, sizePoints);
    for (const ShapedGlyph &g : run) {
        face->usedGlyphs.insert(g.glyphId);
        if (face->glyphToUnicode.contains(g.glyphId) || g.cluster >= text.size())
            continue;
        const QChar first = text.at(g.cluster);
        uint codePoint = first.unicode();
        if (first.isHighSurrogate() && g.cluster + 1 < text.size())
            codePoint = QChar::surrogateToUcs4(first, text.at(g.cluster + 1));
        face->glyphToUnicode.insert(g.glyphId, codePoint);
    }
    return run;
}

// --- Measurement ---

qreal FontManager::textWidth(FontFace *face, const QString &text, qreal sizePoints) const
{
    qreal width = 0;
    for (const ShapedGlyph &g : shapeRun(face, text, sizePoints))
        width += g.xAdvance;
    return width;
}

qreal FontManager::ascent(const FontFace *face, qreal sizePoints) const
{
    return face->ftFace->ascender * sizePoints / face->unitsPerEm;
}

qreal FontManager::descent(const FontFace *face, qreal sizePoints) const
{
    return -face->ftFace->descender * sizePoints / face->unitsPerEm;
}

qreal FontManager::lineHeight(const FontFace *face, qreal sizePoints) const
{
    return face->ftFace->height * sizePoints / face->unitsPerEm;
}

int FontManager::glyphWidth(const FontFace *face, uint glyphId) const
{
    if (FT_Load_Glyph(face->ftFace, glyphId, FT_LOAD_NO_SCALE | FT_LOAD_NO_BITMAP) != 0)
        return 0;
    return qRound(face->ftFace->glyph->metrics.horiAdvance * 1000.0 / face->unitsPerEm);
}

std::optional<QByteArray> FontManager::subset(const FontFace *face) const
{
    return sfnt::subset(face->data, face->faceIndex, face->usedGlyphs);
}
