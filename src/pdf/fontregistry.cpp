/*
 * fontregistry.cpp — Document-wide font resources and text measurement
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontregistry.h"
#include "fontmanager.h"
#include "pdfwriter.h"

#include <QDebug>

namespace Pdf {

FontRegistry::FontRegistry(FontManager *fontManager)
    : m_fontManager(fontManager)
{
}

FontRegistry::~FontRegistry() = default;

FontRegistry::Target FontRegistry::lookup(const FontSpec &spec) const
{
    auto cached = m_lookupCache.constFind(spec);
    if (cached != m_lookupCache.constEnd())
        return cached.value();

    Target target;
    target.standard = standardFontFor(spec);
    if (!target.standard) {
        if (m_fontManager)
            target.face = m_fontManager->loadFont(spec);
        if (!target.face) {
            qWarning() << "FontRegistry: no font for" << spec.family << "- using Helvetica";
            target.standard = standardFontFor(FontSpec{QStringLiteral("Helvetica"),
                                                       spec.weight, spec.italic});
        }
    }

    m_lookupCache.insert(spec, target);
    return target;
}

QString FontRegistry::targetKey(const Target &target)
{
    if (target.face)
        return QStringLiteral("ttf:%1:%2").arg(target.face->filePath).arg(target.face->faceIndex);
    return QStringLiteral("std:%1").arg(static_cast<int>(*target.standard));
}

Font *FontRegistry::resolve(const FontSpec &spec)
{
    const Target target = lookup(spec);
    const QString key = targetKey(target);
    if (Font *existing = m_byTarget.value(key))
        return existing;

    auto font = std::make_unique<Font>();
    font->resourceName = "F" + QByteArray::number(static_cast<int>(m_fonts.size()) + 1);
    font->standard = target.standard;
    font->face = target.face;

    Font *raw = font.get();
    m_fonts.push_back(std::move(font));
    m_byTarget.insert(key, raw);
    return raw;
}

bool FontRegistry::contains(const QByteArray &resourceName) const
{
    return font(resourceName) != nullptr;
}

const Font *FontRegistry::font(const QByteArray &resourceName) const
{
    for (const auto &f : m_fonts) {
        if (f->resourceName == resourceName)
            return f.get();
    }
    return nullptr;
}

QList<const Font *> FontRegistry::fonts() const
{
    QList<const Font *> result;
    result.reserve(static_cast<qsizetype>(m_fonts.size()));
    for (const auto &f : m_fonts)
        result.append(f.get());
    return result;
}

QByteArray FontRegistry::encodeText(Font *font, const QString &text)
{
    if (!font->isEmbedded())
        return toLiteralString(toWinAnsi(text));

    // Identity-H: two-byte glyph IDs
    QByteArray gids;
    for (const ShapedGlyph &g : m_fontManager->shape(font->face, text, 1000.0)) {
        gids.append(static_cast<char>((g.glyphId >> 8) & 0xff));
        gids.append(static_cast<char>(g.glyphId & 0xff));
    }
    return toHexString(gids);
}

// --- FontMetrics ---

qreal FontRegistry::ascent(const FontSpec &font, qreal size) const
{
    const Target t = lookup(font);
    if (t.face)
        return m_fontManager->ascent(t.face, size);
    return standardFontMetrics(*t.standard).ascender * size / 1000.0;
}

qreal FontRegistry::descent(const FontSpec &font, qreal size) const
{
    const Target t = lookup(font);
    if (t.face)
        return m_fontManager->descent(t.face, size);
    return -standardFontMetrics(*t.standard).descender * size / 1000.0;
}

qreal FontRegistry::lineHeight(const FontSpec &font, qreal size) const
{
    const Target t = lookup(font);
    if (t.face)
        return m_fontManager->lineHeight(t.face, size);
    const StandardFontMetrics &m = standardFontMetrics(*t.standard);
    return (m.ascender - m.descender) * size / 1000.0;
}

qreal FontRegistry::textWidth(const FontSpec &font, const QString &text, qreal size) const
{
    const Target t = lookup(font);
    if (t.face)
        return m_fontManager->textWidth(t.face, text, size);
    return standardTextWidth(*t.standard, toWinAnsi(text), size);
}

} // namespace Pdf
