/*
 * fontregistry.h — Document-wide font resources and text measurement
 *
 * Hands out PDF resource names (F1, F2, ...) for the fonts that pages
 * draw with and answers the layout engine's metric queries.  Standard
 * Type1 families are used as-is; anything else is resolved through
 * FontManager and embedded.  Unresolvable families fall back to Helvetica.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_FONTREGISTRY_H
#define FOLIO_FONTREGISTRY_H

#include <memory>
#include <optional>
#include <vector>

#include <QByteArray>
#include <QHash>
#include <QList>

#include "fontmetrics.h"
#include "standardfonts.h"

class FontManager;
struct FontFace;

namespace Pdf {

struct Font {
    QByteArray resourceName;              // without the leading '/'
    std::optional<StandardFont> standard; // set for Type1 standard fonts
    FontFace *face = nullptr;             // set for embedded TrueType fonts

    bool isEmbedded() const { return face != nullptr; }
};

class FontRegistry : public FontMetrics
{
public:
    // fontManager may be null; then only the standard fonts are available
    explicit FontRegistry(FontManager *fontManager = nullptr);
    ~FontRegistry() override;

    FontRegistry(const FontRegistry &) = delete;
    FontRegistry &operator=(const FontRegistry &) = delete;

    // Registers the font on first use
    Font *resolve(const FontSpec &spec);
    Font *defaultFont() { return resolve(FontSpec()); }

    bool contains(const QByteArray &resourceName) const;
    const Font *font(const QByteArray &resourceName) const;
    QList<const Font *> fonts() const;
    int fontCount() const { return static_cast<int>(m_fonts.size()); }

    // Encoded Tj operand: "(...)" for standard fonts, "<gids>" for embedded
    QByteArray encodeText(Font *font, const QString &text);

    FontManager *fontManager() const { return m_fontManager; }

    // --- FontMetrics ---

    qreal ascent(const FontSpec &font, qreal size) const override;
    qreal descent(const FontSpec &font, qreal size) const override;
    qreal lineHeight(const FontSpec &font, qreal size) const override;
    qreal textWidth(const FontSpec &font, const QString &text, qreal size) const override;

private:
    struct Target {
        std::optional<StandardFont> standard;
        FontFace *face = nullptr;
    };

    Target lookup(const FontSpec &spec) const;
    static QString targetKey(const Target &target);

    FontManager *m_fontManager;
    std::vector<std::unique_ptr<Font>> m_fonts;
    QHash<QString, Font *> m_byTarget;
    mutable QHash<FontSpec, Target> m_lookupCache;
};

} // namespace Pdf

#endif // FOLIO_FONTREGISTRY_H
