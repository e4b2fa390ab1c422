#include <gtest/gtest.h>

#include "fontregistry.h"
#include "standardfonts.h"

using namespace Pdf;

namespace {

FontSpec spec(const QString &family, int weight = 400, bool italic = false) {
    FontSpec s;
    s.family = family;
    s.weight = weight;
    s.italic = italic;
    return s;
}

} // namespace

// ---------------------------------------------------------------------------
// Standard font resolution
// ---------------------------------------------------------------------------

TEST(StandardFonts, BaseNamesCarryTheirStyle) {
    EXPECT_EQ(standardFontFor(spec(QStringLiteral("Helvetica-Bold"))), StandardFont::HelveticaBold);
    EXPECT_EQ(standardFontFor(spec(QStringLiteral("times-roman"))), StandardFont::TimesRoman);
    EXPECT_EQ(standardFontFor(spec(QStringLiteral("Courier-BoldOblique"))),
              StandardFont::CourierBoldOblique);
}

TEST(StandardFonts, AliasesHonorWeightAndItalic) {
    EXPECT_EQ(standardFontFor(spec(QStringLiteral("Arial"))), StandardFont::Helvetica);
    EXPECT_EQ(standardFontFor(spec(QStringLiteral("serif"), 700)), StandardFont::TimesBold);
    EXPECT_EQ(standardFontFor(spec(QStringLiteral("Times New Roman"), 400, true)),
              StandardFont::TimesItalic);
    EXPECT_EQ(standardFontFor(spec(QStringLiteral(" monospace "), 700, true)),
              StandardFont::CourierBoldOblique);
}

TEST(StandardFonts, UnknownFamily) {
    EXPECT_FALSE(standardFontFor(spec(QStringLiteral("Comic Sans MS"))).has_value());
}

TEST(StandardFonts, WinAnsiEncoding) {
    EXPECT_EQ(toWinAnsi(QStringLiteral("abc")), QByteArray("abc"));
    EXPECT_EQ(toWinAnsi(QString(QChar(0xe9))), QByteArray("\xe9"));
    EXPECT_EQ(toWinAnsi(QString(QChar(0x20ac))), QByteArray("\x80"));
    EXPECT_EQ(toWinAnsi(QStringLiteral("a\tb")), QByteArray("a b"));
    EXPECT_EQ(toWinAnsi(QString(QChar(0x4e2d))), QByteArray("?"));
}

TEST(StandardFonts, SurrogatePairBecomesOneQuestionMark) {
    const QString emoji = QString::fromUcs4(U"\U0001F600");
    EXPECT_EQ(toWinAnsi(emoji), QByteArray("?"));
}

TEST(StandardFonts, GlyphWidths) {
    EXPECT_EQ(standardGlyphWidth(StandardFont::Helvetica, 'H'), 722);
    EXPECT_EQ(standardGlyphWidth(StandardFont::Helvetica, ' '), 278);
    EXPECT_EQ(standardGlyphWidth(StandardFont::Helvetica, 0xa0), 278);
    EXPECT_EQ(standardGlyphWidth(StandardFont::Courier, 'W'), 600);
    EXPECT_EQ(standardGlyphWidth(StandardFont::TimesRoman, 0xe9), 500);
}

TEST(StandardFonts, TextWidthScalesWithSize) {
    // H e l l o = 722 + 556 + 222 + 222 + 556
    EXPECT_DOUBLE_EQ(standardTextWidth(StandardFont::Helvetica, "Hello", 10), 22.78);
    EXPECT_DOUBLE_EQ(standardTextWidth(StandardFont::Courier, "abcd", 12), 28.8);
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

TEST(FontRegistry, ResourceNamesAreSequential) {
    FontRegistry registry;
    Font *regular = registry.resolve(spec(QStringLiteral("Helvetica")));
    Font *bold = registry.resolve(spec(QStringLiteral("Helvetica"), 700));
    ASSERT_NE(regular, nullptr);
    ASSERT_NE(bold, nullptr);
    EXPECT_EQ(regular->resourceName, QByteArray("F1"));
    EXPECT_EQ(bold->resourceName, QByteArray("F2"));
    EXPECT_EQ(registry.fontCount(), 2);
    EXPECT_TRUE(registry.contains("F2"));
    EXPECT_FALSE(registry.contains("F3"));
}

TEST(FontRegistry, AliasesShareOneResource) {
    FontRegistry registry;
    Font *a = registry.resolve(spec(QStringLiteral("Arial")));
    Font *b = registry.resolve(spec(QStringLiteral("sans-serif")));
    Font *c = registry.defaultFont();
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(registry.fontCount(), 1);
    EXPECT_FALSE(a->isEmbedded());
    EXPECT_EQ(a->standard, StandardFont::Helvetica);
}

TEST(FontRegistry, UnknownFamilyFallsBackToHelvetica) {
    FontRegistry registry;
    Font *font = registry.resolve(spec(QStringLiteral("No Such Family"), 700));
    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->standard, StandardFont::HelveticaBold);
}

TEST(FontRegistry, LookupByResourceName) {
    FontRegistry registry;
    registry.resolve(spec(QStringLiteral("Courier")));
    const Font *font = registry.font("F1");
    ASSERT_NE(font, nullptr);
    EXPECT_EQ(font->standard, StandardFont::Courier);
    EXPECT_EQ(registry.font("F7"), nullptr);
    EXPECT_EQ(registry.fonts().size(), 1);
}

TEST(FontRegistry, EncodesStandardTextAsLiteral) {
    FontRegistry registry;
    Font *font = registry.defaultFont();
    EXPECT_EQ(registry.encodeText(font, QStringLiteral("a(b)")), QByteArray("(a\\(b\\))"));
    EXPECT_EQ(registry.encodeText(font, QString(QChar(0xe9))), QByteArray("(\\351)"));
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

TEST(FontRegistry, StandardMetrics) {
    FontRegistry registry;
    const FontSpec helvetica;
    EXPECT_DOUBLE_EQ(registry.ascent(helvetica, 10), 7.18);
    EXPECT_DOUBLE_EQ(registry.descent(helvetica, 10), 2.07);
    EXPECT_DOUBLE_EQ(registry.lineHeight(helvetica, 10), 9.25);
    EXPECT_DOUBLE_EQ(registry.textWidth(helvetica, QStringLiteral("Hello"), 10), 22.78);
}

TEST(FontRegistry, MetricsDoNotRegisterFonts) {
    FontRegistry registry;
    registry.textWidth(spec(QStringLiteral("Times")), QStringLiteral("x"), 12);
    EXPECT_EQ(registry.fontCount(), 0);
}

TEST(FontRegistry, MeasuringIsDeterministic) {
    FontRegistry registry;
    const FontSpec serif = spec(QStringLiteral("serif"));
    const qreal first = registry.textWidth(serif, QStringLiteral("Folio"), 11);
    EXPECT_EQ(registry.textWidth(serif, QStringLiteral("Folio"), 11), first);
}
