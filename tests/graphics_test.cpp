#include <gtest/gtest.h>

#include "graphics.h"

using namespace Pdf;

namespace {

QList<QByteArray> lines(const Graphics &g) {
    QList<QByteArray> result = g.content().split('\n');
    if (!result.isEmpty() && result.last().isEmpty())
        result.removeLast();
    return result;
}

} // namespace

// ---------------------------------------------------------------------------
// Graphics state
// ---------------------------------------------------------------------------

TEST(Graphics, SaveRestoreTracksDepth) {
    Graphics g;
    g.saveContext();
    g.saveContext();
    EXPECT_EQ(g.depth(), 2);
    EXPECT_TRUE(g.restoreContext());
    EXPECT_TRUE(g.restoreContext());
    EXPECT_EQ(g.depth(), 0);
    EXPECT_EQ(lines(g), QList<QByteArray>({"q", "q", "Q", "Q"}));
}

TEST(Graphics, RestoreWithoutSaveEmitsNothing) {
    Graphics g;
    EXPECT_FALSE(g.restoreContext());
    EXPECT_EQ(g.depth(), 0);
    EXPECT_TRUE(g.content().isEmpty());
}

TEST(Graphics, TransformOperator) {
    Graphics g;
    g.setTransform(QTransform(1, 0, 0, 1, 30, -40.5));
    EXPECT_EQ(lines(g), QList<QByteArray>({"1 0 0 1 30 -40.5 cm"}));
}

TEST(Graphics, LineStyleOperators) {
    Graphics g;
    g.setLineWidth(0.75);
    g.setLineCap(LineCap::Round);
    g.setLineJoin(LineJoin::Bevel);
    g.setLineDashPattern({3, 1.5}, 2);
    EXPECT_EQ(lines(g), QList<QByteArray>({"0.75 w", "1 J", "2 j", "[3 1.5] 2 d"}));
}

TEST(Graphics, ColorOperators) {
    Graphics g;
    g.setFillColor(Color(1, 0.5, 0));
    g.setStrokeColor(Color::black());
    EXPECT_EQ(lines(g), QList<QByteArray>({"1 0.5 0 rg", "0 0 0 RG"}));
}

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

TEST(Graphics, PathConstruction) {
    Graphics g;
    g.moveTo(10, 20);
    g.lineTo(30, 40);
    g.curveTo(1, 2, 3, 4, 5, 6);
    g.closePath();
    g.drawRect(0, 0, 100, 50);
    EXPECT_EQ(lines(g), QList<QByteArray>({"10 20 m", "30 40 l", "1 2 3 4 5 6 c", "h",
                                           "0 0 100 50 re"}));
}

TEST(Graphics, PaintingOperators) {
    Graphics g;
    g.fillPath();
    g.fillPath(true);
    g.strokePath();
    g.strokePath(true);
    g.fillAndStrokePath();
    g.fillAndStrokePath(true);
    g.fillAndStrokePath(false, true);
    g.fillAndStrokePath(true, true);
    g.clipPath();
    g.clipPath(true);
    EXPECT_EQ(lines(g), QList<QByteArray>({"f", "f*", "S", "s", "B", "B*", "b", "b*",
                                           "W n", "W* n"}));
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

TEST(Graphics, TextObject) {
    Graphics g;
    g.beginText();
    g.setFont("F1", 12);
    g.moveTextPosition(20, 800);
    g.drawString("Hello (world)");
    g.endText();
    EXPECT_EQ(lines(g), QList<QByteArray>({"BT", "/F1 12 Tf", "0 Tc 0 Tw 100 Tz", "0 Tr",
                                           "20 800 Td", "(Hello \\(world\\)) Tj", "ET"}));
}

TEST(Graphics, FontStateOperators) {
    Graphics g;
    g.setFont("F2", 9.5, 0.5, 1, 90, 3, TextRenderingMode::Stroke);
    EXPECT_EQ(lines(g), QList<QByteArray>({"/F2 9.5 Tf", "0.5 Tc 1 Tw 90 Tz", "3 Ts", "1 Tr"}));
}

TEST(Graphics, TracksFontsUsed) {
    Graphics g;
    g.setFont("F1", 10);
    g.setFont("F3", 10);
    g.setFont("F1", 12);
    EXPECT_EQ(g.fontsUsed(), QSet<QByteArray>({"F1", "F3"}));
}

// ---------------------------------------------------------------------------
// Verbose mode
// ---------------------------------------------------------------------------

TEST(Graphics, CommentsOnlyWhenVerbose) {
    Graphics quiet;
    quiet.comment("hello");
    quiet.saveContext();
    EXPECT_EQ(lines(quiet), QList<QByteArray>({"q"}));

    Graphics verbose(true);
    EXPECT_TRUE(verbose.isVerbose());
    verbose.comment("hello");
    verbose.saveContext();
    EXPECT_EQ(lines(verbose), QList<QByteArray>({"% hello", "% save graphics state", "q"}));
}
