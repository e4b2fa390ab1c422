#include <gtest/gtest.h>

#include "boxconstraints.h"

using namespace Layout;

// ---------------------------------------------------------------------------
// Constructors
// ---------------------------------------------------------------------------

TEST(BoxConstraints, DefaultIsUnboundedAndLoose) {
    BoxConstraints c;
    EXPECT_EQ(c.minWidth, 0);
    EXPECT_EQ(c.minHeight, 0);
    EXPECT_TRUE(qIsInf(c.maxWidth));
    EXPECT_TRUE(qIsInf(c.maxHeight));
    EXPECT_TRUE(c.isValid());
    EXPECT_FALSE(c.hasBoundedWidth());
    EXPECT_FALSE(c.hasBoundedHeight());
}

TEST(BoxConstraints, TightPinsBothAxes) {
    BoxConstraints c = BoxConstraints::tight(QSizeF(100, 50));
    EXPECT_EQ(c, BoxConstraints(100, 100, 50, 50));
    EXPECT_TRUE(c.isTight());
    EXPECT_TRUE(c.satisfies(QSizeF(100, 50)));
    EXPECT_FALSE(c.satisfies(QSizeF(99, 50)));
}

TEST(BoxConstraints, LooseStartsAtZero) {
    BoxConstraints c = BoxConstraints::loose(QSizeF(300, 200));
    EXPECT_EQ(c, BoxConstraints(0, 300, 0, 200));
    EXPECT_FALSE(c.isTight());
    EXPECT_TRUE(c.satisfies(QSizeF(0, 0)));
    EXPECT_TRUE(c.satisfies(QSizeF(300, 200)));
}

TEST(BoxConstraints, ExpandFixesOnlyGivenAxes) {
    BoxConstraints c = BoxConstraints::expand(120, std::nullopt);
    EXPECT_EQ(c.minWidth, 120);
    EXPECT_EQ(c.maxWidth, 120);
    EXPECT_EQ(c.minHeight, 0);
    EXPECT_TRUE(qIsInf(c.maxHeight));

    EXPECT_EQ(BoxConstraints::tightFor(std::nullopt, 40), BoxConstraints::expand(std::nullopt, 40));
}

// ---------------------------------------------------------------------------
// Validity
// ---------------------------------------------------------------------------

TEST(BoxConstraints, RejectsNegativeAndInvertedBounds) {
    EXPECT_FALSE(BoxConstraints(-1, 10, 0, 10).isValid());
    EXPECT_FALSE(BoxConstraints(20, 10, 0, 10).isValid());
    EXPECT_FALSE(BoxConstraints(0, 10, 5, 4).isValid());
}

TEST(BoxConstraints, RejectsNaNAndInfiniteMinimum) {
    EXPECT_FALSE(BoxConstraints(qQNaN(), 10, 0, 10).isValid());
    EXPECT_FALSE(BoxConstraints(0, 10, qInf(), qInf()).isValid());
    EXPECT_FALSE(BoxConstraints(0, qQNaN(), 0, 10).isValid());
}

// ---------------------------------------------------------------------------
// constrain / satisfies
// ---------------------------------------------------------------------------

TEST(BoxConstraints, ConstrainClampsEachAxis) {
    BoxConstraints c(10, 100, 20, 40);
    EXPECT_EQ(c.constrain(QSizeF(5, 50)), QSizeF(10, 40));
    EXPECT_EQ(c.constrain(QSizeF(150, 10)), QSizeF(100, 20));
    EXPECT_EQ(c.constrain(QSizeF(50, 30)), QSizeF(50, 30));
}

TEST(BoxConstraints, ConstrainedSizeAlwaysSatisfies) {
    const BoxConstraints cases[] = {
        BoxConstraints(0, 10, 0, 10),
        BoxConstraints(5, 5, 7, 7),
        BoxConstraints(0, qInf(), 3, qInf()),
    };
    const QSizeF sizes[] = {QSizeF(0, 0), QSizeF(1000, 2), QSizeF(6, 6)};
    for (const BoxConstraints &c : cases) {
        for (const QSizeF &s : sizes)
            EXPECT_TRUE(c.satisfies(c.constrain(s)));
    }
}

TEST(BoxConstraints, SmallestAndBiggest) {
    BoxConstraints c(10, 100, 20, qInf());
    EXPECT_EQ(c.smallest(), QSizeF(10, 20));
    // Unbounded axis falls back to its minimum
    EXPECT_EQ(c.biggest(), QSizeF(100, 20));
}

// ---------------------------------------------------------------------------
// Derived constraints
// ---------------------------------------------------------------------------

TEST(BoxConstraints, LoosenDropsMinimums) {
    EXPECT_EQ(BoxConstraints(10, 100, 20, 40).loosen(), BoxConstraints(0, 100, 0, 40));
}

TEST(BoxConstraints, DeflateSubtractsInsetsAndNeverGoesNegative) {
    BoxConstraints c(50, 200, 10, 100);
    EXPECT_EQ(c.deflate(QMarginsF(10, 5, 20, 5)), BoxConstraints(20, 170, 0, 90));

    BoxConstraints small(0, 8, 0, 8);
    BoxConstraints d = small.deflate(insetsAll(10));
    EXPECT_TRUE(d.isValid());
    EXPECT_EQ(d, BoxConstraints(0, 0, 0, 0));
}

TEST(BoxConstraints, DeflateKeepsUnboundedAxesUnbounded) {
    BoxConstraints d = BoxConstraints().deflate(insetsAll(4));
    EXPECT_TRUE(qIsInf(d.maxWidth));
    EXPECT_TRUE(qIsInf(d.maxHeight));
}

// ---------------------------------------------------------------------------
// Insets
// ---------------------------------------------------------------------------

TEST(EdgeInsets, Helpers) {
    EXPECT_EQ(insetsAll(3), QMarginsF(3, 3, 3, 3));
    EXPECT_EQ(insetsSymmetric(4, 2), QMarginsF(4, 2, 4, 2));
    EXPECT_EQ(horizontalInsets(QMarginsF(1, 2, 3, 4)), 4);
    EXPECT_EQ(verticalInsets(QMarginsF(1, 2, 3, 4)), 6);
}

TEST(EdgeInsets, DeflateAndInflateSize) {
    const QMarginsF m(10, 5, 10, 5);
    EXPECT_EQ(deflateSize(QSizeF(100, 50), m), QSizeF(80, 40));
    EXPECT_EQ(deflateSize(QSizeF(5, 5), m), QSizeF(0, 0));
    EXPECT_EQ(inflateSize(QSizeF(80, 40), m), QSizeF(100, 50));
}
