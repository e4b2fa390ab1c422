#include <gtest/gtest.h>

#include "constraintsolver.h"
#include "layouttimings.h"

using namespace Layout;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
namespace {

// Takes its preferred size, clamped into whatever it is given
class FixedNode : public Node {
public:
    explicit FixedNode(const QSizeF &preferred) : m_preferred(preferred) {}

    std::optional<LayoutResult> layout(const LayoutContext &context) override {
        ++layoutCount;
        LayoutResult r;
        r.size = context.constraints.constrain(m_preferred);
        return r;
    }
    void paint(const PaintContext &) const override {}
    QString typeName() const override { return QStringLiteral("Fixed"); }

    int layoutCount = 0;

private:
    QSizeF m_preferred;
};

// Ignores its constraints entirely
class RogueNode : public Node {
public:
    std::optional<LayoutResult> layout(const LayoutContext &) override {
        LayoutResult r;
        r.size = QSizeF(500, 500);
        return r;
    }
    void paint(const PaintContext &) const override {}
    QString typeName() const override { return QStringLiteral("Rogue"); }
};

// Passes its own constraints to one child
class WrapperNode : public Node {
public:
    explicit WrapperNode(Node *child) : m_child(child) {}

    std::optional<LayoutResult> layout(const LayoutContext &context) override {
        return layoutChild(*m_child, context, context.constraints);
    }
    void paint(const PaintContext &) const override {}
    QString typeName() const override { return QStringLiteral("Wrapper"); }

private:
    Node *m_child;
};

LayoutContext contextFor(const BoxConstraints &c) {
    LayoutContext ctx;
    ctx.constraints = c;
    return ctx;
}

LayoutResult resultOf(qreal w, qreal h) {
    LayoutResult r;
    r.size = QSizeF(w, h);
    return r;
}

} // namespace

// ---------------------------------------------------------------------------
// solveLayout: caching
// ---------------------------------------------------------------------------

TEST(ConstraintSolver, IdenticalConstraintsHitCache) {
    ConstraintSolver solver;
    FixedNode node(QSizeF(40, 20));
    const LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(100, 100)));

    auto first = solver.solveLayout(node, ctx);
    auto second = solver.solveLayout(node, ctx);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(node.layoutCount, 1);
    EXPECT_EQ(solver.hitCount(), 1);
    EXPECT_EQ(solver.missCount(), 1);
    EXPECT_EQ(solver.cacheSize(), 1);
}

TEST(ConstraintSolver, DifferentConstraintsMiss) {
    ConstraintSolver solver;
    FixedNode node(QSizeF(40, 20));

    solver.solveLayout(node, contextFor(BoxConstraints::loose(QSizeF(100, 100))));
    auto r = solver.solveLayout(node, contextFor(BoxConstraints::loose(QSizeF(30, 100))));

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->size, QSizeF(30, 20));
    EXPECT_EQ(node.layoutCount, 2);
    EXPECT_EQ(solver.hitCount(), 0);
    EXPECT_EQ(solver.cacheSize(), 2);
}

TEST(ConstraintSolver, CacheCanBeBypassed) {
    ConstraintSolver solver;
    FixedNode node(QSizeF(10, 10));
    const LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(100, 100)));
    SolveOptions opts;
    opts.useCache = false;

    solver.solveLayout(node, ctx, opts);
    solver.solveLayout(node, ctx, opts);

    EXPECT_EQ(node.layoutCount, 2);
    EXPECT_EQ(solver.cacheSize(), 0);
}

TEST(ConstraintSolver, SiblingsWithSameIdentityDoNotShareResults) {
    ConstraintSolver solver;
    FixedNode a(QSizeF(10, 10));
    FixedNode b(QSizeF(60, 60));
    ASSERT_EQ(a.identity(), b.identity());
    const LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(100, 100)));

    auto ra = solver.solveLayout(a, ctx);
    auto rb = solver.solveLayout(b, ctx);

    ASSERT_TRUE(ra && rb);
    EXPECT_EQ(ra->size, QSizeF(10, 10));
    EXPECT_EQ(rb->size, QSizeF(60, 60));
    EXPECT_EQ(b.layoutCount, 1);
}

TEST(ConstraintSolver, CacheKeyUsesKeyThenLabelThenKind) {
    FixedNode node(QSizeF(1, 1));
    const BoxConstraints c(1, 2, 3, 4);
    EXPECT_TRUE(ConstraintSolver::cacheKey(node, c).startsWith(QStringLiteral("Fixed:")));
    node.setDebugLabel(QStringLiteral("label"));
    EXPECT_TRUE(ConstraintSolver::cacheKey(node, c).startsWith(QStringLiteral("label:")));
    node.setKey(QStringLiteral("key"));
    EXPECT_EQ(ConstraintSolver::cacheKey(node, c), QStringLiteral("key:1:2:3:4"));
}

TEST(ConstraintSolver, ClearCacheForWidgetMatchesWholeIdentity) {
    ConstraintSolver solver;
    FixedNode a(QSizeF(1, 1));
    FixedNode ab(QSizeF(1, 1));
    a.setKey(QStringLiteral("a"));
    ab.setKey(QStringLiteral("ab"));
    const LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(10, 10)));
    solver.solveLayout(a, ctx);
    solver.solveLayout(ab, ctx);
    ASSERT_EQ(solver.cacheSize(), 2);

    solver.clearCacheForWidget(a);
    EXPECT_EQ(solver.cacheSize(), 1);
    solver.solveLayout(ab, ctx);
    EXPECT_EQ(ab.layoutCount, 1);

    solver.clearCache();
    EXPECT_EQ(solver.cacheSize(), 0);
}

// ---------------------------------------------------------------------------
// solveLayout: validation
// ---------------------------------------------------------------------------

TEST(ConstraintSolver, InvalidConstraintsFailBeforeLayout) {
    ConstraintSolver solver;
    FixedNode node(QSizeF(10, 10));

    auto r = solver.solveLayout(node, contextFor(BoxConstraints(50, 10, 0, 10)));

    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(node.layoutCount, 0);
    EXPECT_EQ(solver.error(), Folio::Error::InvalidConstraints);
    EXPECT_EQ(solver.cacheSize(), 0);
}

TEST(ConstraintSolver, OversizedResultIsViolation) {
    ConstraintSolver solver;
    RogueNode node;
    node.setKey(QStringLiteral("rogue"));

    auto r = solver.solveLayout(node, contextFor(BoxConstraints::loose(QSizeF(100, 100))));

    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(solver.error(), Folio::Error::ConstraintViolation);
    EXPECT_TRUE(solver.errorString().contains(QStringLiteral("rogue violated constraints")));
    EXPECT_EQ(solver.cacheSize(), 0);
}

TEST(ConstraintSolver, ValidationCanBeDisabled) {
    ConstraintSolver solver;
    RogueNode node;
    SolveOptions opts;
    opts.validateConstraints = false;

    auto r = solver.solveLayout(node, contextFor(BoxConstraints::loose(QSizeF(100, 100))), opts);

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->size, QSizeF(500, 500));
    EXPECT_EQ(solver.error(), Folio::Error::NoError);
}

TEST(ConstraintSolver, ChildViolationPropagatesThroughParent) {
    ConstraintSolver solver;
    RogueNode child;
    child.setKey(QStringLiteral("inner"));
    WrapperNode parent(&child);

    auto r = solver.solveLayout(parent, contextFor(BoxConstraints::loose(QSizeF(100, 100))));

    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(solver.error(), Folio::Error::ConstraintViolation);
    EXPECT_TRUE(solver.errorString().startsWith(QStringLiteral("inner")));

    solver.clearError();
    EXPECT_EQ(solver.error(), Folio::Error::NoError);
    EXPECT_TRUE(solver.errorString().isEmpty());
}

// ---------------------------------------------------------------------------
// propagateConstraints
// ---------------------------------------------------------------------------

TEST(ConstraintSolver, PropagateBothFixedIsTight) {
    ChildRequirements req;
    req.width = 80;
    req.height = 30;
    BoxConstraints c = ConstraintSolver::propagateConstraints(BoxConstraints::loose(QSizeF(100, 100)), req);
    EXPECT_TRUE(c.isTight());
    EXPECT_EQ(c.smallest(), QSizeF(80, 30));
}

TEST(ConstraintSolver, PropagateFixedValuesAreClampedToParent) {
    ChildRequirements req;
    req.width = 500;
    req.height = 1;
    BoxConstraints c = ConstraintSolver::propagateConstraints(BoxConstraints(0, 100, 10, 100), req);
    EXPECT_EQ(c, BoxConstraints::tight(QSizeF(100, 10)));
}

TEST(ConstraintSolver, PropagatePerAxis) {
    ChildRequirements req;
    req.minWidth = 20;
    req.maxWidth = 60;
    req.maxHeight = 500;
    BoxConstraints c = ConstraintSolver::propagateConstraints(BoxConstraints(10, 100, 5, 200), req);
    EXPECT_EQ(c, BoxConstraints(20, 60, 5, 200));
}

TEST(ConstraintSolver, PropagateNeverEscapesParent) {
    const BoxConstraints parent(10, 100, 20, 80);
    const std::optional<qreal> values[] = {std::nullopt, 0.0, 15.0, 50.0, 150.0};

    for (const auto &w : values) {
        for (const auto &minW : values) {
            for (const auto &maxH : values) {
                ChildRequirements req;
                req.width = w;
                req.minWidth = minW;
                req.maxHeight = maxH;
                const BoxConstraints c = ConstraintSolver::propagateConstraints(parent, req);
                EXPECT_TRUE(c.isValid());
                EXPECT_LE(c.maxWidth, parent.maxWidth);
                EXPECT_LE(c.maxHeight, parent.maxHeight);
                EXPECT_GE(c.minWidth, parent.minWidth);
                EXPECT_GE(c.minHeight, parent.minHeight);
            }
        }
    }
}

TEST(ConstraintSolver, PropagateWithoutRequirementsReturnsParent) {
    const BoxConstraints parent(10, 100, 20, qInf());
    EXPECT_EQ(ConstraintSolver::propagateConstraints(parent), parent);
}

// ---------------------------------------------------------------------------
// negotiateSize
// ---------------------------------------------------------------------------

TEST(ConstraintSolver, WrapHorizontalSumsWidths) {
    const BoxConstraints parent(0, 300, 0, 50);
    QSizeF s = ConstraintSolver::negotiateSize({resultOf(100, 20), resultOf(150, 20)}, parent);
    EXPECT_EQ(s, QSizeF(250, 20));
}

TEST(ConstraintSolver, WrapVerticalSumsHeights) {
    const BoxConstraints parent(0, 300, 0, 500);
    QSizeF s = ConstraintSolver::negotiateSize({resultOf(100, 20), resultOf(150, 30)}, parent,
                                               SizeStrategy::Wrap, Axis::Vertical);
    EXPECT_EQ(s, QSizeF(150, 50));
}

TEST(ConstraintSolver, WrapClampsIntoParent) {
    const BoxConstraints parent(0, 200, 40, 50);
    QSizeF s = ConstraintSolver::negotiateSize({resultOf(100, 20), resultOf(150, 20)}, parent);
    EXPECT_EQ(s, QSizeF(200, 40));
}

TEST(ConstraintSolver, ExpandFallsBackToMinimumWhenUnbounded) {
    QSizeF s = ConstraintSolver::negotiateSize({resultOf(10, 10)}, BoxConstraints(),
                                               SizeStrategy::Expand);
    EXPECT_EQ(s, QSizeF(0, 0));

    s = ConstraintSolver::negotiateSize({resultOf(10, 10)}, BoxConstraints::loose(QSizeF(300, 200)),
                                        SizeStrategy::Expand);
    EXPECT_EQ(s, QSizeF(300, 200));
}

TEST(ConstraintSolver, FitTakesBoundingBox) {
    QSizeF s = ConstraintSolver::negotiateSize({resultOf(100, 20), resultOf(50, 70)},
                                               BoxConstraints::loose(QSizeF(80, 200)),
                                               SizeStrategy::Fit);
    EXPECT_EQ(s, QSizeF(80, 70));
}

TEST(ConstraintSolver, FitRaisesToParentMinimum) {
    QSizeF s = ConstraintSolver::negotiateSize({resultOf(10, 20), resultOf(30, 5)},
                                               BoxConstraints(60, 200, 40, 200),
                                               SizeStrategy::Fit);
    EXPECT_EQ(s, QSizeF(60, 40));
}

TEST(ConstraintSolver, NoChildrenGivesSmallest) {
    QSizeF s = ConstraintSolver::negotiateSize({}, BoxConstraints(12, 100, 7, 100));
    EXPECT_EQ(s, QSizeF(12, 7));
}

// ---------------------------------------------------------------------------
// calculateIntrinsicDimensions
// ---------------------------------------------------------------------------

TEST(ConstraintSolver, IntrinsicWidthRelaxesOnlyThatAxis) {
    ConstraintSolver solver;
    FixedNode node(QSizeF(120, 90));
    const LayoutContext ctx = contextFor(BoxConstraints::tight(QSizeF(50, 50)));

    auto width = solver.calculateIntrinsicDimensions(node, ctx, Axis::Horizontal);
    ASSERT_TRUE(width.has_value());
    EXPECT_EQ(width->min, 120);
    EXPECT_EQ(width->max, 120);

    auto height = solver.calculateIntrinsicDimensions(node, ctx, Axis::Vertical);
    ASSERT_TRUE(height.has_value());
    EXPECT_EQ(height->max, 90);
}

TEST(ConstraintSolver, IntrinsicProbeIsUncachedAndEvicts) {
    ConstraintSolver solver;
    FixedNode node(QSizeF(120, 90));
    const LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(50, 50)));

    solver.solveLayout(node, ctx);
    ASSERT_EQ(solver.cacheSize(), 1);

    solver.calculateIntrinsicDimensions(node, ctx, Axis::Horizontal);
    EXPECT_EQ(node.layoutCount, 2);
    EXPECT_EQ(solver.cacheSize(), 0);

    // The committed layout is recomputed, not served stale
    solver.solveLayout(node, ctx);
    EXPECT_EQ(node.layoutCount, 3);
}

TEST(ConstraintSolver, IntrinsicProbeInvalidatesDescendants) {
    ConstraintSolver solver;
    FixedNode child(QSizeF(120, 90));
    WrapperNode wrapper(&child);
    LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(50, 50)));
    ctx.solver = &solver;

    ASSERT_TRUE(solver.solveLayout(wrapper, ctx).has_value());
    ASSERT_EQ(child.layoutCount, 1);

    auto width = solver.calculateIntrinsicDimensions(wrapper, ctx, Axis::Horizontal);
    ASSERT_TRUE(width.has_value());
    EXPECT_EQ(width->max, 120);
    EXPECT_EQ(child.layoutCount, 2);

    // The child's state now reflects the probe; committing again must not
    // serve its stale cached size
    auto committed = solver.solveLayout(wrapper, ctx);
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->size, QSizeF(50, 50));
    EXPECT_EQ(child.layoutCount, 3);
}

// ---------------------------------------------------------------------------
// Timing sink
// ---------------------------------------------------------------------------

TEST(LayoutTimings, RecordsOnlyRealLayouts) {
    ConstraintSolver solver;
    LayoutTimings timings;
    solver.setTimingSink(&timings);
    EXPECT_EQ(solver.timingSink(), &timings);

    FixedNode node(QSizeF(10, 10));
    node.setKey(QStringLiteral("timed"));
    const LayoutContext ctx = contextFor(BoxConstraints::loose(QSizeF(100, 100)));
    solver.solveLayout(node, ctx);
    solver.solveLayout(node, ctx);
    solver.solveLayout(node, contextFor(BoxConstraints::loose(QSizeF(50, 50))));

    const LayoutTimings::Stats s = timings.stats(QStringLiteral("timed"));
    EXPECT_EQ(s.count, 2);
    EXPECT_GE(s.totalMs, 0);
    EXPECT_LE(s.minMs, s.maxMs);
    EXPECT_EQ(timings.allStats().size(), 1);

    timings.clear();
    EXPECT_EQ(timings.stats(QStringLiteral("timed")).count, 0);
}

TEST(LayoutTimings, AggregatesSamples) {
    LayoutTimings timings;
    timings.recordLayout(QStringLiteral("n"), 2.0);
    timings.recordLayout(QStringLiteral("n"), 4.0);
    timings.recordLayout(QStringLiteral("n"), 6.0);

    const LayoutTimings::Stats s = timings.stats(QStringLiteral("n"));
    EXPECT_EQ(s.count, 3);
    EXPECT_DOUBLE_EQ(s.totalMs, 12.0);
    EXPECT_DOUBLE_EQ(s.averageMs, 4.0);
    EXPECT_DOUBLE_EQ(s.maxMs, 6.0);
    EXPECT_DOUBLE_EQ(s.minMs, 2.0);
}
