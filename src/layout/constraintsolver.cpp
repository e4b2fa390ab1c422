/*
 * constraintsolver.cpp — Validated, cached layout of node trees
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "constraintsolver.h"
#include "layouttimings.h"

#include <QDebug>
#include <QElapsedTimer>

namespace Layout {

static QString formatConstraints(const BoxConstraints &c)
{
    return QStringLiteral("min(%1, %2) max(%3, %4)")
        .arg(c.minWidth).arg(c.minHeight).arg(c.maxWidth).arg(c.maxHeight);
}

QString ConstraintSolver::cacheKey(const Node &node, const BoxConstraints &constraints)
{
    // 17 significant digits round-trip a double exactly
    return node.identity()
        + QLatin1Char(':') + QString::number(constraints.minWidth, 'g', 17)
        + QLatin1Char(':') + QString::number(constraints.maxWidth, 'g', 17)
        + QLatin1Char(':') + QString::number(constraints.minHeight, 'g', 17)
        + QLatin1Char(':') + QString::number(constraints.maxHeight, 'g', 17);
}

void ConstraintSolver::setError(Folio::Error error, const QString &message)
{
    m_error = error;
    m_errorString = message;
    qWarning().noquote() << "ConstraintSolver:" << message;
}

void ConstraintSolver::clearError()
{
    m_error = Folio::Error::NoError;
    m_errorString.clear();
}

// --- solveLayout ---

std::optional<LayoutResult> ConstraintSolver::solveLayout(Node &node, const LayoutContext &context,
                                                          SolveOptions options)
{
    const BoxConstraints &constraints = context.constraints;
    const QString key = cacheKey(node, constraints);

    if (options.useCache) {
        auto it = m_cache.constFind(key);
        // Identities are only unique among siblings, so the entry must
        // also come from this very node.
        if (it != m_cache.constEnd() && it->node == &node) {
            ++m_hits;
            return it->result;
        }
        ++m_misses;
    }

    if (options.validateConstraints && !constraints.isValid()) {
        setError(Folio::Error::InvalidConstraints,
                 QStringLiteral("Invalid constraints for %1: %2")
                     .arg(node.identity(), formatConstraints(constraints)));
        return std::nullopt;
    }

    LayoutContext ctx = context;
    ctx.solver = this;

    QElapsedTimer timer;
    if (m_timingSink)
        timer.start();

    std::optional<LayoutResult> result = node.layout(ctx);

    if (m_timingSink)
        m_timingSink->recordLayout(node.identity(), timer.nsecsElapsed() / 1.0e6);

    if (!result) {
        if (m_error == Folio::Error::NoError) {
            setError(Folio::Error::ConstraintViolation,
                     QStringLiteral("%1 failed to produce a layout").arg(node.identity()));
        }
        return std::nullopt;
    }

    if (options.validateConstraints && !constraints.satisfies(result->size)) {
        setError(Folio::Error::ConstraintViolation,
                 QStringLiteral("%1 violated constraints. Expected: %2, Got: (%3, %4)")
                     .arg(node.identity(), formatConstraints(constraints))
                     .arg(result->size.width()).arg(result->size.height()));
        return std::nullopt;
    }

    if (options.useCache)
        m_cache.insert(key, {&node, *result});

    return result;
}

// --- propagateConstraints ---

static void propagateAxis(qreal parentMin, qreal parentMax,
                          std::optional<qreal> fixed,
                          std::optional<qreal> reqMin, std::optional<qreal> reqMax,
                          qreal &outMin, qreal &outMax)
{
    auto clampToParent = [&](qreal v) { return qMax(parentMin, qMin(parentMax, v)); };

    outMin = clampToParent(reqMin.value_or(0));
    outMax = clampToParent(fixed ? *fixed : reqMax.value_or(parentMax));
    if (outMin > outMax)
        outMin = outMax;
}

BoxConstraints ConstraintSolver::propagateConstraints(const BoxConstraints &parent,
                                                      const ChildRequirements &req)
{
    if (req.width && req.height) {
        return BoxConstraints::tight(QSizeF(parent.constrainWidth(*req.width),
                                            parent.constrainHeight(*req.height)));
    }

    BoxConstraints result;
    propagateAxis(parent.minWidth, parent.maxWidth, req.width, req.minWidth, req.maxWidth,
                  result.minWidth, result.maxWidth);
    propagateAxis(parent.minHeight, parent.maxHeight, req.height, req.minHeight, req.maxHeight,
                  result.minHeight, result.maxHeight);
    return result;
}

// --- negotiateSize ---

QSizeF ConstraintSolver::negotiateSize(const QList<LayoutResult> &children,
                                       const BoxConstraints &parent,
                                       SizeStrategy strategy, Axis axis)
{
    if (children.isEmpty())
        return parent.smallest();

    switch (strategy) {
    case SizeStrategy::Expand:
        return parent.biggest();

    case SizeStrategy::Fit: {
        qreal w = 0;
        qreal h = 0;
        for (const LayoutResult &r : children) {
            w = qMax(w, r.size.width());
            h = qMax(h, r.size.height());
        }
        return parent.constrain(QSizeF(w, h));
    }

    case SizeStrategy::Wrap:
        break;
    }

    qreal main = 0;
    qreal cross = 0;
    for (const LayoutResult &r : children) {
        if (axis == Axis::Horizontal) {
            main += r.size.width();
            cross = qMax(cross, r.size.height());
        } else {
            main += r.size.height();
            cross = qMax(cross, r.size.width());
        }
    }
    return axis == Axis::Horizontal ? parent.constrain(QSizeF(main, cross))
                                    : parent.constrain(QSizeF(cross, main));
}

// --- calculateIntrinsicDimensions ---

std::optional<IntrinsicDimensions> ConstraintSolver::calculateIntrinsicDimensions(
    Node &node, const LayoutContext &context, Axis axis)
{
    BoxConstraints probe = context.constraints;
    if (axis == Axis::Horizontal) {
        probe.minWidth = 0;
        probe.maxWidth = qInf();
    } else {
        probe.minHeight = 0;
        probe.maxHeight = qInf();
    }

    if (!probe.isValid()) {
        setError(Folio::Error::InvalidConstraints,
                 QStringLiteral("Invalid intrinsic probe for %1: %2")
                     .arg(node.identity(), formatConstraints(probe)));
        return std::nullopt;
    }

    LayoutContext ctx = context.withConstraints(probe);
    ctx.solver = this;
    std::optional<LayoutResult> result = node.layout(ctx);
    // The probe re-lays out the whole subtree, so every cached result below
    // the node now disagrees with that descendant's state
    clearCache();
    if (!result)
        return std::nullopt;

    const qreal extent = axis == Axis::Horizontal ? result->size.width() : result->size.height();
    return IntrinsicDimensions{extent, extent};
}

// --- Cache management ---

void ConstraintSolver::clearCache()
{
    m_cache.clear();
}

void ConstraintSolver::clearCacheForWidget(const Node &node)
{
    const QString prefix = node.identity() + QLatin1Char(':');
    for (auto it = m_cache.begin(); it != m_cache.end();) {
        if (it.key().startsWith(prefix))
            it = m_cache.erase(it);
        else
            ++it;
    }
}

} // namespace Layout
