/*
 * constraintsolver.h — Validated, cached layout of node trees
 *
 * Every layout call that goes through solveLayout() is checked twice:
 * the constraints must be valid before the node sees them, and the size
 * the node reports must satisfy them afterwards.  Results are cached per
 * (node identity, exact constraints); nothing is invalidated automatically.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_CONSTRAINTSOLVER_H
#define FOLIO_CONSTRAINTSOLVER_H

#include <optional>

#include <QHash>
#include <QList>
#include <QSizeF>
#include <QString>

#include "boxconstraints.h"
#include "error.h"
#include "node.h"

namespace Layout {

class TimingSink;

struct SolveOptions {
    bool useCache = true;
    bool validateConstraints = true;
};

// Optional overrides a parent applies on top of its own constraints
struct ChildRequirements {
    std::optional<qreal> width;
    std::optional<qreal> height;
    std::optional<qreal> minWidth;
    std::optional<qreal> maxWidth;
    std::optional<qreal> minHeight;
    std::optional<qreal> maxHeight;
};

enum class SizeStrategy {
    Fit,    // bounding box of the children
    Expand, // fill the parent's maximum
    Wrap,   // accumulate along the main axis
};

enum class Axis {
    Horizontal,
    Vertical,
};

struct IntrinsicDimensions {
    qreal min = 0;
    qreal max = 0;
};

class ConstraintSolver
{
public:
    ConstraintSolver() = default;

    std::optional<LayoutResult> solveLayout(Node &node, const LayoutContext &context,
                                            SolveOptions options = SolveOptions());

    static BoxConstraints propagateConstraints(const BoxConstraints &parent,
                                               const ChildRequirements &requirements = {});

    // Wrap accumulates widths for Horizontal and heights for Vertical
    static QSizeF negotiateSize(const QList<LayoutResult> &children,
                                const BoxConstraints &parent,
                                SizeStrategy strategy = SizeStrategy::Wrap,
                                Axis axis = Axis::Horizontal);

    // Uncached probe with one axis relaxed to [0, inf).  Drops the whole
    // cache: the probe overwrites the committed layout of every node in the
    // subtree, and the next solveLayout() must recompute them.
    std::optional<IntrinsicDimensions> calculateIntrinsicDimensions(
        Node &node, const LayoutContext &context, Axis axis);

    void clearCache();
    void clearCacheForWidget(const Node &node);

    int cacheSize() const { return m_cache.size(); }
    int hitCount() const { return m_hits; }
    int missCount() const { return m_misses; }

    void setTimingSink(TimingSink *sink) { m_timingSink = sink; }
    TimingSink *timingSink() const { return m_timingSink; }

    Folio::Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    void clearError();

    static QString cacheKey(const Node &node, const BoxConstraints &constraints);

private:
    struct CacheEntry {
        const Node *node = nullptr;
        LayoutResult result;
    };

    void setError(Folio::Error error, const QString &message);

    QHash<QString, CacheEntry> m_cache;
    int m_hits = 0;
    int m_misses = 0;
    TimingSink *m_timingSink = nullptr;
    Folio::Error m_error = Folio::Error::NoError;
    QString m_errorString;
};

} // namespace Layout

#endif // FOLIO_CONSTRAINTSOLVER_H
