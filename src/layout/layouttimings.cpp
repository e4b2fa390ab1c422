/*
 * layouttimings.cpp — Optional timing sink for the constraint solver
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "layouttimings.h"

#include <QtGlobal>

namespace Layout {

TimingSink::~TimingSink() = default;

void LayoutTimings::recordLayout(const QString &identity, qreal milliseconds)
{
    auto it = m_stats.find(identity);
    if (it == m_stats.end()) {
        m_stats.insert(identity, {1, milliseconds, milliseconds, milliseconds, milliseconds});
        return;
    }

    Stats &s = it.value();
    ++s.count;
    s.totalMs += milliseconds;
    s.averageMs = s.totalMs / s.count;
    s.maxMs = qMax(s.maxMs, milliseconds);
    s.minMs = qMin(s.minMs, milliseconds);
}

} // namespace Layout
