/*
 * layouttimings.h — Optional timing sink for the constraint solver
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_LAYOUTTIMINGS_H
#define FOLIO_LAYOUTTIMINGS_H

#include <QHash>
#include <QString>

namespace Layout {

class TimingSink
{
public:
    virtual ~TimingSink();
    virtual void recordLayout(const QString &identity, qreal milliseconds) = 0;
};

// Per-node aggregate of layout durations
class LayoutTimings : public TimingSink
{
public:
    struct Stats {
        int count = 0;
        qreal totalMs = 0;
        qreal averageMs = 0;
        qreal maxMs = 0;
        qreal minMs = 0;
    };

    void recordLayout(const QString &identity, qreal milliseconds) override;

    Stats stats(const QString &identity) const { return m_stats.value(identity); }
    QHash<QString, Stats> allStats() const { return m_stats; }
    void clear() { m_stats.clear(); }

private:
    QHash<QString, Stats> m_stats;
};

} // namespace Layout

#endif // FOLIO_LAYOUTTIMINGS_H
