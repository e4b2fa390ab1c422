/*
 * fontmetrics.h — Font measurement interface consumed by layout
 *
 * Layout never talks to FreeType or the PDF font tables directly; text
 * bearing nodes ask a FontMetrics implementation for advance widths and
 * vertical metrics.  Implementations must answer identically for identical
 * inputs, since layout results are cached on that assumption.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_FONTMETRICS_H
#define FOLIO_FONTMETRICS_H

#include <QHash>
#include <QString>

struct FontSpec {
    QString family = QStringLiteral("Helvetica");
    int weight = 400;   // CSS/QFont weights (400=Normal, 700=Bold)
    bool italic = false;

    bool isBold() const { return weight >= 600; }

    bool operator==(const FontSpec &o) const
    {
        return family == o.family && weight == o.weight && italic == o.italic;
    }
    bool operator!=(const FontSpec &o) const { return !(*this == o); }
};

inline size_t qHash(const FontSpec &k, size_t seed = 0)
{
    return qHash(k.family, seed) ^ qHash(k.weight, seed) ^ qHash(k.italic, seed);
}

class FontMetrics
{
public:
    virtual ~FontMetrics() = default;

    // All results in points at the given size; descent is positive
    virtual qreal ascent(const FontSpec &font, qreal size) const = 0;
    virtual qreal descent(const FontSpec &font, qreal size) const = 0;
    virtual qreal lineHeight(const FontSpec &font, qreal size) const = 0;
    virtual qreal textWidth(const FontSpec &font, const QString &text, qreal size) const = 0;
};

#endif // FOLIO_FONTMETRICS_H
