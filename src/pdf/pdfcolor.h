/*
 * pdfcolor.h — RGB color normalized to the PDF [0, 1] range
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PDFCOLOR_H
#define FOLIO_PDFCOLOR_H

#include <QByteArray>
#include <QColor>
#include <QString>

namespace Pdf {

class Color
{
public:
    Color() = default;
    // Channels are clamped into [0, 1]
    Color(qreal red, qreal green, qreal blue);

    static Color fromRgb(int red, int green, int blue);
    static Color fromInt(quint32 rgb); // 0xRRGGBB, higher bits ignored
    // "#rgb", "#rrggbb" or "#rrggbbaa" (alpha ignored); '#' is optional
    static Color fromHex(const QString &hex, bool *ok = nullptr);
    static Color fromQColor(const QColor &color);

    static Color black() { return Color(0, 0, 0); }
    static Color white() { return Color(1, 1, 1); }
    static Color red() { return Color(1, 0, 0); }
    static Color green() { return Color(0, 1, 0); }
    static Color blue() { return Color(0, 0, 1); }
    static Color grey() { return Color(0.5, 0.5, 0.5); }

    qreal redF() const { return m_red; }
    qreal greenF() const { return m_green; }
    qreal blueF() const { return m_blue; }

    QString toHex() const; // "#rrggbb"
    QColor toQColor() const { return QColor::fromRgbF(m_red, m_green, m_blue); }

    // "r g b" operands for rg/RG
    QByteArray toOperands() const;

    bool operator==(const Color &o) const
    {
        return m_red == o.m_red && m_green == o.m_green && m_blue == o.m_blue;
    }
    bool operator!=(const Color &o) const { return !(*this == o); }

private:
    qreal m_red = 0;
    qreal m_green = 0;
    qreal m_blue = 0;
};

} // namespace Pdf

#endif // FOLIO_PDFCOLOR_H
