/*
 * pdfcolor.cpp — RGB color normalized to the PDF [0, 1] range
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfcolor.h"
#include "pdfwriter.h"

#include <QtGlobal>

namespace Pdf {

static qreal clampUnit(qreal v)
{
    if (qIsNaN(v))
        return 0;
    return qBound<qreal>(0.0, v, 1.0);
}

Color::Color(qreal red, qreal green, qreal blue)
    : m_red(clampUnit(red))
    , m_green(clampUnit(green))
    , m_blue(clampUnit(blue))
{
}

Color Color::fromRgb(int red, int green, int blue)
{
    return Color(red / 255.0, green / 255.0, blue / 255.0);
}

Color Color::fromInt(quint32 rgb)
{
    return fromRgb((rgb >> 16) & 0xff, (rgb >> 8) & 0xff, rgb & 0xff);
}

Color Color::fromHex(const QString &hex, bool *ok)
{
    QString digits = hex.trimmed();
    if (digits.startsWith(QLatin1Char('#')))
        digits.remove(0, 1);

    if (digits.length() == 3) {
        QString expanded;
        for (QChar c : digits)
            expanded += QString(2, c);
        digits = expanded;
    }

    bool parsed = false;
    quint32 value = 0;
    if (digits.length() == 6)
        value = digits.toUInt(&parsed, 16);
    else if (digits.length() == 8)
        value = digits.left(6).toUInt(&parsed, 16);

    if (ok)
        *ok = parsed;
    return parsed ? fromInt(value) : Color();
}

Color Color::fromQColor(const QColor &color)
{
    if (!color.isValid())
        return Color();
    const QColor rgb = color.toRgb();
    return fromRgb(rgb.red(), rgb.green(), rgb.blue());
}

QString Color::toHex() const
{
    auto channel = [](qreal v) { return qRound(v * 255.0); };
    return QStringLiteral("#%1%2%3")
        .arg(channel(m_red), 2, 16, QLatin1Char('0'))
        .arg(channel(m_green), 2, 16, QLatin1Char('0'))
        .arg(channel(m_blue), 2, 16, QLatin1Char('0'));
}

QByteArray Color::toOperands() const
{
    return toPdfNumber(m_red) + ' ' + toPdfNumber(m_green) + ' ' + toPdfNumber(m_blue);
}

} // namespace Pdf
