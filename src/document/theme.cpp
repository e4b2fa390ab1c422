/*
 * theme.cpp — Colors, spacing and default text style handed to every node
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "theme.h"

#include <QDebug>

Theme::Theme()
    : colors(defaultColors())
{
}

const QHash<QString, QColor> &Theme::defaultColors()
{
    static const QHash<QString, QColor> defaults = {
        {QStringLiteral("primary"),      QColor(0x19, 0x76, 0xd2)},
        {QStringLiteral("secondary"),    QColor(0xdc, 0x00, 0x4e)},
        {QStringLiteral("background"),   QColor(0xff, 0xff, 0xff)},
        {QStringLiteral("surface"),      QColor(0xf5, 0xf5, 0xf5)},
        {QStringLiteral("onBackground"), QColor(0x00, 0x00, 0x00)},
        {QStringLiteral("onSurface"),    QColor(0x00, 0x00, 0x00)},
        {QStringLiteral("onPrimary"),    QColor(0xff, 0xff, 0xff)},
        {QStringLiteral("onSecondary"),  QColor(0xff, 0xff, 0xff)},
        {QStringLiteral("error"),        QColor(0xd3, 0x2f, 0x2f)},
        {QStringLiteral("success"),      QColor(0x38, 0x8e, 0x3c)},
        {QStringLiteral("warning"),      QColor(0xf5, 0x7c, 0x00)},
        {QStringLiteral("info"),         QColor(0x19, 0x76, 0xd2)},
    };
    return defaults;
}

QColor Theme::color(const QString &role) const
{
    QColor c = colors.value(role);
    if (c.isValid())
        return c;
    return defaultColors().value(role, QColor(Qt::black));
}

// ---------------------------------------------------------------------------
// JSON helpers
// ---------------------------------------------------------------------------

static qreal readNumber(const QJsonObject &obj, const char *key, qreal fallback)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    return v.isDouble() ? v.toDouble() : fallback;
}

static TextStyle textStyleFromJson(const QJsonObject &obj, const TextStyle &base)
{
    TextStyle style = base;
    style.font.family = obj.value(QLatin1String("fontFamily")).toString(base.font.family);
    style.font.weight = obj.value(QLatin1String("fontWeight")).toInt(base.font.weight);
    style.font.italic = obj.value(QLatin1String("italic")).toBool(base.font.italic);
    style.fontSize = readNumber(obj, "fontSize", base.fontSize);
    style.lineHeight = readNumber(obj, "lineHeight", base.lineHeight);

    const QString color = obj.value(QLatin1String("color")).toString();
    if (!color.isEmpty()) {
        QColor c(color);
        if (c.isValid())
            style.color = c;
        else
            qWarning() << "Theme: ignoring invalid text color" << color;
    }
    return style;
}

static QJsonObject textStyleToJson(const TextStyle &style)
{
    QJsonObject obj;
    obj[QLatin1String("fontFamily")] = style.font.family;
    obj[QLatin1String("fontWeight")] = style.font.weight;
    obj[QLatin1String("italic")]     = style.font.italic;
    obj[QLatin1String("fontSize")]   = style.fontSize;
    obj[QLatin1String("lineHeight")] = style.lineHeight;
    obj[QLatin1String("color")]      = style.color.name();
    return obj;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

Theme Theme::fromJson(const QJsonObject &obj)
{
    Theme theme;
    theme.id = obj.value(QLatin1String("id")).toString(theme.id);
    theme.name = obj.value(QLatin1String("name")).toString(theme.id);

    const QJsonObject colorObj = obj.value(QLatin1String("colorScheme")).toObject();
    for (auto it = colorObj.begin(); it != colorObj.end(); ++it) {
        QColor c(it.value().toString());
        if (!c.isValid()) {
            qWarning() << "Theme: ignoring invalid color for role" << it.key();
            continue;
        }
        theme.colors.insert(it.key(), c);
    }

    const QJsonObject sp = obj.value(QLatin1String("spacing")).toObject();
    theme.spacing.xs  = readNumber(sp, "xs",  theme.spacing.xs);
    theme.spacing.sm  = readNumber(sp, "sm",  theme.spacing.sm);
    theme.spacing.md  = readNumber(sp, "md",  theme.spacing.md);
    theme.spacing.lg  = readNumber(sp, "lg",  theme.spacing.lg);
    theme.spacing.xl  = readNumber(sp, "xl",  theme.spacing.xl);
    theme.spacing.xxl = readNumber(sp, "xxl", theme.spacing.xxl);

    const QJsonObject cr = obj.value(QLatin1String("cornerRadius")).toObject();
    theme.cornerRadius.none   = readNumber(cr, "none",   theme.cornerRadius.none);
    theme.cornerRadius.small  = readNumber(cr, "small",  theme.cornerRadius.small);
    theme.cornerRadius.medium = readNumber(cr, "medium", theme.cornerRadius.medium);
    theme.cornerRadius.large  = readNumber(cr, "large",  theme.cornerRadius.large);

    if (obj.contains(QLatin1String("defaultTextStyle"))) {
        theme.defaultTextStyle = textStyleFromJson(
            obj.value(QLatin1String("defaultTextStyle")).toObject(),
            theme.defaultTextStyle);
    }
    return theme;
}

QJsonObject Theme::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("type")] = QStringLiteral("theme");
    obj[QLatin1String("id")]   = id;
    obj[QLatin1String("name")] = name;

    QJsonObject colorObj;
    for (auto it = colors.begin(); it != colors.end(); ++it)
        colorObj[it.key()] = it.value().name();
    obj[QLatin1String("colorScheme")] = colorObj;

    QJsonObject sp;
    sp[QLatin1String("xs")]  = spacing.xs;
    sp[QLatin1String("sm")]  = spacing.sm;
    sp[QLatin1String("md")]  = spacing.md;
    sp[QLatin1String("lg")]  = spacing.lg;
    sp[QLatin1String("xl")]  = spacing.xl;
    sp[QLatin1String("xxl")] = spacing.xxl;
    obj[QLatin1String("spacing")] = sp;

    QJsonObject cr;
    cr[QLatin1String("none")]   = cornerRadius.none;
    cr[QLatin1String("small")]  = cornerRadius.small;
    cr[QLatin1String("medium")] = cornerRadius.medium;
    cr[QLatin1String("large")]  = cornerRadius.large;
    obj[QLatin1String("cornerRadius")] = cr;

    obj[QLatin1String("defaultTextStyle")] = textStyleToJson(defaultTextStyle);
    return obj;
}
