/*
 * theme.h — Colors, spacing and default text style handed to every node
 *
 * Loaded from JSON the same way as any other style resource; keys that are
 * missing keep their defaults.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_THEME_H
#define FOLIO_THEME_H

#include <QColor>
#include <QHash>
#include <QJsonObject>
#include <QString>

#include "fontmetrics.h"

struct TextStyle {
    FontSpec font;
    qreal fontSize = 12.0;
    QColor color = Qt::black;
    qreal lineHeight = 1.2; // multiple of the font size
};

struct Theme {
    QString id = QStringLiteral("default");
    QString name = QStringLiteral("Default");

    QHash<QString, QColor> colors; // role -> color

    struct Spacing {
        qreal xs = 2;
        qreal sm = 4;
        qreal md = 8;
        qreal lg = 16;
        qreal xl = 24;
        qreal xxl = 32;
    } spacing;

    struct CornerRadius {
        qreal none = 0;
        qreal small = 4;
        qreal medium = 8;
        qreal large = 16;
    } cornerRadius;

    TextStyle defaultTextStyle;

    Theme();

    // --- Color roles (colors.value(role) with the default as fallback) ---

    QColor color(const QString &role) const;
    QColor primary() const { return color(QStringLiteral("primary")); }
    QColor secondary() const { return color(QStringLiteral("secondary")); }
    QColor background() const { return color(QStringLiteral("background")); }
    QColor surface() const { return color(QStringLiteral("surface")); }
    QColor onBackground() const { return color(QStringLiteral("onBackground")); }
    QColor onSurface() const { return color(QStringLiteral("onSurface")); }
    QColor errorColor() const { return color(QStringLiteral("error")); }

    static const QHash<QString, QColor> &defaultColors();

    // --- Serialization ---

    static Theme fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

#endif // FOLIO_THEME_H
