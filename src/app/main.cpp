/*
 * main.cpp — folio-render: lays out and writes a sample document
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTextStream>

#include "align.h"
#include "container.h"
#include "document.h"
#include "flex.h"
#include "padding.h"
#include "sizedbox.h"
#include "stack.h"
#include "textnode.h"

using namespace Layout;

static const QString kLorem = QStringLiteral(
    "Layout runs top-down: every parent hands its children a pair of minimum "
    "and maximum sizes, every child picks a size inside them, and the parent "
    "then decides where each child goes. Painting happens afterwards, in a "
    "second pass, and only ever sees the sizes that layout committed.");

static bool loadTheme(const QString &path, Theme *theme, QTextStream &err)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err << "folio-render: cannot open theme " << path << ": " << f.errorString() << Qt::endl;
        return false;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        err << "folio-render: invalid theme " << path << ": " << parseError.errorString() << Qt::endl;
        return false;
    }
    *theme = Theme::fromJson(doc.object());
    return true;
}

static NodePtr makeText(const QString &text, qreal size, int weight, const QColor &color)
{
    TextStyle style;
    style.font.weight = weight;
    style.fontSize = size;
    style.color = color;
    return std::make_unique<Text>(text, style);
}

static NodePtr makeSwatch(const QString &label, const QColor &fill, const Theme &theme)
{
    auto box = std::make_unique<Container>(
        makeText(label, 10, 700, theme.color(QStringLiteral("onPrimary"))));
    box->setColor(fill);
    box->setPadding(insetsAll(theme.spacing.md));
    box->setAlignment(Alignment::center());
    box->setHeight(48);
    return std::make_unique<Expanded>(std::move(box));
}

static NodePtr buildSamplePage(const Theme &theme)
{
    auto column = std::make_unique<Column>();
    column->setCrossAxisAlignment(CrossAxisAlignment::Stretch);
    column->setMainAxisSize(MainAxisSize::Min);
    column->setSpacing(theme.spacing.lg);

    column->addChild(makeText(QStringLiteral("Folio"), 28, 700, theme.primary()));
    column->addChild(std::make_unique<Text>(kLorem));

    auto row = std::make_unique<Row>();
    row->setSpacing(theme.spacing.sm);
    row->addChild(makeSwatch(QStringLiteral("primary"), theme.primary(), theme));
    row->addChild(makeSwatch(QStringLiteral("secondary"), theme.secondary(), theme));
    row->addChild(makeSwatch(QStringLiteral("error"), theme.errorColor(), theme));
    column->addChild(std::move(row));

    auto card = std::make_unique<Container>(std::make_unique<Padding>(
        insetsAll(theme.spacing.lg),
        std::make_unique<Text>(QStringLiteral("A stack overlays its children; the badge "
                                              "in the corner is positioned against the "
                                              "card's right and top edges."))));
    card->setColor(theme.surface());
    card->setBorder(theme.onSurface(), 1);

    auto badgeBox = std::make_unique<Container>(
        makeText(QStringLiteral("NEW"), 8, 700, theme.color(QStringLiteral("onSecondary"))));
    badgeBox->setColor(theme.secondary());
    badgeBox->setPadding(insetsSymmetric(theme.spacing.sm, theme.spacing.xs));
    auto badge = std::make_unique<Positioned>(std::move(badgeBox));
    badge->setTop(theme.spacing.sm);
    badge->setRight(theme.spacing.sm);

    auto stack = std::make_unique<Stack>();
    stack->setFit(StackFit::Passthrough);
    stack->addChild(std::move(card));
    stack->addChild(std::move(badge));
    column->addChild(std::move(stack));

    auto centered = std::make_unique<Text>(QStringLiteral("centered"));
    centered->setAlignment(Qt::AlignHCenter);
    column->addChild(std::make_unique<SizedBox>(std::nullopt, 40,
                                                std::make_unique<Center>(std::move(centered))));
    return column;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("folio-render"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Render a sample Folio document to PDF"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption formatOption(
        QStringLiteral("format"), QStringLiteral("Page size: A3, A4, A5, Letter or Legal."),
        QStringLiteral("name"), QStringLiteral("A4"));
    const QCommandLineOption landscapeOption(
        QStringLiteral("landscape"), QStringLiteral("Use landscape orientation."));
    const QCommandLineOption verboseOption(
        QStringLiteral("verbose"), QStringLiteral("Annotate content streams and trace layout."));
    const QCommandLineOption noCompressOption(
        QStringLiteral("no-compress"), QStringLiteral("Write uncompressed streams."));
    const QCommandLineOption themeOption(
        QStringLiteral("theme"), QStringLiteral("Theme JSON file."), QStringLiteral("file"));
    parser.addOptions({formatOption, landscapeOption, verboseOption, noCompressOption, themeOption});
    parser.addPositionalArgument(QStringLiteral("output"), QStringLiteral("PDF file to write."));
    parser.process(app);

    QTextStream err(stderr);
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << parser.helpText();
        return 2;
    }

    DocumentOptions options;
    options.title = QStringLiteral("Folio sample");
    options.creator = QStringLiteral("folio-render");
    options.verbose = parser.isSet(verboseOption);
    options.compress = !parser.isSet(noCompressOption);

    const auto sizeId = PageFormat::sizeIdFromName(parser.value(formatOption));
    if (!sizeId) {
        err << "folio-render: unknown page format " << parser.value(formatOption) << Qt::endl;
        return 2;
    }
    options.defaultFormat.pageSizeId = *sizeId;
    if (parser.isSet(landscapeOption))
        options.defaultFormat.orientation = QPageLayout::Landscape;

    if (parser.isSet(themeOption) && !loadTheme(parser.value(themeOption), &options.theme, err))
        return 1;

    Document document(options);
    const Theme &theme = document.theme();

    PageOptions page;
    page.builder = [&theme]() { return buildSamplePage(theme); };
    if (!document.addPage(page)) {
        err << "folio-render: " << Folio::errorName(document.error()) << ": "
            << document.errorString() << Qt::endl;
        return 1;
    }

    if (!document.saveToFile(args.first())) {
        err << "folio-render: " << Folio::errorName(document.error()) << ": "
            << document.errorString() << Qt::endl;
        return 1;
    }

    if (options.verbose) {
        const DocumentStats stats = document.stats();
        QTextStream(stdout) << args.first() << ": " << stats.pageCount << " page(s), "
                            << stats.fontCount << " font(s), " << stats.bytesWritten
                            << " bytes, layout cache " << stats.cacheHits << " hit(s) / "
                            << stats.cacheMisses << " miss(es)" << Qt::endl;
    }
    return 0;
}
