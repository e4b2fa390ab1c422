#include <gtest/gtest.h>

#include <QFileInfo>
#include <QTemporaryDir>
#include <QTimeZone>

#include <poppler-qt6.h>

#include "container.h"
#include "document.h"
#include "flex.h"
#include "graphics.h"
#include "padding.h"
#include "pagepainter.h"
#include "sizedbox.h"
#include "textnode.h"

using namespace Layout;

namespace {

// Ignores its constraints entirely
class OversizedNode : public Node {
public:
    std::optional<LayoutResult> layout(const LayoutContext &) override {
        LayoutResult r;
        r.size = QSizeF(5000, 5000);
        return r;
    }
    void paint(const PaintContext &) const override {}
    QString typeName() const override { return QStringLiteral("Oversized"); }
};

// Leaves a graphics state open after painting
class UnbalancedNode : public Node {
public:
    std::optional<LayoutResult> layout(const LayoutContext &context) override {
        LayoutResult r;
        r.size = context.constraints.smallest();
        return r;
    }
    void paint(const PaintContext &context) const override { context.painter->saveContext(); }
    QString typeName() const override { return QStringLiteral("Unbalanced"); }
};

// Restores a state it never saved
class OverRestoringNode : public Node {
public:
    std::optional<LayoutResult> layout(const LayoutContext &context) override {
        LayoutResult r;
        r.size = context.constraints.smallest();
        return r;
    }
    void paint(const PaintContext &context) const override { context.painter->restoreContext(); }
    QString typeName() const override { return QStringLiteral("OverRestoring"); }
};

// Flags its own destruction
class TrackedNode : public Node {
public:
    explicit TrackedNode(bool *destroyed) : m_destroyed(destroyed) {}
    ~TrackedNode() override { *m_destroyed = true; }

    std::optional<LayoutResult> layout(const LayoutContext &context) override {
        LayoutResult r;
        r.size = context.constraints.smallest();
        return r;
    }
    void paint(const PaintContext &) const override {}
    QString typeName() const override { return QStringLiteral("Tracked"); }

private:
    bool *m_destroyed;
};

DocumentOptions uncompressed() {
    DocumentOptions options;
    options.compress = false;
    options.title = QStringLiteral("Quarterly Report");
    return options;
}

PageOptions textPage(const QString &text) {
    PageOptions options;
    options.builder = [text]() -> NodePtr {
        auto column = std::make_unique<Column>();
        column->setMainAxisSize(MainAxisSize::Min);
        column->setCrossAxisAlignment(CrossAxisAlignment::Start);
        column->addChild(std::make_unique<Text>(text));
        auto swatch = std::make_unique<Container>();
        swatch->setColor(QColor(200, 30, 30));
        swatch->setHeight(40);
        column->addChild(std::make_unique<Padding>(insetsAll(8), std::move(swatch)));
        return column;
    };
    return options;
}

} // namespace

// ---------------------------------------------------------------------------
// Page geometry
// ---------------------------------------------------------------------------

TEST(Document, DefaultPageIsA4WithMargins) {
    Document doc;
    Page *page = doc.addPage();
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->size(), QSizeF(595, 842));
    EXPECT_EQ(page->contentArea(), QRectF(20, 20, 555, 802));
    EXPECT_EQ(page->index(), 0);
    EXPECT_EQ(doc.pageCount(), 1);
}

TEST(Document, PerPageFormats) {
    Document doc;
    Page *letter = doc.addPage(PageOptions::withFormat(QPageSize::Letter));
    ASSERT_NE(letter, nullptr);
    EXPECT_EQ(letter->size(), QSizeF(612, 792));

    PageOptions landscape;
    landscape.orientation = QPageLayout::Landscape;
    Page *wide = doc.addPage(landscape);
    ASSERT_NE(wide, nullptr);
    EXPECT_EQ(wide->size(), QSizeF(842, 595));

    Page *custom = doc.addPage(PageOptions::withSize(QSizeF(300, 400)));
    ASSERT_NE(custom, nullptr);
    EXPECT_EQ(custom->size(), QSizeF(300, 400));
    EXPECT_EQ(custom->index(), 2);
}

TEST(Document, RejectsImpossibleMargins) {
    Document doc;
    PageOptions options = PageOptions::withSize(QSizeF(100, 100));
    options.margins = QMarginsF(60, 10, 60, 10);
    EXPECT_EQ(doc.addPage(options), nullptr);
    EXPECT_EQ(doc.error(), Folio::Error::InvalidConstraints);
    EXPECT_EQ(doc.pageCount(), 0);
}

TEST(PageFormat, NamedSizesAreCaseInsensitive) {
    EXPECT_EQ(PageFormat::sizeIdFromName(QStringLiteral("letter")), QPageSize::Letter);
    EXPECT_EQ(PageFormat::sizeIdFromName(QStringLiteral("A5")), QPageSize::A5);
    EXPECT_FALSE(PageFormat::sizeIdFromName(QStringLiteral("B5")).has_value());
    EXPECT_EQ(PageFormat::supportedSizes().size(), 5);
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST(Document, ConstraintViolationDiscardsPage) {
    Document doc;
    PageOptions options;
    options.builder = [] { return NodePtr(std::make_unique<OversizedNode>()); };
    EXPECT_EQ(doc.addPage(options), nullptr);
    EXPECT_EQ(doc.error(), Folio::Error::ConstraintViolation);
    EXPECT_TRUE(doc.errorString().contains(QStringLiteral("Oversized")));
    EXPECT_EQ(doc.pageCount(), 0);
}

TEST(Document, UnbalancedPaintDiscardsPage) {
    Document doc;
    PageOptions options;
    options.builder = [] {
        auto node = std::make_unique<UnbalancedNode>();
        node->setKey(QStringLiteral("stray-save"));
        return NodePtr(std::move(node));
    };
    EXPECT_EQ(doc.addPage(options), nullptr);
    EXPECT_EQ(doc.error(), Folio::Error::UnbalancedGraphicsState);
    EXPECT_TRUE(doc.errorString().contains(QStringLiteral("stray-save")));
    EXPECT_EQ(doc.pageCount(), 0);
}

TEST(Document, ExtraRestoreAtRootDiscardsPage) {
    Document doc;
    PageOptions options;
    options.builder = [] {
        auto node = std::make_unique<OverRestoringNode>();
        node->setKey(QStringLiteral("stray-restore"));
        return NodePtr(std::move(node));
    };
    EXPECT_EQ(doc.addPage(options), nullptr);
    EXPECT_EQ(doc.error(), Folio::Error::UnbalancedGraphicsState);
    EXPECT_TRUE(doc.errorString().contains(QStringLiteral("stray-restore")));
    EXPECT_EQ(doc.pageCount(), 0);
}

TEST(Document, NodeTreeIsReleasedAfterPaint) {
    Document doc;
    bool destroyed = false;
    PageOptions options;
    options.builder = [&destroyed] { return NodePtr(std::make_unique<TrackedNode>(&destroyed)); };
    ASSERT_NE(doc.addPage(options), nullptr);
    EXPECT_TRUE(destroyed);
}

TEST(Document, RecoversAfterFailedPage) {
    Document doc;
    PageOptions bad;
    bad.builder = [] { return NodePtr(std::make_unique<OversizedNode>()); };
    ASSERT_EQ(doc.addPage(bad), nullptr);

    Page *good = doc.addPage(textPage(QStringLiteral("fine")));
    ASSERT_NE(good, nullptr);
    EXPECT_EQ(doc.error(), Folio::Error::NoError);
    EXPECT_EQ(good->index(), 0);
}

TEST(Document, UnregisteredFontFailsSerialization) {
    Document doc;
    Page *page = doc.addPage();
    ASSERT_NE(page, nullptr);
    page->graphics().beginText();
    page->graphics().setFont("F99", 12);
    page->graphics().endText();

    EXPECT_TRUE(doc.save().isEmpty());
    EXPECT_EQ(doc.error(), Folio::Error::SerializationFailure);
    EXPECT_TRUE(doc.errorString().contains(QStringLiteral("F99")));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST(Document, SavedFileStructure) {
    Document doc(uncompressed());
    ASSERT_NE(doc.addPage(textPage(QStringLiteral("Hello"))), nullptr);
    const QByteArray pdf = doc.save();
    ASSERT_FALSE(pdf.isEmpty()) << doc.errorString().toStdString();

    EXPECT_TRUE(pdf.startsWith("%PDF-1.7\n"));
    EXPECT_TRUE(pdf.endsWith("%%EOF\n"));
    EXPECT_TRUE(pdf.contains("/MediaBox [0 0 595 842]"));
    EXPECT_TRUE(pdf.contains("/BaseFont /Helvetica"));
    EXPECT_TRUE(pdf.contains("/Title (Quarterly Report)"));
    EXPECT_TRUE(pdf.contains("(Hello) Tj"));
    EXPECT_FALSE(pdf.contains("/FlateDecode"));

    const DocumentStats stats = doc.stats();
    EXPECT_EQ(stats.pageCount, 1);
    EXPECT_EQ(stats.fontCount, 1);
    EXPECT_EQ(stats.bytesWritten, pdf.size());
    EXPECT_GT(stats.cacheMisses, 0);
}

TEST(Document, SaveIsRepeatable) {
    DocumentOptions options = uncompressed();
    options.creationDate = QDateTime(QDate(2024, 1, 2), QTime(3, 4, 5), QTimeZone::utc());
    Document doc(options);
    ASSERT_NE(doc.addPage(textPage(QStringLiteral("again"))), nullptr);
    const QByteArray first = doc.save();
    ASSERT_FALSE(first.isEmpty());
    EXPECT_EQ(doc.save(), first);
}

TEST(Document, SaveToFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    Document doc;
    ASSERT_NE(doc.addPage(textPage(QStringLiteral("disk"))), nullptr);
    const QString path = dir.filePath(QStringLiteral("out.pdf"));
    ASSERT_TRUE(doc.saveToFile(path));
    EXPECT_GT(QFileInfo(path).size(), 0);

    EXPECT_FALSE(doc.saveToFile(dir.filePath(QStringLiteral("missing/dir/out.pdf"))));
    EXPECT_EQ(doc.error(), Folio::Error::SerializationFailure);
}

TEST(Document, ReadersAgreeOnPagesAndText) {
    Document doc;
    ASSERT_NE(doc.addPage(textPage(QStringLiteral("First page"))), nullptr);
    ASSERT_NE(doc.addPage(PageOptions::withFormat(QPageSize::Letter, [] {
        return NodePtr(std::make_unique<Padding>(insetsAll(30),
                                                 std::make_unique<Text>(QStringLiteral("Second page"))));
    })), nullptr);
    const QByteArray pdf = doc.save();
    ASSERT_FALSE(pdf.isEmpty());

    std::unique_ptr<Poppler::Document> reader = Poppler::Document::loadFromData(pdf);
    ASSERT_NE(reader, nullptr);
    ASSERT_EQ(reader->numPages(), 2);

    std::unique_ptr<Poppler::Page> first = reader->page(0);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->pageSizeF(), QSizeF(595, 842));
    EXPECT_TRUE(first->text(QRectF()).contains(QStringLiteral("First page")));

    std::unique_ptr<Poppler::Page> second = reader->page(1);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->pageSizeF(), QSizeF(612, 792));
    EXPECT_TRUE(second->text(QRectF()).contains(QStringLiteral("Second page")));
}

TEST(Document, TextIsPlacedInsideTheContentArea) {
    Document doc;
    ASSERT_NE(doc.addPage([] {
        PageOptions o;
        o.builder = [] { return NodePtr(std::make_unique<Text>(QStringLiteral("Corner"))); };
        return o;
    }()), nullptr);
    const QByteArray pdf = doc.save();
    std::unique_ptr<Poppler::Document> reader = Poppler::Document::loadFromData(pdf);
    ASSERT_NE(reader, nullptr);
    std::unique_ptr<Poppler::Page> page = reader->page(0);
    ASSERT_NE(page, nullptr);

    // Poppler reports top-down coordinates, like the layout
    EXPECT_TRUE(page->text(QRectF(15, 15, 200, 40)).contains(QStringLiteral("Corner")));
    EXPECT_FALSE(page->text(QRectF(15, 700, 200, 100)).contains(QStringLiteral("Corner")));
}
