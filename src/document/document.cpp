/*
 * document.cpp — Page sequence, shared resources and serialization
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "document.h"
#include "fontmanager.h"
#include "fontregistry.h"
#include "pagepainter.h"
#include "pdfgenerator.h"

#include <QDebug>
#include <QFile>

Document::Document(const DocumentOptions &options)
    : m_options(options)
    , m_fontManager(std::make_unique<FontManager>())
    , m_fonts(std::make_unique<Pdf::FontRegistry>(m_fontManager.get()))
{
}

Document::~Document() = default;

void Document::setError(Folio::Error error, const QString &message)
{
    m_error = error;
    m_errorString = message;
    qWarning().noquote() << "Document:" << message;
}

QList<Page *> Document::pages() const
{
    QList<Page *> result;
    for (const auto &p : m_pages)
        result.append(p.get());
    return result;
}

Page *Document::page(int index) const
{
    if (index < 0 || index >= pageCount())
        return nullptr;
    return m_pages[static_cast<size_t>(index)].get();
}

// --- Page production ---

Page *Document::addPage(const PageOptions &options)
{
    m_error = Folio::Error::NoError;
    m_errorString.clear();

    const PageFormat format = options.resolve(m_options.defaultFormat);
    if (!format.isValid()) {
        const QSizeF size = format.pageSizePoints();
        setError(Folio::Error::InvalidConstraints,
                 QStringLiteral("invalid page geometry %1x%2 with margins (%3, %4, %5, %6)")
                     .arg(size.width()).arg(size.height())
                     .arg(format.margins.left()).arg(format.margins.top())
                     .arg(format.margins.right()).arg(format.margins.bottom()));
        return nullptr;
    }

    auto page = std::make_unique<Page>(pageCount(), format, m_options.verbose);

    if (options.builder) {
        Layout::NodePtr root = options.builder();
        if (root && !layoutAndPaint(*page, std::move(root)))
            return nullptr;
    }

    if (m_options.verbose) {
        qDebug() << "Document: page" << page->index() + 1 << page->size()
                 << "content" << page->contentArea();
    }

    Page *raw = page.get();
    m_pages.push_back(std::move(page));
    return raw;
}

bool Document::layoutAndPaint(Page &page, Layout::NodePtr root)
{
    // Node addresses from earlier pages may be reused by this tree
    m_solver.clearCache();
    m_solver.clearError();

    Layout::LayoutContext ctx;
    ctx.constraints = Layout::BoxConstraints::loose(page.contentArea().size());
    ctx.theme = &m_options.theme;
    ctx.fontMetrics = m_fonts.get();
    ctx.solver = &m_solver;

    const std::optional<Layout::LayoutResult> result = m_solver.solveLayout(*root, ctx);
    if (!result) {
        setError(m_solver.error() == Folio::Error::NoError ? Folio::Error::ConstraintViolation
                                                           : m_solver.error(),
                 QStringLiteral("page %1: %2").arg(page.index() + 1).arg(m_solver.errorString()));
        return false;
    }

    if (m_options.verbose) {
        qDebug() << "Document: laid out" << root->identity() << "at" << result->size
                 << "cache hits" << m_solver.hitCount() << "misses" << m_solver.missCount();
    }

    Render::PagePainter painter(&page.graphics(), m_fonts.get(), page.size().height());
    Layout::PaintContext pctx;
    pctx.size = result->size;
    pctx.theme = &m_options.theme;
    pctx.painter = &painter;
    pctx.fonts = m_fonts.get();
    pctx.pageSize = page.size();
    pctx.contentArea = page.contentArea();

    const bool balanced = Layout::paintChild(*root, pctx, page.contentArea().topLeft(), result->size);
    if (!balanced || painter.hasUnbalancedState() || page.graphics().depth() != 0) {
        const QString detail = painter.hasUnbalancedState()
            ? painter.errorString()
            : QStringLiteral("graphics state depth %1 after paint").arg(page.graphics().depth());
        setError(Folio::Error::UnbalancedGraphicsState,
                 QStringLiteral("page %1: %2").arg(page.index() + 1).arg(detail));
        return false;
    }

    return true;
}

// --- Serialization ---

QByteArray Document::save()
{
    m_error = Folio::Error::NoError;
    m_errorString.clear();

    QList<Pdf::PageData> pageData;
    for (const auto &p : m_pages)
        pageData.append(p->toPageData());

    Pdf::DocumentInfo info;
    info.title = m_options.title;
    info.author = m_options.author;
    info.subject = m_options.subject;
    info.keywords = m_options.keywords;
    info.creator = m_options.creator;
    info.creationDate = m_options.creationDate;

    Pdf::Generator generator(m_fonts.get());
    generator.setDocumentInfo(info);
    generator.setCompress(m_options.compress);

    QByteArray data = generator.generate(pageData);
    if (data.isEmpty()) {
        setError(generator.error(), generator.errorString());
        return {};
    }

    m_lastSaveSize = data.size();
    return data;
}

bool Document::saveToFile(const QString &filePath)
{
    const QByteArray data = save();
    if (data.isEmpty())
        return false;

    QFile f(filePath);
    if (!f.open(QIODevice::WriteOnly)) {
        setError(Folio::Error::SerializationFailure,
                 QStringLiteral("cannot open %1: %2").arg(filePath, f.errorString()));
        return false;
    }
    if (f.write(data) != data.size()) {
        setError(Folio::Error::SerializationFailure,
                 QStringLiteral("short write to %1: %2").arg(filePath, f.errorString()));
        return false;
    }
    return true;
}

DocumentStats Document::stats() const
{
    DocumentStats s;
    s.pageCount = pageCount();
    s.fontCount = m_fonts->fontCount();
    s.cacheHits = m_solver.hitCount();
    s.cacheMisses = m_solver.missCount();
    s.bytesWritten = m_lastSaveSize;
    return s;
}
