/*
 * document.h — Page sequence, shared resources and serialization
 *
 * addPage() lays out and paints a page immediately: the builder's root
 * node is laid out inside the page's content area through the document's
 * ConstraintSolver, then painted onto the page's drawing surface.  The
 * tree is released once painted; pages keep only their content streams.
 * A page whose layout or paint fails is discarded whole.  save() walks all pages
 * and the font registry and produces the PDF bytes.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_DOCUMENT_H
#define FOLIO_DOCUMENT_H

#include <memory>
#include <vector>

#include <QByteArray>
#include <QList>
#include <QString>

#include "constraintsolver.h"
#include "documentoptions.h"
#include "error.h"
#include "page.h"

class FontManager;

namespace Pdf { class FontRegistry; }

struct DocumentStats {
    int pageCount = 0;
    int fontCount = 0;
    int cacheHits = 0;
    int cacheMisses = 0;
    qint64 bytesWritten = 0; // size of the last save()
};

class Document
{
public:
    explicit Document(const DocumentOptions &options = DocumentOptions());
    ~Document();

    Document(const Document &) = delete;
    Document &operator=(const Document &) = delete;

    // nullptr if the page could not be laid out or painted; see error()
    Page *addPage(const PageOptions &options = PageOptions());

    QList<Page *> pages() const;
    int pageCount() const { return static_cast<int>(m_pages.size()); }
    Page *page(int index) const;

    DocumentStats stats() const;

    // Empty on failure
    QByteArray save();
    bool saveToFile(const QString &filePath);

    Folio::Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    const DocumentOptions &options() const { return m_options; }
    const Theme &theme() const { return m_options.theme; }
    Pdf::FontRegistry *fonts() const { return m_fonts.get(); }
    FontManager *fontManager() const { return m_fontManager.get(); }
    Layout::ConstraintSolver &solver() { return m_solver; }

private:
    bool layoutAndPaint(Page &page, Layout::NodePtr root);
    void setError(Folio::Error error, const QString &message);

    DocumentOptions m_options;
    std::unique_ptr<FontManager> m_fontManager;
    std::unique_ptr<Pdf::FontRegistry> m_fonts;
    Layout::ConstraintSolver m_solver;
    std::vector<std::unique_ptr<Page>> m_pages;
    qint64 m_lastSaveSize = 0;

    Folio::Error m_error = Folio::Error::NoError;
    QString m_errorString;
};

#endif // FOLIO_DOCUMENT_H
