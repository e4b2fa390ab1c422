/*
 * pdfgenerator.h — Painted pages + registered fonts → complete PDF file
 *
 * Standard fonts are written as Type1 with WinAnsiEncoding; every other
 * font as a subsetted CIDFontType2 with Identity-H encoding and a
 * ToUnicode CMap.  Generation refuses to produce a file whose content
 * streams reference a font resource that was never registered.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PDFGENERATOR_H
#define FOLIO_PDFGENERATOR_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QSet>
#include <QSizeF>
#include <QString>

#include "error.h"
#include "pdfwriter.h"

struct FontFace;

namespace Pdf {

class FontRegistry;
struct Font;

struct PageData {
    QSizeF size;             // MediaBox, points
    QByteArray content;      // uncompressed content stream
    QSet<QByteArray> fontsUsed;
};

struct DocumentInfo {
    QString title;
    QString author;
    QString subject;
    QString keywords;
    QString creator;
    QString producer = QStringLiteral("Folio");
    QDateTime creationDate;
};

class Generator
{
public:
    explicit Generator(FontRegistry *fonts);

    void setDocumentInfo(const DocumentInfo &info) { m_info = info; }
    void setCompress(bool compress) { m_compress = compress; }

    // Empty on failure; see error()
    QByteArray generate(const QList<PageData> &pages);

    Folio::Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

private:
    bool checkFontReferences(const QList<PageData> &pages);
    ObjId writeStandardFont(Writer &writer, const Font &font);
    ObjId writeCidFont(Writer &writer, const Font &font);
    QByteArray buildToUnicodeCMap(const FontFace *face) const;
    QByteArray fileId(const QList<PageData> &pages) const;
    void setError(const QString &message);

    FontRegistry *m_fonts;
    DocumentInfo m_info;
    bool m_compress = true;
    Folio::Error m_error = Folio::Error::NoError;
    QString m_errorString;
};

} // namespace Pdf

#endif // FOLIO_PDFGENERATOR_H
