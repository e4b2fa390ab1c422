/*
 * pdfgenerator.cpp — Painted pages + registered fonts → complete PDF file
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfgenerator.h"
#include "fontmanager.h"
#include "fontregistry.h"
#include "standardfonts.h"

#include <QCryptographicHash>
#include <QDebug>

#include <algorithm>

namespace Pdf {

Generator::Generator(FontRegistry *fonts)
    : m_fonts(fonts)
{
}

void Generator::setError(const QString &message)
{
    m_error = Folio::Error::SerializationFailure;
    m_errorString = message;
    qWarning().noquote() << "PdfGenerator:" << message;
}

bool Generator::checkFontReferences(const QList<PageData> &pages)
{
    for (int i = 0; i < pages.size(); ++i) {
        for (const QByteArray &name : pages.at(i).fontsUsed) {
            if (!m_fonts->contains(name)) {
                setError(QStringLiteral("page %1 references unregistered font resource /%2")
                             .arg(i + 1).arg(QString::fromLatin1(name)));
                return false;
            }
        }
    }
    return true;
}

QByteArray Generator::fileId(const QList<PageData> &pages) const
{
    QCryptographicHash hash(QCryptographicHash::Md5);
    hash.addData(m_info.title.toUtf8());
    hash.addData(m_info.creationDate.toUTC().toString(Qt::ISODate).toLatin1());
    for (const PageData &page : pages)
        hash.addData(page.content);
    return hash.result();
}

QByteArray Generator::generate(const QList<PageData> &pages)
{
    m_error = Folio::Error::NoError;
    m_errorString.clear();

    if (!m_fonts) {
        setError(QStringLiteral("no font registry"));
        return {};
    }
    if (!checkFontReferences(pages))
        return {};

    QByteArray output;
    Writer writer(&output);
    writer.writeHeader();

    // Fonts
    ResourceDict resources;
    for (const Font *font : m_fonts->fonts()) {
        const ObjId obj = font->isEmbedded() ? writeCidFont(writer, *font)
                                             : writeStandardFont(writer, *font);
        if (!obj)
            return {};
        resources.fonts.insert(font->resourceName, obj);
    }

    // Pages
    QList<ObjId> pageObjIds;
    for (const PageData &page : pages) {
        const ObjId contentObj = writer.startObj();
        writer.write("<<\n");
        writer.endObjWithStream(contentObj, page.content, m_compress);

        const ObjId pageObj = writer.startObj();
        writer.write("<<\n");
        writer.write("/Type /Page\n");
        writer.write("/Parent " + toObjRef(writer.pagesObj()) + "\n");
        writer.write("/MediaBox [0 0 " + toPdfNumber(page.size.width()) + " "
                     + toPdfNumber(page.size.height()) + "]\n");
        writer.write("/Contents " + toObjRef(contentObj) + "\n");
        writer.write("/Resources ");
        writer.writeResourceDict(resources);
        writer.write(">>");
        writer.endObj(pageObj);
        pageObjIds.append(pageObj);
    }

    // Pages object
    writer.startObj(writer.pagesObj());
    writer.write("<<\n/Type /Pages\n/Kids [");
    for (ObjId id : pageObjIds)
        writer.write(toObjRef(id) + " ");
    writer.write("]\n/Count " + toPdf(pageObjIds.size()) + "\n>>");
    writer.endObj(writer.pagesObj());

    // Info object
    writer.startObj(writer.infoObj());
    writer.write("<<\n");
    writer.write("/Producer " + toLiteralString(m_info.producer) + "\n");
    if (!m_info.title.isEmpty())
        writer.write("/Title " + toLiteralString(m_info.title) + "\n");
    if (!m_info.author.isEmpty())
        writer.write("/Author " + toLiteralString(m_info.author) + "\n");
    if (!m_info.subject.isEmpty())
        writer.write("/Subject " + toLiteralString(m_info.subject) + "\n");
    if (!m_info.keywords.isEmpty())
        writer.write("/Keywords " + toLiteralString(m_info.keywords) + "\n");
    if (!m_info.creator.isEmpty())
        writer.write("/Creator " + toLiteralString(m_info.creator) + "\n");
    const QDateTime created = m_info.creationDate.isValid() ? m_info.creationDate
                                                            : QDateTime::currentDateTime();
    writer.write("/CreationDate " + toDateString(created) + "\n");
    writer.write(">>");
    writer.endObj(writer.infoObj());

    // Catalog object
    writer.startObj(writer.catalogObj());
    writer.write("<<\n/Type /Catalog\n/Pages " + toObjRef(writer.pagesObj()) + "\n>>");
    writer.endObj(writer.catalogObj());

    if (!writer.writeXrefAndTrailer(fileId(pages)) || writer.hasFailed()) {
        setError(writer.errorString());
        return {};
    }
    return output;
}

// --- Fonts ---

ObjId Generator::writeStandardFont(Writer &writer, const Font &font)
{
    const StandardFontMetrics &m = standardFontMetrics(*font.standard);
    const QByteArray baseFont(m.baseFont);

    const ObjId descObj = writer.startObj();
    writer.write("<<\n/Type /FontDescriptor\n");
    writer.write("/FontName " + toName(baseFont) + "\n");
    writer.write("/Flags " + toPdf(m.flags) + "\n");
    writer.write("/FontBBox [" + toPdf(m.bbox[0]) + " " + toPdf(m.bbox[1]) + " "
                 + toPdf(m.bbox[2]) + " " + toPdf(m.bbox[3]) + "]\n");
    writer.write("/ItalicAngle " + toPdfNumber(m.italicAngle) + "\n");
    writer.write("/Ascent " + toPdf(m.ascender) + "\n");
    writer.write("/Descent " + toPdf(m.descender) + "\n");
    writer.write("/CapHeight " + toPdf(m.capHeight) + "\n");
    writer.write("/XHeight " + toPdf(m.xHeight) + "\n");
    writer.write("/StemV " + toPdf(m.stemV) + "\n");
    writer.write(">>");
    writer.endObj(descObj);

    // Widths match what layout measured, including the non-ASCII codes
    QByteArray widths("[");
    for (int code = 32; code <= 255; ++code) {
        widths += toPdf(standardGlyphWidth(*font.standard, static_cast<uchar>(code)));
        widths += (code % 16 == 15) ? "\n" : " ";
    }
    widths += "]";

    const ObjId fontObj = writer.startObj();
    writer.write("<<\n/Type /Font\n/Subtype /Type1\n");
    writer.write("/Name " + toName(font.resourceName) + "\n");
    writer.write("/BaseFont " + toName(baseFont) + "\n");
    writer.write("/Encoding /WinAnsiEncoding\n");
    writer.write("/FirstChar 32\n/LastChar 255\n");
    writer.write("/Widths " + widths + "\n");
    writer.write("/FontDescriptor " + toObjRef(descObj) + "\n");
    writer.write(">>");
    writer.endObj(fontObj);
    return fontObj;
}

ObjId Generator::writeCidFont(Writer &writer, const Font &font)
{
    FontManager *fm = m_fonts->fontManager();
    const FontFace *face = font.face;
    if (!fm || !face) {
        setError(QStringLiteral("embedded font /%1 has no font data")
                     .arg(QString::fromLatin1(font.resourceName)));
        return 0;
    }
    const FaceDescriptor &desc = face->descriptor;

    // Glyph program, reduced to what the pages drew
    const std::optional<QByteArray> subset = fm->subset(face);
    const ObjId programObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjWithStream(programObj, subset.value_or(face->data), m_compress, true);

    // Subset tags only need to be unique within the file, so they spell
    // the resource number in base 26.
    QByteArray baseFont = desc.postScriptName;
    if (subset) {
        QByteArray tag(6, 'A');
        int n = font.resourceName.mid(1).toInt();
        for (int i = 5; i >= 0 && n > 0; --i, n /= 26)
            tag[i] = static_cast<char>('A' + n % 26);
        baseFont = tag + '+' + baseFont;
    }

    const ObjId descriptorObj = writer.startObj();
    writer.write("<<\n/Type /FontDescriptor\n");
    writer.write("/FontName " + toName(baseFont) + "\n");
    writer.write("/Flags " + toPdf(desc.flags) + "\n");
    writer.write("/FontBBox [" + toPdf(desc.bbox[0]) + " " + toPdf(desc.bbox[1]) + " "
                 + toPdf(desc.bbox[2]) + " " + toPdf(desc.bbox[3]) + "]\n");
    writer.write("/ItalicAngle " + toPdfNumber(desc.italicAngle) + "\n");
    writer.write("/Ascent " + toPdf(desc.ascent) + "\n");
    writer.write("/Descent " + toPdf(desc.descent) + "\n");
    writer.write("/CapHeight " + toPdf(desc.capHeight) + "\n");
    writer.write("/StemV 80\n");
    writer.write("/FontFile2 " + toObjRef(programObj) + "\n");
    writer.write(">>");
    writer.endObj(descriptorObj);

    QList<uint> gids(face->usedGlyphs.cbegin(), face->usedGlyphs.cend());
    std::sort(gids.begin(), gids.end());
    const ObjId widthsObj = writer.startObj();
    writer.write("[");
    for (uint gid : std::as_const(gids))
        writer.write(toPdf(gid) + " [" + toPdf(fm->glyphWidth(face, gid)) + "] ");
    writer.write("]");
    writer.endObj(widthsObj);

    const ObjId cmapObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjWithStream(cmapObj, buildToUnicodeCMap(face), m_compress);

    const ObjId fontObj = writer.startObj();
    writer.write("<<\n/Type /Font\n/Subtype /Type0\n");
    writer.write("/Name " + toName(font.resourceName) + "\n");
    writer.write("/BaseFont " + toName(baseFont) + "\n");
    writer.write("/Encoding /Identity-H\n");
    writer.write("/ToUnicode " + toObjRef(cmapObj) + "\n");
    writer.write("/DescendantFonts [<<\n/Type /Font\n/Subtype /CIDFontType2\n");
    writer.write("/BaseFont " + toName(baseFont) + "\n");
    writer.write("/FontDescriptor " + toObjRef(descriptorObj) + "\n");
    writer.write("/CIDSystemInfo << /Registry (Adobe) /Ordering (Identity) /Supplement 0 >>\n");
    writer.write("/DW 1000\n");
    writer.write("/W " + toObjRef(widthsObj) + "\n");
    writer.write("/CIDToGIDMap /Identity\n");
    writer.write(">>]\n>>");
    writer.endObj(fontObj);
    return fontObj;
}

static QByteArray utf16Hex(uint codePoint)
{
    if (QChar::requiresSurrogates(codePoint)) {
        return "<" + QString::asprintf("%04X%04X", uint(QChar::highSurrogate(codePoint)),
                                       uint(QChar::lowSurrogate(codePoint))).toLatin1() + ">";
    }
    return "<" + QString::asprintf("%04X", codePoint).toLatin1() + ">";
}

QByteArray Generator::buildToUnicodeCMap(const FontFace *face) const
{
    QByteArray cmap;
    cmap += "/CIDInit /ProcSet findresource begin\n";
    cmap += "12 dict begin\n";
    cmap += "begincmap\n";
    cmap += "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n";
    cmap += "/CMapName /Adobe-Identity-UCS def\n";
    cmap += "/CMapType 2 def\n";
    cmap += "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n";

    QList<uint> gids = face->glyphToUnicode.keys();
    std::sort(gids.begin(), gids.end());

    // Write in batches of 100
    int pos = 0;
    while (pos < gids.size()) {
        const int batchSize = qMin(100, static_cast<int>(gids.size()) - pos);
        cmap += toPdf(batchSize) + " beginbfchar\n";
        for (int i = 0; i < batchSize; ++i) {
            const uint gid = gids.at(pos + i);
            cmap += toHexString16(static_cast<quint16>(gid)) + " "
                  + utf16Hex(face->glyphToUnicode.value(gid)) + "\n";
        }
        cmap += "endbfchar\n";
        pos += batchSize;
    }

    cmap += "endcmap\n";
    cmap += "CMapName currentdict /CMap defineresource pop\n";
    cmap += "end\nend\n";
    return cmap;
}

} // namespace Pdf
