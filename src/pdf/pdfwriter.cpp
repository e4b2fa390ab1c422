/*
 * pdfwriter.cpp — Low-level PDF object writer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <algorithm>

#include <QDebug>
#include <zlib.h>

namespace Pdf {

static const char kHexDigits[] = "0123456789ABCDEF";

// --- Serialization helpers ---

QByteArray toPdf(bool v)
{
    return v ? "true" : "false";
}

QByteArray toPdfNumber(qreal v)
{
    if (!qIsFinite(v))
        return "0";
    QByteArray s = QByteArray::number(v, 'f', 4);
    if (s.contains('.')) {
        while (s.endsWith('0'))
            s.chop(1);
        if (s.endsWith('.'))
            s.chop(1);
    }
    if (s == "-0")
        s = "0";
    return s;
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    QByteArray result("(");
    result.reserve(s.size() + 2);
    for (char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\');
            result.append(ch);
        } else if (v < 32 || v >= 127) {
            result.append('\\');
            result.append(static_cast<char>('0' + ((v >> 6) & 7)));
            result.append(static_cast<char>('0' + ((v >> 3) & 7)));
            result.append(static_cast<char>('0' + (v & 7)));
        } else {
            result.append(ch);
        }
    }
    result.append(')');
    return result;
}

QByteArray toLiteralString(const QString &s)
{
    bool ascii = true;
    for (QChar c : s) {
        if (c.unicode() > 126) {
            ascii = false;
            break;
        }
    }
    if (ascii)
        return toLiteralString(s.toLatin1());

    QByteArray utf16("\xfe\xff", 2);
    for (QChar c : s) {
        utf16.append(static_cast<char>(c.unicode() >> 8));
        utf16.append(static_cast<char>(c.unicode() & 0xff));
    }
    return toLiteralString(utf16);
}

QByteArray toHexString(const QByteArray &s)
{
    QByteArray result("<");
    result.reserve(s.size() * 2 + 2);
    for (char ch : s) {
        const uchar v = static_cast<uchar>(ch);
        result.append(kHexDigits[v >> 4]);
        result.append(kHexDigits[v & 0xf]);
    }
    result.append('>');
    return result;
}

QByteArray toHexString16(quint16 v)
{
    QByteArray result("<");
    for (int shift = 12; shift >= 0; shift -= 4)
        result.append(kHexDigits[(v >> shift) & 0xf]);
    result.append('>');
    return result;
}

QByteArray toName(const QByteArray &s)
{
    static const QByteArray delimiters("()<>[]{}/%");
    QByteArray result("/");
    for (char ch : s) {
        const uchar c = static_cast<uchar>(ch);
        if (c <= 32 || c >= 127 || c == '#' || delimiters.contains(ch)) {
            result.append('#');
            result.append(kHexDigits[c >> 4]);
            result.append(kHexDigits[c & 0xf]);
        } else {
            result.append(ch);
        }
    }
    return result;
}

QByteArray toDateString(const QDateTime &dt)
{
    return "(D:" + dt.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1() + "Z)";
}

QByteArray toRectangleArray(const QRectF &r)
{
    return "[" + toPdfNumber(r.left()) + " " + toPdfNumber(r.top()) + " "
         + toPdfNumber(r.right()) + " " + toPdfNumber(r.bottom()) + "]";
}

// --- Writer ---

Writer::Writer(QByteArray *output)
    : m_output(output)
{
    m_output->clear();
    m_offsets.fill(-1, 4);
}

void Writer::fail(const QString &message)
{
    if (m_errorString.isEmpty())
        m_errorString = message;
    qWarning().noquote() << "PdfWriter:" << message;
}

void Writer::write(const QByteArray &bytes)
{
    m_output->append(bytes);
}

void Writer::writeHeader()
{
    write("%PDF-1.7\n");
    write("%\xc7\xec\x8f\xa2\n"); // high-bit bytes mark the file as binary
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    write("<< /ProcSet [/PDF /Text]\n");
    if (!dict.fonts.isEmpty()) {
        // Sorted so identical documents serialize identically
        QList<QByteArray> names = dict.fonts.keys();
        std::sort(names.begin(), names.end());
        write("/Font <<\n");
        for (const QByteArray &name : names)
            write(toName(name) + " " + toObjRef(dict.fonts.value(name)) + "\n");
        write(">>\n");
    }
    write(">>\n");
}

ObjId Writer::newObject()
{
    m_offsets.append(-1);
    return m_nextObj++;
}

bool Writer::startObj(ObjId id)
{
    if (m_currentObj != 0) {
        fail(QStringLiteral("object %1 started while %2 is open").arg(id).arg(m_currentObj));
        return false;
    }
    if (id == 0 || id >= m_nextObj) {
        fail(QStringLiteral("object %1 was never reserved").arg(id));
        return false;
    }
    if (m_offsets[id] >= 0) {
        fail(QStringLiteral("object %1 written twice").arg(id));
        return false;
    }

    m_currentObj = id;
    m_offsets[id] = m_output->size();
    write(toPdf(id) + " 0 obj\n");
    return true;
}

ObjId Writer::startObj()
{
    ObjId id = newObject();
    startObj(id);
    return id;
}

bool Writer::endObj(ObjId id)
{
    if (m_currentObj != id) {
        fail(QStringLiteral("object %1 closed while %2 is open").arg(id).arg(m_currentObj));
        return false;
    }
    m_currentObj = 0;
    write("\nendobj\n");
    return true;
}

bool Writer::endObjWithStream(ObjId id, const QByteArray &content, bool compress,
                              bool writeLength1)
{
    QByteArray data = content;
    bool deflated = false;
    if (compress && content.size() > 128) {
        uLongf destLen = compressBound(static_cast<uLong>(content.size()));
        QByteArray packed(static_cast<qsizetype>(destLen), Qt::Uninitialized);
        int zret = ::compress2(reinterpret_cast<Bytef *>(packed.data()), &destLen,
                               reinterpret_cast<const Bytef *>(content.constData()),
                               static_cast<uLong>(content.size()), Z_DEFAULT_COMPRESSION);
        if (zret == Z_OK) {
            packed.resize(static_cast<qsizetype>(destLen));
            data = packed;
            deflated = true;
        } else {
            qWarning() << "PdfWriter: zlib compression failed, writing stream uncompressed:" << zret;
        }
    }

    write("/Length " + toPdf(data.size()) + "\n");
    if (deflated)
        write("/Filter /FlateDecode\n");
    if (writeLength1)
        write("/Length1 " + toPdf(content.size()) + "\n");
    write(">>\nstream\n");
    write(data);
    write("\nendstream");
    return endObj(id);
}

bool Writer::writeXrefAndTrailer(const QByteArray &fileId)
{
    if (m_currentObj != 0)
        fail(QStringLiteral("object %1 left open at end of file").arg(m_currentObj));
    for (ObjId id = 1; id < m_nextObj; ++id) {
        if (m_offsets[id] < 0)
            fail(QStringLiteral("object %1 was reserved but never written").arg(id));
    }
    if (hasFailed())
        return false;

    const qint64 startXref = m_output->size();
    write("xref\n");
    write("0 " + toPdf(m_nextObj) + "\n");
    write("0000000000 65535 f \n");
    for (ObjId id = 1; id < m_nextObj; ++id) {
        QByteArray offset = QByteArray::number(m_offsets[id]).rightJustified(10, '0');
        write(offset + " 00000 n \n");
    }

    const QByteArray idHex = toHexString(fileId);
    write("trailer\n<<\n");
    write("/Size " + toPdf(m_nextObj) + "\n");
    write("/Root " + toObjRef(catalogObj()) + "\n");
    write("/Info " + toObjRef(infoObj()) + "\n");
    write("/ID [" + idHex + " " + idHex + "]\n");
    write(">>\nstartxref\n");
    write(toPdf(startXref) + "\n%%EOF\n");
    return true;
}

} // namespace Pdf
