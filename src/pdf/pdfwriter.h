/*
 * pdfwriter.h — Low-level PDF object writer
 *
 * Writes the file header, numbered indirect objects (optionally with
 * Flate-compressed streams), the cross-reference table and the trailer
 * into an in-memory buffer.  Object numbers 1-3 are reserved for the
 * catalog, the info dictionary and the page tree root.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_PDFWRITER_H
#define FOLIO_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QRectF>
#include <QString>

namespace Pdf {

using ObjId = quint32;

// --- Serialization helpers (cf. PDF32000-2008, 7.3) ---

QByteArray toPdf(bool v);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

// Shortest fixed-point form with at most four decimals ("12", "0.5", "-3.25")
QByteArray toPdfNumber(qreal v);

QByteArray toObjRef(ObjId id);

// Escapes \ ( ) and non-printable bytes
QByteArray toLiteralString(const QByteArray &s);
QByteArray toLiteralString(const QString &s); // UTF-16BE with BOM if non-ASCII

QByteArray toHexString(const QByteArray &s);
QByteArray toHexString16(quint16 v); // "<XXXX>"

QByteArray toName(const QByteArray &s);
QByteArray toDateString(const QDateTime &dt);
QByteArray toRectangleArray(const QRectF &r);

// --- Resource dictionary ---

struct ResourceDict {
    QHash<QByteArray, ObjId> fonts; // resource name (without '/') -> font object
};

// --- Writer ---

class Writer
{
public:
    explicit Writer(QByteArray *output);

    void writeHeader();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    ObjId newObject();
    bool startObj(ObjId id);
    ObjId startObj();
    bool endObj(ObjId id);
    // Finishes a dictionary the caller opened with "<<" and appends the
    // stream.  Streams above 128 bytes are deflated when compress is set.
    bool endObjWithStream(ObjId id, const QByteArray &content, bool compress,
                          bool writeLength1 = false);

    // Fails if any reserved object was never written
    bool writeXrefAndTrailer(const QByteArray &fileId);

    ObjId catalogObj() const { return 1; }
    ObjId infoObj() const { return 2; }
    ObjId pagesObj() const { return 3; }

    qint64 bytesWritten() const { return m_output->size(); }
    bool hasFailed() const { return !m_errorString.isEmpty(); }
    QString errorString() const { return m_errorString; }

private:
    void fail(const QString &message);

    QByteArray *m_output;
    ObjId m_nextObj = 4;
    ObjId m_currentObj = 0;
    QList<qint64> m_offsets; // index = object number, -1 = not written
    QString m_errorString;
};

} // namespace Pdf

#endif // FOLIO_PDFWRITER_H
