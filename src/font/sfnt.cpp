/*
 * sfnt.cpp — TrueType/OpenType subsetting through hb-subset
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sfnt.h"

#include <memory>

#include <QDebug>

#include <hb.h>
#include <hb-subset.h>

namespace sfnt {

using Blob = std::unique_ptr<hb_blob_t, decltype(&hb_blob_destroy)>;
using Face = std::unique_ptr<hb_face_t, decltype(&hb_face_destroy)>;
using Input = std::unique_ptr<hb_subset_input_t, decltype(&hb_subset_input_destroy)>;

std::optional<QByteArray> subset(const QByteArray &fontData, int faceIndex,
                                 const QSet<uint> &glyphIds)
{
    if (fontData.isEmpty() || faceIndex < 0)
        return std::nullopt;

    Blob source(hb_blob_create(fontData.constData(), static_cast<unsigned int>(fontData.size()),
                               HB_MEMORY_MODE_READONLY, nullptr, nullptr),
                &hb_blob_destroy);
    Face face(hb_face_create(source.get(), static_cast<unsigned int>(faceIndex)), &hb_face_destroy);
    if (hb_face_get_glyph_count(face.get()) == 0) {
        qWarning() << "sfnt: face" << faceIndex << "has no glyphs";
        return std::nullopt;
    }

    Input input(hb_subset_input_create_or_fail(), &hb_subset_input_destroy);
    if (!input)
        return std::nullopt;

    hb_set_t *glyphs = hb_subset_input_glyph_set(input.get());
    hb_set_add(glyphs, 0);
    for (uint gid : glyphIds)
        hb_set_add(glyphs, gid);
    hb_subset_input_set_flags(input.get(), HB_SUBSET_FLAGS_RETAIN_GIDS | HB_SUBSET_FLAGS_NAME_LEGACY);

    Face reduced(hb_subset_or_fail(face.get(), input.get()), &hb_face_destroy);
    if (!reduced) {
        qWarning() << "sfnt: hb-subset rejected a set of" << glyphIds.size() << "glyphs";
        return std::nullopt;
    }

    Blob out(hb_face_reference_blob(reduced.get()), &hb_blob_destroy);
    unsigned int length = 0;
    const char *bytes = hb_blob_get_data(out.get(), &length);
    if (!bytes || length == 0)
        return std::nullopt;
    return QByteArray(bytes, static_cast<qsizetype>(length));
}

} // namespace sfnt
