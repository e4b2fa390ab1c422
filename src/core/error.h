/*
 * error.h — Failure kinds shared by layout, painting and serialization
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef FOLIO_ERROR_H
#define FOLIO_ERROR_H

#include <QString>

namespace Folio {

enum class Error {
    NoError,
    InvalidConstraints,      // constraints broke min/max invariants before layout
    ConstraintViolation,     // a node sized itself outside the constraints it got
    UnbalancedGraphicsState, // save/restore mismatch after a paint pass
    SerializationFailure,    // document could not be written consistently
};

QString errorName(Error error);

} // namespace Folio

#endif // FOLIO_ERROR_H
