/*
 * error.cpp — Failure kinds shared by layout, painting and serialization
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "error.h"

namespace Folio {

QString errorName(Error error)
{
    switch (error) {
    case Error::NoError:
        return QStringLiteral("NoError");
    case Error::InvalidConstraints:
        return QStringLiteral("InvalidConstraints");
    case Error::ConstraintViolation:
        return QStringLiteral("ConstraintViolation");
    case Error::UnbalancedGraphicsState:
        return QStringLiteral("UnbalancedGraphicsState");
    case Error::SerializationFailure:
        return QStringLiteral("SerializationFailure");
    }
    return QStringLiteral("Unknown");
}

} // namespace Folio
