// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace Tessera {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return QStringLiteral("ok");
    case ErrorKind::Validation:
        return QStringLiteral("validation");
    case ErrorKind::NotFound:
        return QStringLiteral("not-found");
    case ErrorKind::Conflict:
        return QStringLiteral("conflict");
    case ErrorKind::Tiling:
        return QStringLiteral("tiling");
    case ErrorKind::Driver:
        return QStringLiteral("driver");
    case ErrorKind::Permission:
        return QStringLiteral("permission");
    case ErrorKind::Io:
        return QStringLiteral("io");
    case ErrorKind::Busy:
        return QStringLiteral("busy");
    case ErrorKind::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

QDebug operator<<(QDebug debug, const OperationResult& result)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "OperationResult(" << errorKindToString(result.kind);
    if (!result.message.isEmpty()) {
        debug << ", " << result.message;
    }
    if (!result.conflictingId.isEmpty()) {
        debug << ", existing=" << result.conflictingId;
    }
    debug << ')';
    return debug;
}

void SwitchMetrics::recordError(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Validation:
    case ErrorKind::NotFound:
        ++validationErrors;
        break;
    case ErrorKind::Conflict:
        ++conflictErrors;
        break;
    case ErrorKind::Tiling:
        ++tilingErrors;
        break;
    case ErrorKind::Driver:
    case ErrorKind::Permission:
        ++driverErrors;
        break;
    default:
        break;
    }
}

} // namespace Tessera
