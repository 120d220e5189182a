#pragma once

#include <QString>
#include <cstdint>

namespace nr {

// Numeric codes carried in the "error" object of an IPC error response.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    Timeout            = 2,
    PermissionDenied   = 3,
    NotFound           = 4,
    AlreadyExists      = 5,
    InternalError      = 6,
    Unsupported        = 7,
    StorageFailure     = 8,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::Timeout:            return QStringLiteral("TIMEOUT");
    case IpcErrorCode::PermissionDenied:   return QStringLiteral("PERMISSION_DENIED");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::AlreadyExists:      return QStringLiteral("ALREADY_EXISTS");
    case IpcErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case IpcErrorCode::Unsupported:        return QStringLiteral("UNSUPPORTED");
    case IpcErrorCode::StorageFailure:     return QStringLiteral("STORAGE_FAILURE");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace nr
