#pragma once

#include <QString>

namespace pa {

// Error codes carried in "error" frames.
enum class IpcErrorCode : int {
    InvalidParams      = 1,
    NotFound           = 4,
    ServiceUnavailable = 9,
};

inline QString ipcErrorCodeToString(IpcErrorCode code)
{
    switch (code) {
    case IpcErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case IpcErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case IpcErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

// Advisor service methods
namespace method {
inline constexpr char kAsk[] = "ask";
inline constexpr char kListPhones[] = "listPhones";
inline constexpr char kGetPhone[] = "getPhone";
inline constexpr char kGetHealth[] = "getHealth";
inline constexpr char kPing[] = "ping";
inline constexpr char kShutdown[] = "shutdown";
} // namespace method

} // namespace pa
