#include "mcp/mcp_errors.hpp"

namespace mcp_errors {

std::string to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidConfig:
        return "InvalidConfig";
    case ErrorKind::SpawnError:
        return "SpawnError";
    case ErrorKind::SpawnTimeout:
        return "SpawnTimeout";
    case ErrorKind::HandshakeFailed:
        return "HandshakeFailed";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::ConnectionClosed:
        return "ConnectionClosed";
    case ErrorKind::NotConnected:
        return "NotConnected";
    case ErrorKind::MalformedFrame:
        return "MalformedFrame";
    case ErrorKind::RemoteError:
        return "RemoteError";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::ToolApplicationError:
        return "ToolApplicationError";
    }
    return "Unknown";
}

} // namespace mcp_errors
