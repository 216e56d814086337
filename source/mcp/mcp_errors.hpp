#ifndef MCPHOST_MCP_ERRORS_HPP
#define MCPHOST_MCP_ERRORS_HPP

// Failure categories shared by the protocol, connection and tool layers.
// Operations report them through result structs; nothing here is thrown.

#include <string>

namespace mcp_errors {

enum class ErrorKind {
    None,
    InvalidConfig,        // missing command, disabled server
    SpawnError,           // OS refused to start the process, or it died at once
    SpawnTimeout,         // process never became alive within the grace window
    HandshakeFailed,      // initialize round-trip errored or timed out
    Timeout,              // one request exceeded its deadline
    ConnectionClosed,     // process exited or its output stream ended
    NotConnected,         // call issued on a closed or not-yet-ready connection
    MalformedFrame,       // reply could not be parsed or had the wrong shape
    RemoteError,          // server answered with a JSON-RPC error object
    PermissionDenied,     // permission rules rejected the tool call
    ToolApplicationError  // tool ran and reported isError
};

// Stable name, e.g. "ConnectionClosed".
std::string to_string(ErrorKind kind);

} // namespace mcp_errors

#endif // MCPHOST_MCP_ERRORS_HPP
