#ifndef MCPHOST_JSON_RPC_HPP
#define MCPHOST_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for talking to tool servers.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *JSONRPC_VERSION = "2.0";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Build a JSON-RPC 2.0 request. A null or empty-object params is still sent as {}.
json build_request(const json &request_id, const std::string &method, const json &params);

// Build a JSON-RPC 2.0 notification (no id, no response expected).
json build_notification(const std::string &method, const json &params);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field, has a method).
bool is_notification(const json &message);

// Check if a message is a response: has a non-null id and a result or error member.
bool is_response(const json &message);

// Stable map key for an id, so numeric 7 and string "7" stay distinct.
std::string id_key(const json &request_id);

// Human-readable "code: message" text for a response's error object.
std::string describe_error(const json &error_object);

} // namespace json_rpc

#endif // MCPHOST_JSON_RPC_HPP
