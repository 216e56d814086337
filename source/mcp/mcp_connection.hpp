#ifndef MCPHOST_MCP_CONNECTION_HPP
#define MCPHOST_MCP_CONNECTION_HPP

// Spawn-and-handshake lifecycle for one tool server.
//
// connect() starts the configured command with piped stdio, waits out a short
// grace window to catch processes that die immediately, then performs the
// initialize / notifications/initialized exchange. Until that exchange has
// completed, send_request() refuses to put anything on the wire.

#include "mcp/mcp_config.hpp"
#include "mcp/mcp_errors.hpp"
#include "mcp/mcp_protocol_handler.hpp"
#include "platform/platform_abi.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace mcp_connection {

using json = nlohmann::json;
using mcp_errors::ErrorKind;

constexpr const char *kProtocolVersion = "2025-06-18";
constexpr const char *kClientName = "mcphost";
constexpr const char *kClientVersion = "0.1.0";

enum class ConnectionState { Disconnected, Connecting, Ready, Closed };

std::string to_string(ConnectionState state);

struct ConnectOptions {
    std::string client_name = kClientName;
    std::string client_title = "MCP Host";
    std::string client_version = kClientVersion;
    std::string protocol_version = kProtocolVersion;
    // How long a fresh process is watched for an immediate exit.
    int spawn_grace_milliseconds = 200;
    // Negative: use the server's configured timeout.
    int handshake_timeout_milliseconds = -1;
};

// Told why a Ready connection ended without disconnect() being called.
using DropListener = std::function<void(const std::string &reason)>;

struct ConnectResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

class ConnectionManager {
public:
    explicit ConnectionManager(ConnectOptions options = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Spawn and handshake. Calling it again while Ready is a successful no-op.
    ConnectResult connect(const mcp_config::ServerConfig &config);

    // Reject outstanding requests with ConnectionClosed, stop the process and
    // mark the connection Closed. Safe to call any number of times.
    void disconnect();

    // Fails with NotConnected unless the handshake has completed.
    mcp_protocol::RequestResult send_request(const std::string &method, const json &params,
                                             int timeout_milliseconds = -1);

    bool send_notification(const std::string &method, const json &params = json::object());

    // Liveness check used by the health monitor.
    mcp_protocol::RequestResult ping(int timeout_milliseconds = -1);

    bool is_connected() const;
    ConnectionState state() const;
    std::string server_name() const;
    int process_id() const;
    std::size_t pending_count() const;

    // Values negotiated by the last successful initialize.
    std::string protocol_version() const;
    json server_info() const;
    json capabilities() const;
    std::string instructions() const;

    // Listeners persist across reconnects.
    mcp_protocol::ListenerHandle subscribe_notifications(mcp_protocol::NotificationListener listener);
    void unsubscribe_notifications(mcp_protocol::ListenerHandle handle);

    // Runs on the protocol's listener thread; it must not call back into
    // connect() or disconnect() directly.
    void set_drop_listener(DropListener listener);

private:
    ConnectResult spawn_locked(const mcp_config::ServerConfig &config);
    ConnectResult handshake_locked(const mcp_config::ServerConfig &config);
    void teardown_locked(const std::string &reason);
    void forward_notification(const std::string &method, const json &params);
    std::shared_ptr<mcp_protocol::ProtocolHandler> ready_protocol() const;

    ConnectOptions options_;

    // Serializes connect/disconnect against each other.
    std::mutex lifecycle_mutex_;
    platform::ChildProcess process_;

    mutable std::mutex state_mutex_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::shared_ptr<mcp_protocol::ProtocolHandler> protocol_;
    std::string server_name_;
    int process_id_ = -1;
    std::string negotiated_version_;
    json server_info_ = json::object();
    json capabilities_ = json::object();
    std::string instructions_;

    std::mutex listener_mutex_;
    std::map<mcp_protocol::ListenerHandle, mcp_protocol::NotificationListener> listeners_;
    mcp_protocol::ListenerHandle next_listener_handle_ = 1;
    DropListener drop_listener_;
};

} // namespace mcp_connection

#endif // MCPHOST_MCP_CONNECTION_HPP
