#include "mcp/mcp_connection.hpp"

#include "utils/debug_log.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

namespace mcp_connection {

namespace {

constexpr int kSpawnPollMilliseconds = 10;
// Exit status the shell convention (and posix_spawnp's child) uses for "could not exec".
constexpr int kExecFailureStatus = 127;

ConnectResult make_failure(ErrorKind kind, const std::string &message) {
    ConnectResult result;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

std::string describe_command(const mcp_config::ServerConfig &config) {
    std::string command_line = config.command;
    for (const auto &argument : config.args) {
        command_line += " " + argument;
    }
    return command_line;
}

} // namespace

std::string to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "disconnected";
    case ConnectionState::Connecting:
        return "connecting";
    case ConnectionState::Ready:
        return "ready";
    case ConnectionState::Closed:
        return "closed";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(ConnectOptions options) : options_(std::move(options)) {}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

ConnectResult ConnectionManager::connect(const mcp_config::ServerConfig &config) {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ConnectionState::Ready && protocol_ && protocol_->is_open()) {
            debug_log::log("MCP server '" + server_name_ + "' is already connected");
            ConnectResult result;
            result.success = true;
            return result;
        }
    }

    if (config.command.empty()) {
        std::string message = "MCP server '" + config.name + "' has no command configured";
        debug_log::error(message);
        return make_failure(ErrorKind::InvalidConfig, message);
    }
    if (!config.enabled) {
        std::string message = "MCP server '" + config.name + "' is disabled";
        debug_log::warn(message);
        return make_failure(ErrorKind::InvalidConfig, message);
    }

    // Leftovers of a connection that died on its own.
    teardown_locked("reconnecting");

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = ConnectionState::Connecting;
        server_name_ = config.name;
    }

    ConnectResult spawned = spawn_locked(config);
    if (!spawned.success) {
        debug_log::error("Failed to start MCP server '" + config.name + "' (" + describe_command(config) +
                         "): " + spawned.error_message);
        teardown_locked(spawned.error_message);
        return spawned;
    }

    ConnectResult handshake = handshake_locked(config);
    if (!handshake.success) {
        debug_log::error("MCP server '" + config.name + "' (" + describe_command(config) +
                         ") failed to initialize: " + handshake.error_message);
        teardown_locked(handshake.error_message);
        return handshake;
    }

    debug_log::log("Connected to MCP server '" + config.name + "' (pid " +
                   std::to_string(process_.process_id()) + ")");
    return handshake;
}

ConnectResult ConnectionManager::spawn_locked(const mcp_config::ServerConfig &config) {
    platform::SpawnResult spawn_result = platform::spawn_process(config.command, config.args, config.env);
    if (!spawn_result.success) {
        return make_failure(ErrorKind::SpawnError, spawn_result.error_message);
    }
    process_ = platform::ChildProcess(spawn_result);

    // Watch the grace window for a process that exits straight away.
    bool seen_alive = false;
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(options_.spawn_grace_milliseconds);
    do {
        if (process_.has_exited()) {
            int status = process_.exit_status();
            std::string message = status == kExecFailureStatus
                                      ? "command not found or not executable: " + config.command
                                      : "process exited during startup with status " + std::to_string(status);
            return make_failure(ErrorKind::SpawnError, message);
        }
        if (!seen_alive && platform::is_process_alive(process_.process_id())) {
            seen_alive = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kSpawnPollMilliseconds));
    } while (std::chrono::steady_clock::now() < deadline);

    if (!seen_alive) {
        return make_failure(ErrorKind::SpawnTimeout,
                            "process did not become alive within " +
                                std::to_string(options_.spawn_grace_milliseconds) + "ms");
    }

    auto protocol = std::make_shared<mcp_protocol::ProtocolHandler>(
        config.name, process_.stdin_fd(), process_.stdout_fd(), process_.stderr_fd(), config.timeout_milliseconds);

    mcp_protocol::ProtocolHandler *protocol_address = protocol.get();
    protocol->set_close_listener([this, protocol_address](const std::string &reason) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (protocol_.get() != protocol_address || state_ == ConnectionState::Closed) {
                return;
            }
            debug_log::log("MCP server '" + server_name_ + "' connection closed: " + reason);
            dropped = state_ == ConnectionState::Ready;
            state_ = ConnectionState::Closed;
        }
        DropListener listener;
        {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            listener = drop_listener_;
        }
        if (dropped && listener) {
            listener(reason);
        }
    });
    protocol->subscribe_notifications(
        [this](const std::string &method, const json &params) { forward_notification(method, params); });

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        protocol_ = protocol;
        process_id_ = process_.process_id();
    }
    protocol->start();

    ConnectResult result;
    result.success = true;
    return result;
}

ConnectResult ConnectionManager::handshake_locked(const mcp_config::ServerConfig &config) {
    std::shared_ptr<mcp_protocol::ProtocolHandler> protocol;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        protocol = protocol_;
    }

    json client_info;
    client_info["name"] = options_.client_name;
    client_info["title"] = options_.client_title;
    client_info["version"] = options_.client_version;

    json capabilities;
    capabilities["tools"] = json::object();
    capabilities["resources"] = json::object();
    capabilities["prompts"] = json::object();
    capabilities["sampling"] = json::object();
    capabilities["elicitation"] = json::object();

    json params;
    params["protocolVersion"] = options_.protocol_version;
    params["capabilities"] = capabilities;
    params["clientInfo"] = client_info;

    const int timeout = options_.handshake_timeout_milliseconds > 0 ? options_.handshake_timeout_milliseconds
                                                                   : config.timeout_milliseconds;
    mcp_protocol::RequestResult reply = protocol->send_request("initialize", params, timeout);
    if (!reply.success) {
        return make_failure(ErrorKind::HandshakeFailed,
                            "initialize failed (" + mcp_errors::to_string(reply.error_kind) +
                                "): " + reply.error_message);
    }
    if (!reply.result.is_object()) {
        return make_failure(ErrorKind::HandshakeFailed, "initialize returned a non-object result");
    }

    if (!protocol->send_notification("notifications/initialized", json::object())) {
        return make_failure(ErrorKind::HandshakeFailed, "failed to send notifications/initialized");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!protocol->is_open()) {
        return make_failure(ErrorKind::HandshakeFailed, "connection closed during initialization");
    }
    const json &result = reply.result;
    negotiated_version_ = result.value("protocolVersion", options_.protocol_version);
    server_info_ = result.contains("serverInfo") && result["serverInfo"].is_object() ? result["serverInfo"]
                                                                                      : json::object();
    capabilities_ = result.contains("capabilities") && result["capabilities"].is_object()
                        ? result["capabilities"]
                        : json::object();
    instructions_ = result.contains("instructions") && result["instructions"].is_string()
                        ? result["instructions"].get<std::string>()
                        : "";
    state_ = ConnectionState::Ready;

    ConnectResult success;
    success.success = true;
    return success;
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    teardown_locked("disconnected");
}

// Protocol first so the reader stops before the pipes it polls are closed.
void ConnectionManager::teardown_locked(const std::string &reason) {
    std::shared_ptr<mcp_protocol::ProtocolHandler> protocol;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        protocol = std::move(protocol_);
        protocol_.reset();
        if (protocol || process_.process_id() > 0) {
            state_ = ConnectionState::Closed;
        }
        process_id_ = -1;
    }

    if (protocol) {
        protocol->close(reason);
        protocol->clear_listeners();
    }
    if (process_.process_id() > 0) {
        debug_log::log("Stopping MCP server '" + server_name() + "' (pid " + std::to_string(process_.process_id()) +
                       ")");
        process_.terminate();
    }
}

std::shared_ptr<mcp_protocol::ProtocolHandler> ConnectionManager::ready_protocol() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ConnectionState::Ready) {
        return nullptr;
    }
    return protocol_;
}

mcp_protocol::RequestResult ConnectionManager::send_request(const std::string &method, const json &params,
                                                            int timeout_milliseconds) {
    auto protocol = ready_protocol();
    if (!protocol) {
        mcp_protocol::RequestResult result;
        result.error_kind = ErrorKind::NotConnected;
        result.error_message = "MCP server '" + server_name() + "' is not connected";
        return result;
    }
    return protocol->send_request(method, params, timeout_milliseconds);
}

bool ConnectionManager::send_notification(const std::string &method, const json &params) {
    auto protocol = ready_protocol();
    return protocol && protocol->send_notification(method, params);
}

mcp_protocol::RequestResult ConnectionManager::ping(int timeout_milliseconds) {
    return send_request("ping", json::object(), timeout_milliseconds);
}

bool ConnectionManager::is_connected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == ConnectionState::Ready && protocol_ && protocol_->is_open();
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string ConnectionManager::server_name() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_name_;
}

int ConnectionManager::process_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return process_id_;
}

std::size_t ConnectionManager::pending_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return protocol_ ? protocol_->pending_count() : 0;
}

std::string ConnectionManager::protocol_version() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return negotiated_version_;
}

json ConnectionManager::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

json ConnectionManager::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

std::string ConnectionManager::instructions() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return instructions_;
}

mcp_protocol::ListenerHandle ConnectionManager::subscribe_notifications(mcp_protocol::NotificationListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    mcp_protocol::ListenerHandle handle = next_listener_handle_++;
    listeners_.emplace(handle, std::move(listener));
    return handle;
}

void ConnectionManager::unsubscribe_notifications(mcp_protocol::ListenerHandle handle) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.erase(handle);
}

void ConnectionManager::set_drop_listener(DropListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    drop_listener_ = std::move(listener);
}

void ConnectionManager::forward_notification(const std::string &method, const json &params) {
    std::vector<mcp_protocol::NotificationListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        for (const auto &entry : listeners_) {
            listeners.push_back(entry.second);
        }
    }
    for (const auto &listener : listeners) {
        listener(method, params);
    }
}

} // namespace mcp_connection
