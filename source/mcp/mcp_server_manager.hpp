#ifndef MCPHOST_MCP_SERVER_MANAGER_HPP
#define MCPHOST_MCP_SERVER_MANAGER_HPP

// Orchestrates every configured tool server: one ConnectionManager and one
// ToolManager per active server, all registering into a shared ToolRegistry
// and gated by one PermissionEvaluator. Also keeps per-server health records,
// restarts servers that stop answering pings or whose process exits, and
// documents discovered tools.
//
// The server map lock is only held to look servers up or publish changes.
// Pings, restarts and shutdown of one server are serialized by that server's
// own operation lock, so a slow server never stalls status queries.

#include "mcp/mcp_config.hpp"
#include "mcp/mcp_connection.hpp"
#include "mcp/mcp_errors.hpp"
#include "mcp/mcp_permissions.hpp"
#include "mcp/mcp_templates.hpp"
#include "mcp/mcp_tool_manager.hpp"
#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcp_server_manager {

using json = nlohmann::json;
using mcp_errors::ErrorKind;

enum class HealthStatus { Unknown, Healthy, Unhealthy, Restarting };

std::string to_string(HealthStatus status);

struct ServerHealth {
    std::string server_name;
    HealthStatus status = HealthStatus::Unknown;
    std::chrono::system_clock::time_point last_check{};
    std::string last_error;
    // Attempts since the last successful (re)connect; reset when a restart succeeds.
    int restart_count = 0;
    long long uptime_milliseconds = 0; // since the current connection came up
};

enum class HealthEventType { Healthy, Unhealthy, Restarting, Restarted, RestartFailed };

// "healthy", "unhealthy", "restarting", "restarted", "restart_failed"
std::string to_string(HealthEventType type);

struct HealthEvent {
    HealthEventType type = HealthEventType::Healthy;
    std::string server_name;
    std::string error;
    int attempt = 0; // restart attempt number for Restarting
};

using HealthListener = std::function<void(const HealthEvent &event)>;
using HealthListenerHandle = std::uint64_t;

struct ManagerResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct ServerStatus {
    std::string name;
    bool active = false;
    mcp_connection::ConnectionState state = mcp_connection::ConnectionState::Disconnected;
    std::size_t tool_count = 0;
    mcp_config::ServerConfig config;
};

struct ParameterDocumentation {
    std::string name;
    std::string type; // schema type, "any" if absent
    std::string description;
    bool required = false;
    json default_value;
};

struct ToolDocumentation {
    std::string tool_name;
    std::string exposed_name;
    std::string server_name;
    std::string description;
    std::vector<ParameterDocumentation> parameters;
};

struct ManagerOptions {
    mcp_connection::ConnectOptions connect_options;
    // Delay before restart attempt n is n times this value.
    int restart_backoff_milliseconds = 1000;
    int health_ping_timeout_milliseconds = 5000;
    // How often the monitoring thread looks for due checks.
    int monitor_tick_milliseconds = 250;
};

class ServerManager {
public:
    ServerManager(mcp_config::ConfigStore &config_store, tool_registry::ToolRegistry &registry,
                  ManagerOptions options = {});
    ~ServerManager();

    ServerManager(const ServerManager &) = delete;
    ServerManager &operator=(const ServerManager &) = delete;

    // Load configurations from the store's directory.
    mcp_config::ConfigLoadResult initialize();

    std::vector<mcp_config::ServerConfig> available_servers() const;
    mcp_permissions::PermissionEvaluator &permissions() { return permissions_; }

    // Connect every server whose configuration has enabled=true.
    ManagerResult start_enabled_servers();

    // Mark enabled (persisted), connect, discover and register tools.
    // A server that is already active is left alone. Starts health monitoring
    // when the server has a healthCheckInterval.
    ManagerResult enable_server(const std::string &server_name);

    // Unregister tools, disconnect and persist enabled=false.
    ManagerResult disable_server(const std::string &server_name);

    // Enable each server, collecting every failure into one message.
    ManagerResult enable_servers(const std::vector<std::string> &server_names);

    // Stop every active server. Configurations are left as they are.
    void disable_all_servers();

    std::vector<ServerStatus> server_status() const;
    bool is_server_active(const std::string &server_name) const;

    // Stop monitoring and every active server.
    void cleanup();

    // Save a disabled configuration built from a template.
    ManagerResult add_server_from_template(const mcp_templates::ServerTemplate &server_template,
                                           const std::string &server_name = "");

    // Stop the server if active and delete its configuration file.
    ManagerResult remove_server(const std::string &server_name);

    // Look a tool up by original or exposed name: exact match first, then substring.
    std::optional<ToolDocumentation> get_tool_documentation(const std::string &tool_name) const;

    // Ping one server, updating its health record; restarts it on failure when
    // its configuration allows.
    ServerHealth check_health(const std::string &server_name);
    std::vector<ServerHealth> check_all_health();

    std::optional<ServerHealth> server_health(const std::string &server_name) const;
    std::vector<ServerHealth> health_status() const;

    HealthListenerHandle subscribe_health_events(HealthListener listener);
    void unsubscribe_health_events(HealthListenerHandle handle);

    // Background thread that checks each server every healthCheckInterval ms.
    // It also handles server processes that exit on their own, and is started
    // on demand for that.
    void start_health_monitoring();
    void stop_health_monitoring();

private:
    struct ActiveServer {
        mcp_config::ServerConfig config;
        // Declared before tools so the tool manager is destroyed first.
        std::unique_ptr<mcp_connection::ConnectionManager> connection;
        std::unique_ptr<mcp_tool_manager::ToolManager> tools;

        // Held for a whole ping, restart or shutdown.
        std::mutex operation_mutex;
        // Set once the server has left the map; pending restarts give up.
        std::atomic<bool> retiring{false};

        mutable std::mutex health_mutex;
        ServerHealth health;
        std::chrono::steady_clock::time_point connected_at{};
        std::chrono::steady_clock::time_point last_check{};
    };

    struct ServerExit {
        std::string server_name;
        std::string reason;
    };

    std::shared_ptr<ActiveServer> find_server(const std::string &server_name) const;
    ManagerResult activate(const mcp_config::ServerConfig &config);
    void deactivate(const std::string &server_name);
    // The caller holds server.operation_mutex for the next two.
    ManagerResult reconnect(ActiveServer &server);
    void restart(ActiveServer &server, std::vector<HealthEvent> &events);
    bool wait_backoff(const ActiveServer &server, int milliseconds) const;
    ServerHealth snapshot_health(const ActiveServer &server) const;
    void emit_health_events(const std::vector<HealthEvent> &events);
    void queue_server_exit(const std::string &server_name, const std::string &reason);
    void handle_server_exit(const ServerExit &server_exit);
    void monitor_loop();

    mcp_config::ConfigStore &config_store_;
    tool_registry::ToolRegistry &registry_;
    mcp_permissions::PermissionEvaluator permissions_;
    ManagerOptions options_;

    // Serializes enable, disable and remove against each other.
    std::mutex lifecycle_mutex_;

    mutable std::mutex servers_mutex_;
    std::map<std::string, std::shared_ptr<ActiveServer>> active_servers_;

    std::mutex listener_mutex_;
    std::map<HealthListenerHandle, HealthListener> health_listeners_;
    HealthListenerHandle next_listener_handle_ = 1;

    std::mutex monitor_mutex_;
    std::condition_variable monitor_wakeup_;
    bool monitor_stop_requested_ = false;
    std::vector<ServerExit> pending_exits_;
    std::thread monitor_thread_;
};

} // namespace mcp_server_manager

#endif // MCPHOST_MCP_SERVER_MANAGER_HPP
