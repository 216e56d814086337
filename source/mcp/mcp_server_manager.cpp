#include "mcp/mcp_server_manager.hpp"

#include "utils/debug_log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace mcp_server_manager {

namespace {

ManagerResult make_failure(ErrorKind kind, const std::string &message) {
    ManagerResult result;
    result.error_kind = kind;
    result.error_message = message;
    return result;
}

ManagerResult make_success() {
    ManagerResult result;
    result.success = true;
    return result;
}

HealthEvent make_event(HealthEventType type, const std::string &server_name, const std::string &error = "",
                       int attempt = 0) {
    HealthEvent event;
    event.type = type;
    event.server_name = server_name;
    event.error = error;
    event.attempt = attempt;
    return event;
}

std::string string_member(const json &object, const char *key, const std::string &fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

ToolDocumentation build_documentation(const std::string &server_name, const std::string &exposed_name,
                                      const mcp_tool_manager::ToolDescriptor &descriptor) {
    ToolDocumentation documentation;
    documentation.tool_name = descriptor.name;
    documentation.exposed_name = exposed_name;
    documentation.server_name = server_name;
    documentation.description =
        descriptor.description.empty() ? "No description available" : descriptor.description;

    const json &schema = descriptor.input_schema;
    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return documentation;
    }
    json required = schema.contains("required") && schema["required"].is_array() ? schema["required"] : json::array();

    for (const auto &property : schema["properties"].items()) {
        ParameterDocumentation parameter;
        parameter.name = property.key();
        parameter.type = string_member(property.value(), "type", "any");
        parameter.description = string_member(property.value(), "description", "Parameter " + property.key());
        for (const auto &name : required) {
            if (name.is_string() && name.get<std::string>() == parameter.name) {
                parameter.required = true;
            }
        }
        if (property.value().is_object() && property.value().contains("default")) {
            parameter.default_value = property.value()["default"];
        }
        documentation.parameters.push_back(std::move(parameter));
    }
    return documentation;
}

} // namespace

std::string to_string(HealthStatus status) {
    switch (status) {
    case HealthStatus::Unknown:
        return "unknown";
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Unhealthy:
        return "unhealthy";
    case HealthStatus::Restarting:
        return "restarting";
    }
    return "unknown";
}

std::string to_string(HealthEventType type) {
    switch (type) {
    case HealthEventType::Healthy:
        return "healthy";
    case HealthEventType::Unhealthy:
        return "unhealthy";
    case HealthEventType::Restarting:
        return "restarting";
    case HealthEventType::Restarted:
        return "restarted";
    case HealthEventType::RestartFailed:
        return "restart_failed";
    }
    return "unknown";
}

ServerManager::ServerManager(mcp_config::ConfigStore &config_store, tool_registry::ToolRegistry &registry,
                             ManagerOptions options)
    : config_store_(config_store), registry_(registry), permissions_(config_store), options_(std::move(options)) {}

ServerManager::~ServerManager() {
    cleanup();
}

mcp_config::ConfigLoadResult ServerManager::initialize() {
    return config_store_.load_configs();
}

std::vector<mcp_config::ServerConfig> ServerManager::available_servers() const {
    return config_store_.all_configs();
}

// --- Lifecycle ---

std::shared_ptr<ServerManager::ActiveServer> ServerManager::find_server(const std::string &server_name) const {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    auto iterator = active_servers_.find(server_name);
    if (iterator == active_servers_.end()) {
        return nullptr;
    }
    return iterator->second;
}

ManagerResult ServerManager::activate(const mcp_config::ServerConfig &config) {
    auto server = std::make_shared<ActiveServer>();
    server->config = config;
    server->connection = std::make_unique<mcp_connection::ConnectionManager>(options_.connect_options);
    server->tools = std::make_unique<mcp_tool_manager::ToolManager>(config.name, *server->connection, registry_,
                                                                     &permissions_);
    server->health.server_name = config.name;

    const std::string server_name = config.name;
    server->connection->set_drop_listener(
        [this, server_name](const std::string &reason) { queue_server_exit(server_name, reason); });

    ManagerResult connected;
    {
        std::lock_guard<std::mutex> operation_lock(server->operation_mutex);
        connected = reconnect(*server);
    }
    if (!connected.success) {
        return connected;
    }

    std::lock_guard<std::mutex> lock(servers_mutex_);
    active_servers_[server_name] = std::move(server);
    return connected;
}

// Connect (or reconnect) and bring the registry entries back in line with the server.
ManagerResult ServerManager::reconnect(ActiveServer &server) {
    server.tools->unregister_tools();
    server.connection->disconnect();

    mcp_connection::ConnectResult connected = server.connection->connect(server.config);
    if (!connected.success) {
        return make_failure(connected.error_kind, connected.error_message);
    }

    mcp_tool_manager::DiscoverResult discovered = server.tools->discover_tools();
    if (!discovered.success) {
        server.connection->disconnect();
        return make_failure(discovered.error_kind, discovered.error_message);
    }
    server.tools->register_tools();

    std::lock_guard<std::mutex> lock(server.health_mutex);
    server.connected_at = std::chrono::steady_clock::now();
    server.last_check = server.connected_at;
    server.health.status = HealthStatus::Healthy;
    server.health.last_check = std::chrono::system_clock::now();
    server.health.last_error.clear();
    return make_success();
}

void ServerManager::deactivate(const std::string &server_name) {
    std::shared_ptr<ActiveServer> server;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        auto iterator = active_servers_.find(server_name);
        if (iterator == active_servers_.end()) {
            return;
        }
        server = std::move(iterator->second);
        active_servers_.erase(iterator);
    }
    server->retiring = true;

    std::lock_guard<std::mutex> operation_lock(server->operation_mutex);
    server->tools->unregister_tools();
    server->connection->disconnect();
    debug_log::log("Stopped MCP server '" + server_name + "'");
}

ManagerResult ServerManager::enable_server(const std::string &server_name) {
    auto config = config_store_.get_config(server_name);
    if (!config) {
        return make_failure(ErrorKind::InvalidConfig, "MCP server '" + server_name + "' not found in configuration");
    }

    std::unique_lock<std::mutex> lifecycle_lock(lifecycle_mutex_);
    if (is_server_active(server_name)) {
        return make_success();
    }

    if (!config->enabled) {
        config->enabled = true;
        mcp_config::ConfigWriteResult saved = config_store_.save_config(*config);
        if (!saved.success) {
            debug_log::warn("Could not persist enabled state for '" + server_name + "': " + saved.error_message);
        }
    }

    ManagerResult result = activate(*config);
    lifecycle_lock.unlock();
    if (!result.success) {
        result.error_message = "Failed to enable MCP server '" + server_name + "': " + result.error_message;
        debug_log::error(result.error_message);
        return result;
    }
    if (config->health_check_interval_milliseconds > 0) {
        start_health_monitoring();
    }
    return result;
}

ManagerResult ServerManager::disable_server(const std::string &server_name) {
    {
        std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
        deactivate(server_name);
    }

    auto config = config_store_.get_config(server_name);
    if (config && config->enabled) {
        config->enabled = false;
        mcp_config::ConfigWriteResult saved = config_store_.save_config(*config);
        if (!saved.success) {
            return make_failure(ErrorKind::InvalidConfig, "Failed to disable MCP server '" + server_name +
                                                              "': " + saved.error_message);
        }
    }
    return make_success();
}

ManagerResult ServerManager::enable_servers(const std::vector<std::string> &server_names) {
    std::vector<std::string> errors;
    ErrorKind first_kind = ErrorKind::None;
    for (const auto &server_name : server_names) {
        ManagerResult result = enable_server(server_name);
        if (!result.success) {
            if (errors.empty()) {
                first_kind = result.error_kind;
            }
            errors.push_back(server_name + ": " + result.error_message);
        }
    }
    if (errors.empty()) {
        return make_success();
    }

    std::string message = "Failed to enable some servers:";
    for (const auto &error : errors) {
        message += "\n" + error;
    }
    return make_failure(first_kind, message);
}

ManagerResult ServerManager::start_enabled_servers() {
    std::vector<std::string> enabled;
    for (const auto &config : config_store_.all_configs()) {
        if (config.enabled) {
            enabled.push_back(config.name);
        }
    }
    return enable_servers(enabled);
}

void ServerManager::disable_all_servers() {
    std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        for (const auto &entry : active_servers_) {
            names.push_back(entry.first);
        }
    }
    for (const auto &name : names) {
        deactivate(name);
    }
}

// An exit seen while the servers stop may start the monitor again, hence the second stop.
void ServerManager::cleanup() {
    stop_health_monitoring();
    disable_all_servers();
    stop_health_monitoring();
}

std::vector<ServerStatus> ServerManager::server_status() const {
    std::vector<ServerStatus> statuses;
    std::lock_guard<std::mutex> lock(servers_mutex_);
    for (const auto &config : config_store_.all_configs()) {
        ServerStatus status;
        status.name = config.name;
        status.config = config;
        auto iterator = active_servers_.find(config.name);
        if (iterator != active_servers_.end()) {
            status.active = true;
            status.state = iterator->second->connection->state();
            status.tool_count = iterator->second->tools->registered_names().size();
        }
        statuses.push_back(std::move(status));
    }
    return statuses;
}

bool ServerManager::is_server_active(const std::string &server_name) const {
    std::lock_guard<std::mutex> lock(servers_mutex_);
    return active_servers_.count(server_name) > 0;
}

// --- Configuration ---

ManagerResult ServerManager::add_server_from_template(const mcp_templates::ServerTemplate &server_template,
                                                      const std::string &server_name) {
    mcp_config::ServerConfig config = mcp_templates::config_from_template(server_template, server_name);
    if (config_store_.get_config(config.name)) {
        return make_failure(ErrorKind::InvalidConfig, "MCP server '" + config.name + "' already exists");
    }

    mcp_templates::TemplateEnvCheck environment = mcp_templates::validate_template_env(server_template);
    for (const auto &variable : environment.missing) {
        debug_log::warn("Template '" + server_template.id + "' needs environment variable " + variable);
    }

    mcp_config::ConfigWriteResult saved = config_store_.save_config(config);
    if (!saved.success) {
        return make_failure(ErrorKind::InvalidConfig, saved.error_message);
    }
    return make_success();
}

ManagerResult ServerManager::remove_server(const std::string &server_name) {
    if (!config_store_.get_config(server_name)) {
        return make_failure(ErrorKind::InvalidConfig, "MCP server '" + server_name + "' not found in configuration");
    }
    {
        std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
        deactivate(server_name);
    }
    mcp_config::ConfigWriteResult removed = config_store_.remove_config(server_name);
    if (!removed.success) {
        return make_failure(ErrorKind::InvalidConfig, removed.error_message);
    }
    return make_success();
}

// --- Documentation ---

std::optional<ToolDocumentation> ServerManager::get_tool_documentation(const std::string &tool_name) const {
    struct Candidate {
        std::string server_name;
        std::string exposed_name;
        mcp_tool_manager::ToolDescriptor descriptor;
    };
    std::vector<Candidate> candidates;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        for (const auto &entry : active_servers_) {
            for (auto &descriptor : entry.second->tools->tools()) {
                std::string exposed = entry.second->tools->exposed_name(descriptor.name);
                candidates.push_back(Candidate{entry.first, std::move(exposed), std::move(descriptor)});
            }
        }
    }

    for (const auto &candidate : candidates) {
        if (candidate.descriptor.name == tool_name || candidate.exposed_name == tool_name) {
            return build_documentation(candidate.server_name, candidate.exposed_name, candidate.descriptor);
        }
    }
    for (const auto &candidate : candidates) {
        if (candidate.descriptor.name.find(tool_name) != std::string::npos ||
            candidate.exposed_name.find(tool_name) != std::string::npos ||
            tool_name.find(candidate.descriptor.name) != std::string::npos) {
            return build_documentation(candidate.server_name, candidate.exposed_name, candidate.descriptor);
        }
    }
    return std::nullopt;
}


// --- Health ---

ServerHealth ServerManager::snapshot_health(const ActiveServer &server) const {
    const bool connected = server.connection->is_connected();
    std::lock_guard<std::mutex> lock(server.health_mutex);
    ServerHealth health = server.health;
    if (health.status == HealthStatus::Healthy && connected) {
        health.uptime_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::steady_clock::now() - server.connected_at)
                                         .count();
    } else {
        health.uptime_milliseconds = 0;
    }
    return health;
}

ServerHealth ServerManager::check_health(const std::string &server_name) {
    ServerHealth inactive;
    inactive.server_name = server_name;
    inactive.last_error = "server is not active";

    std::shared_ptr<ActiveServer> server = find_server(server_name);
    if (!server) {
        return inactive;
    }

    std::vector<HealthEvent> events;
    {
        std::lock_guard<std::mutex> operation_lock(server->operation_mutex);
        if (server->retiring) {
            return inactive;
        }

        mcp_protocol::RequestResult reply = server->connection->ping(options_.health_ping_timeout_milliseconds);
        {
            std::lock_guard<std::mutex> lock(server->health_mutex);
            server->last_check = std::chrono::steady_clock::now();
            server->health.last_check = std::chrono::system_clock::now();
            if (reply.success) {
                server->health.status = HealthStatus::Healthy;
                server->health.last_error.clear();
            } else {
                server->health.status = HealthStatus::Unhealthy;
                server->health.last_error = reply.error_message;
            }
        }
        if (reply.success) {
            events.push_back(make_event(HealthEventType::Healthy, server_name));
        } else {
            events.push_back(make_event(HealthEventType::Unhealthy, server_name, reply.error_message));
            debug_log::warn("MCP server '" + server_name + "' failed its health check: " + reply.error_message);
            if (server->config.auto_restart) {
                restart(*server, events);
            }
        }
    }
    emit_health_events(events);
    return snapshot_health(*server);
}

void ServerManager::restart(ActiveServer &server, std::vector<HealthEvent> &events) {
    const std::string &server_name = server.config.name;
    const int max_attempts = server.config.max_restart_attempts;
    {
        std::lock_guard<std::mutex> lock(server.health_mutex);
        if (server.health.restart_count >= max_attempts) {
            events.push_back(make_event(HealthEventType::RestartFailed, server_name,
                                        "Max restart attempts (" + std::to_string(max_attempts) + ") exceeded"));
            return;
        }
    }

    std::string last_error;
    while (!server.retiring) {
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(server.health_mutex);
            if (server.health.restart_count >= max_attempts) {
                break;
            }
            attempt = ++server.health.restart_count;
            server.health.status = HealthStatus::Restarting;
        }
        events.push_back(make_event(HealthEventType::Restarting, server_name, "", attempt));
        debug_log::log("Restarting MCP server '" + server_name + "' (attempt " + std::to_string(attempt) + ")");

        if (!wait_backoff(server, options_.restart_backoff_milliseconds * attempt)) {
            break;
        }

        ManagerResult reconnected = reconnect(server);
        if (reconnected.success) {
            {
                std::lock_guard<std::mutex> lock(server.health_mutex);
                server.health.restart_count = 0;
            }
            events.push_back(make_event(HealthEventType::Restarted, server_name));
            return;
        }
        last_error = reconnected.error_message;
        std::lock_guard<std::mutex> lock(server.health_mutex);
        server.health.status = HealthStatus::Unhealthy;
        server.health.last_error = last_error;
    }
    if (server.retiring) {
        return;
    }

    debug_log::error("Giving up on MCP server '" + server_name + "': " + last_error);
    events.push_back(make_event(HealthEventType::RestartFailed, server_name, last_error));
}

// Sleeps in short slices so stopping a server is not held up by its backoff.
// Returns false if the server was retired meanwhile.
bool ServerManager::wait_backoff(const ActiveServer &server, int milliseconds) const {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(milliseconds);
    while (!server.retiring) {
        const auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            return true;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(remaining, std::chrono::milliseconds(50)));
    }
    return false;
}

std::vector<ServerHealth> ServerManager::check_all_health() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        for (const auto &entry : active_servers_) {
            names.push_back(entry.first);
        }
    }
    std::vector<ServerHealth> results;
    for (const auto &name : names) {
        results.push_back(check_health(name));
    }
    return results;
}

std::optional<ServerHealth> ServerManager::server_health(const std::string &server_name) const {
    std::shared_ptr<ActiveServer> server = find_server(server_name);
    if (!server) {
        return std::nullopt;
    }
    return snapshot_health(*server);
}

std::vector<ServerHealth> ServerManager::health_status() const {
    std::vector<std::shared_ptr<ActiveServer>> servers;
    {
        std::lock_guard<std::mutex> lock(servers_mutex_);
        for (const auto &entry : active_servers_) {
            servers.push_back(entry.second);
        }
    }
    std::vector<ServerHealth> records;
    for (const auto &server : servers) {
        records.push_back(snapshot_health(*server));
    }
    return records;
}

HealthListenerHandle ServerManager::subscribe_health_events(HealthListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    HealthListenerHandle handle = next_listener_handle_++;
    health_listeners_.emplace(handle, std::move(listener));
    return handle;
}

void ServerManager::unsubscribe_health_events(HealthListenerHandle handle) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    health_listeners_.erase(handle);
}

// Called without any server lock held, so listeners may call back into the manager.
void ServerManager::emit_health_events(const std::vector<HealthEvent> &events) {
    if (events.empty()) {
        return;
    }
    std::vector<HealthListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        for (const auto &entry : health_listeners_) {
            listeners.push_back(entry.second);
        }
    }
    for (const auto &event : events) {
        for (const auto &listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception &error) {
                debug_log::warn("Error in health event listener: " + std::string(error.what()));
            }
        }
    }
}

// Runs on the connection's listener thread: only queue the exit here.
void ServerManager::queue_server_exit(const std::string &server_name, const std::string &reason) {
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        pending_exits_.push_back(ServerExit{server_name, reason});
        if (!monitor_thread_.joinable()) {
            monitor_stop_requested_ = false;
            monitor_thread_ = std::thread([this] { monitor_loop(); });
        }
    }
    monitor_wakeup_.notify_all();
}

void ServerManager::handle_server_exit(const ServerExit &server_exit) {
    std::shared_ptr<ActiveServer> server = find_server(server_exit.server_name);
    if (!server) {
        return;
    }

    std::vector<HealthEvent> events;
    {
        std::lock_guard<std::mutex> operation_lock(server->operation_mutex);
        // Stopped, or already brought back by a health check.
        if (server->retiring || server->connection->is_connected()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(server->health_mutex);
            if (server->health.status != HealthStatus::Healthy) {
                return;
            }
            server->health.status = HealthStatus::Unhealthy;
            server->health.last_error = server_exit.reason;
            server->health.last_check = std::chrono::system_clock::now();
            server->last_check = std::chrono::steady_clock::now();
        }
        debug_log::warn("MCP server '" + server_exit.server_name + "' went away: " + server_exit.reason);
        events.push_back(make_event(HealthEventType::Unhealthy, server_exit.server_name, server_exit.reason));
        if (server->config.auto_restart) {
            restart(*server, events);
        }
    }
    emit_health_events(events);
}

void ServerManager::start_health_monitoring() {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    if (monitor_thread_.joinable()) {
        return;
    }
    monitor_stop_requested_ = false;
    monitor_thread_ = std::thread([this] { monitor_loop(); });
}

void ServerManager::stop_health_monitoring() {
    std::thread monitor_thread;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor_stop_requested_ = true;
        monitor_thread = std::move(monitor_thread_);
    }
    monitor_wakeup_.notify_all();
    if (monitor_thread.joinable()) {
        monitor_thread.join();
    }
}

void ServerManager::monitor_loop() {
    for (;;) {
        std::vector<ServerExit> exits;
        {
            std::unique_lock<std::mutex> lock(monitor_mutex_);
            monitor_wakeup_.wait_for(lock, std::chrono::milliseconds(options_.monitor_tick_milliseconds),
                                     [this] { return monitor_stop_requested_ || !pending_exits_.empty(); });
            if (monitor_stop_requested_) {
                return;
            }
            exits.swap(pending_exits_);
        }
        for (const auto &server_exit : exits) {
            handle_server_exit(server_exit);
        }

        std::vector<std::shared_ptr<ActiveServer>> servers;
        {
            std::lock_guard<std::mutex> lock(servers_mutex_);
            for (const auto &entry : active_servers_) {
                servers.push_back(entry.second);
            }
        }
        const auto now = std::chrono::steady_clock::now();
        for (const auto &server : servers) {
            const int interval = server->config.health_check_interval_milliseconds;
            if (interval <= 0) {
                continue;
            }
            bool due = false;
            {
                std::lock_guard<std::mutex> lock(server->health_mutex);
                due = now - server->last_check >= std::chrono::milliseconds(interval);
            }
            if (due) {
                check_health(server->config.name);
            }
        }
    }
}

} // namespace mcp_server_manager
