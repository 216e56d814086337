#ifndef MCPHOST_MCP_CONFIG_HPP
#define MCPHOST_MCP_CONFIG_HPP

// Per-server configuration, persisted as one <name>.json file per server in a
// configuration directory ($MCPHOST_CONFIG_DIR or ~/.config/mcphost/mcp.d).

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_config {

using json = nlohmann::json;

constexpr int kDefaultTimeoutMilliseconds = 30000;
constexpr int kDefaultMaxRestartAttempts = 3;

struct ServerConfig {
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    int timeout_milliseconds = kDefaultTimeoutMilliseconds;
    bool enabled = false;
    int health_check_interval_milliseconds = 0; // 0 = not monitored
    bool auto_restart = true;
    int max_restart_attempts = kDefaultMaxRestartAttempts;
    // Absent means permissive; present-but-empty is permissive too.
    std::optional<std::vector<std::string>> permissions;
};

// Parse one configuration object, applying defaults for missing optional fields.
// Returns false with error_message set if name/command are missing or a field
// has the wrong type.
bool parse_server_config(const json &document, ServerConfig &config, std::string &error_message);

// Full object as written to disk (camelCase keys).
json server_config_to_json(const ServerConfig &config);

struct ConfigLoadResult {
    bool success = false;
    std::size_t loaded_count = 0;
    std::vector<std::string> warnings; // one per skipped file
    std::string error_message;
};

struct ConfigWriteResult {
    bool success = false;
    std::string error_message;
};

class ConfigStore {
public:
    explicit ConfigStore(std::string directory = default_config_directory());

    // $MCPHOST_CONFIG_DIR, else $HOME/.config/mcphost/mcp.d.
    static std::string default_config_directory();

    // Re-read every *.json file in the directory, replacing the cached set.
    // Bad files are skipped with a warning; the directory is created if missing.
    ConfigLoadResult load_configs();

    std::optional<ServerConfig> get_config(const std::string &server_name) const;
    std::vector<ServerConfig> all_configs() const;

    // Write <name>.json and update the cache.
    ConfigWriteResult save_config(const ServerConfig &config);

    // Delete <name>.json and drop the cached entry. Unknown names are a no-op.
    ConfigWriteResult remove_config(const std::string &server_name);

    const std::string &config_directory() const { return directory_; }

private:
    std::string config_file_path(const std::string &server_name) const;

    std::string directory_;
    mutable std::mutex configs_mutex_;
    std::map<std::string, ServerConfig> configs_;
};

} // namespace mcp_config

#endif // MCPHOST_MCP_CONFIG_HPP
