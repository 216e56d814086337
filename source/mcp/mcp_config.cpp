#include "mcp/mcp_config.hpp"

#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <system_error>

namespace mcp_config {

namespace {

bool read_string_list(const json &document, const char *key, std::vector<std::string> &output,
                      std::string &error_message) {
    if (!document.contains(key) || document[key].is_null()) {
        return true;
    }
    if (!document[key].is_array()) {
        error_message = std::string("'") + key + "' must be an array of strings";
        return false;
    }
    for (const auto &entry : document[key]) {
        if (!entry.is_string()) {
            error_message = std::string("'") + key + "' must contain only strings";
            return false;
        }
        output.push_back(entry.get<std::string>());
    }
    return true;
}

bool read_integer(const json &document, const char *key, int &output, std::string &error_message) {
    if (!document.contains(key) || document[key].is_null()) {
        return true;
    }
    const json &value = document[key];
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<std::int64_t>() < 0)) {
        error_message = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    // Checked as unsigned so values past the int64 range cannot wrap.
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
        error_message = std::string("'") + key + "' is out of range";
        return false;
    }
    output = static_cast<int>(value.get<std::uint64_t>());
    return true;
}

bool read_boolean(const json &document, const char *key, bool &output, std::string &error_message) {
    if (!document.contains(key) || document[key].is_null()) {
        return true;
    }
    if (!document[key].is_boolean()) {
        error_message = std::string("'") + key + "' must be true or false";
        return false;
    }
    output = document[key].get<bool>();
    return true;
}

} // namespace

bool parse_server_config(const json &document, ServerConfig &config, std::string &error_message) {
    if (!document.is_object()) {
        error_message = "configuration must be a JSON object";
        return false;
    }
    if (!document.contains("name") || !document["name"].is_string() ||
        document["name"].get<std::string>().empty()) {
        error_message = "missing 'name' field";
        return false;
    }
    if (!document.contains("command") || !document["command"].is_string() ||
        document["command"].get<std::string>().empty()) {
        error_message = "missing 'command' field";
        return false;
    }

    ServerConfig parsed;
    parsed.name = document["name"].get<std::string>();
    parsed.command = document["command"].get<std::string>();
    if (document.contains("description") && document["description"].is_string()) {
        parsed.description = document["description"].get<std::string>();
    }

    if (!read_string_list(document, "args", parsed.args, error_message)) {
        return false;
    }

    if (document.contains("env") && !document["env"].is_null()) {
        if (!document["env"].is_object()) {
            error_message = "'env' must be an object of strings";
            return false;
        }
        for (const auto &item : document["env"].items()) {
            if (!item.value().is_string()) {
                error_message = "'env." + item.key() + "' must be a string";
                return false;
            }
            parsed.env[item.key()] = item.value().get<std::string>();
        }
    }

    if (!read_integer(document, "timeout", parsed.timeout_milliseconds, error_message) ||
        !read_boolean(document, "enabled", parsed.enabled, error_message) ||
        !read_integer(document, "healthCheckInterval", parsed.health_check_interval_milliseconds, error_message) ||
        !read_boolean(document, "autoRestart", parsed.auto_restart, error_message) ||
        !read_integer(document, "maxRestartAttempts", parsed.max_restart_attempts, error_message)) {
        return false;
    }
    if (parsed.timeout_milliseconds <= 0) {
        parsed.timeout_milliseconds = kDefaultTimeoutMilliseconds;
    }

    if (document.contains("permissions") && !document["permissions"].is_null()) {
        std::vector<std::string> permissions;
        if (!read_string_list(document, "permissions", permissions, error_message)) {
            return false;
        }
        parsed.permissions = std::move(permissions);
    }

    config = std::move(parsed);
    return true;
}

json server_config_to_json(const ServerConfig &config) {
    json document;
    document["name"] = config.name;
    if (!config.description.empty()) {
        document["description"] = config.description;
    }
    document["command"] = config.command;
    document["args"] = config.args;
    document["env"] = config.env;
    document["timeout"] = config.timeout_milliseconds;
    document["enabled"] = config.enabled;
    document["healthCheckInterval"] = config.health_check_interval_milliseconds;
    document["autoRestart"] = config.auto_restart;
    document["maxRestartAttempts"] = config.max_restart_attempts;
    if (config.permissions.has_value()) {
        document["permissions"] = *config.permissions;
    }
    return document;
}

// --- ConfigStore ---

ConfigStore::ConfigStore(std::string directory) : directory_(std::move(directory)) {}

std::string ConfigStore::default_config_directory() {
    const char *override_directory = std::getenv("MCPHOST_CONFIG_DIR");
    if (override_directory != nullptr && override_directory[0] != '\0') {
        return override_directory;
    }
    const char *home = std::getenv("HOME");
    std::filesystem::path base = (home != nullptr) ? home : "";
    return (base / ".config" / "mcphost" / "mcp.d").string();
}

std::string ConfigStore::config_file_path(const std::string &server_name) const {
    return (std::filesystem::path(directory_) / (server_name + ".json")).string();
}

ConfigLoadResult ConfigStore::load_configs() {
    ConfigLoadResult result;

    std::error_code error_code;
    std::filesystem::create_directories(directory_, error_code);
    if (error_code) {
        result.error_message = "failed to create config directory " + directory_ + ": " + error_code.message();
        debug_log::warn("Failed to load MCP configurations: " + result.error_message);
        return result;
    }

    std::map<std::string, ServerConfig> loaded;
    std::filesystem::directory_iterator iterator(directory_, error_code);
    if (error_code) {
        result.error_message = "failed to read config directory " + directory_ + ": " + error_code.message();
        debug_log::warn("Failed to load MCP configurations: " + result.error_message);
        return result;
    }

    for (const auto &entry : iterator) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        const std::string file_name = entry.path().filename().string();

        std::string contents;
        if (!platform::read_file_contents(entry.path().string(), contents)) {
            result.warnings.push_back("Failed to read config file " + file_name);
            continue;
        }

        json document;
        try {
            document = json::parse(contents);
        } catch (const json::parse_error &parse_error) {
            result.warnings.push_back("Failed to load config file " + file_name + ": " + parse_error.what());
            continue;
        }

        ServerConfig config;
        std::string error_message;
        if (!parse_server_config(document, config, error_message)) {
            result.warnings.push_back("Skipping config file " + file_name + ": " + error_message);
            continue;
        }
        loaded[config.name] = std::move(config);
    }

    for (const auto &warning : result.warnings) {
        debug_log::warn(warning);
    }

    {
        std::lock_guard<std::mutex> lock(configs_mutex_);
        configs_ = std::move(loaded);
        result.loaded_count = configs_.size();
    }
    debug_log::log("Loaded " + std::to_string(result.loaded_count) + " MCP server config(s) from " + directory_);
    result.success = true;
    return result;
}

std::optional<ServerConfig> ConfigStore::get_config(const std::string &server_name) const {
    std::lock_guard<std::mutex> lock(configs_mutex_);
    auto iterator = configs_.find(server_name);
    if (iterator == configs_.end()) {
        return std::nullopt;
    }
    return iterator->second;
}

std::vector<ServerConfig> ConfigStore::all_configs() const {
    std::lock_guard<std::mutex> lock(configs_mutex_);
    std::vector<ServerConfig> configs;
    configs.reserve(configs_.size());
    for (const auto &entry : configs_) {
        configs.push_back(entry.second);
    }
    return configs;
}

ConfigWriteResult ConfigStore::save_config(const ServerConfig &config) {
    ConfigWriteResult result;
    if (config.name.empty() || config.name.find('/') != std::string::npos || config.name == "." ||
        config.name == "..") {
        result.error_message = "invalid server name '" + config.name + "'";
        return result;
    }
    if (config.command.empty()) {
        result.error_message = "server '" + config.name + "' has no command";
        return result;
    }

    std::error_code error_code;
    std::filesystem::create_directories(directory_, error_code);
    if (error_code) {
        result.error_message = "failed to create config directory " + directory_ + ": " + error_code.message();
        return result;
    }

    const std::string file_path = config_file_path(config.name);
    if (!platform::write_file_contents(file_path, server_config_to_json(config).dump(2) + "\n")) {
        result.error_message = "failed to write " + file_path;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(configs_mutex_);
        configs_[config.name] = config;
    }
    result.success = true;
    return result;
}

ConfigWriteResult ConfigStore::remove_config(const std::string &server_name) {
    ConfigWriteResult result;
    {
        std::lock_guard<std::mutex> lock(configs_mutex_);
        if (configs_.count(server_name) == 0) {
            result.success = true;
            return result;
        }
    }

    const std::string file_path = config_file_path(server_name);
    std::error_code error_code;
    std::filesystem::remove(file_path, error_code);
    if (error_code) {
        result.error_message = "failed to remove config file for " + server_name + ": " + error_code.message();
        debug_log::warn(result.error_message);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(configs_mutex_);
        configs_.erase(server_name);
    }
    result.success = true;
    return result;
}

} // namespace mcp_config
