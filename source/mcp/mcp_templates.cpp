#include "mcp/mcp_templates.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcp_templates {

namespace {

constexpr int kTemplateHealthCheckIntervalMilliseconds = 30000;

ServerTemplate npx_template(const std::string &id, const std::string &name, const std::string &description,
                            const std::string &category, const std::string &package,
                            std::vector<std::string> required_env_vars = {},
                            std::vector<std::string> permissions = {}) {
    ServerTemplate server_template;
    server_template.id = id;
    server_template.name = name;
    server_template.description = description;
    server_template.category = category;
    server_template.command = "npx";
    server_template.args = {"-y", package};
    server_template.required_env_vars = std::move(required_env_vars);
    if (permissions.empty()) {
        permissions.push_back("mcp__" + id + "__*");
    }
    server_template.permissions = std::move(permissions);
    return server_template;
}

std::vector<ServerTemplate> build_catalogue() {
    std::vector<ServerTemplate> catalogue;

    ServerTemplate local_filesystem = npx_template(
        "filesystem-local", "Local Filesystem",
        "Access and manage local filesystem with read, write, and search capabilities", "filesystem",
        "@modelcontextprotocol/server-filesystem");
    local_filesystem.args.push_back("/");
    catalogue.push_back(local_filesystem);

    catalogue.push_back(npx_template("filesystem-restricted", "Restricted Filesystem",
                                     "Filesystem access limited to specific directories", "filesystem",
                                     "@modelcontextprotocol/server-filesystem", {"MCP_ALLOWED_DIRS"},
                                     {"mcp__filesystem-restricted__read_file",
                                      "mcp__filesystem-restricted__list_directory",
                                      "mcp__filesystem-restricted__search_files"}));

    catalogue.push_back(npx_template("git", "Git Repository",
                                     "Git operations including status, commits, branches, and diffs", "git",
                                     "@modelcontextprotocol/server-git"));
    catalogue.push_back(npx_template("github", "GitHub API", "GitHub API access for repos, issues, PRs, and more",
                                     "git", "@modelcontextprotocol/server-github", {"GITHUB_TOKEN"}));

    catalogue.push_back(npx_template("sqlite", "SQLite Database", "Query and manage SQLite databases", "database",
                                     "@modelcontextprotocol/server-sqlite", {"SQLITE_DB_PATH"}));
    catalogue.push_back(npx_template("postgres", "PostgreSQL Database",
                                     "Connect to and query PostgreSQL databases", "database",
                                     "@modelcontextprotocol/server-postgres", {"POSTGRES_URL"}));

    catalogue.push_back(npx_template("fetch", "Web Fetch", "Fetch and parse web content", "api",
                                     "@modelcontextprotocol/server-fetch"));

    catalogue.push_back(npx_template("time", "Time & Timezone", "Time operations and timezone conversions",
                                     "utility", "@modelcontextprotocol/server-time"));
    catalogue.push_back(npx_template("memory", "Knowledge Graph Memory", "Persistent memory using a knowledge graph",
                                     "utility", "@modelcontextprotocol/server-memory"));
    catalogue.push_back(npx_template("sequential-thinking", "Sequential Thinking",
                                     "Dynamic problem-solving through thought sequences", "utility",
                                     "@modelcontextprotocol/server-sequential-thinking"));
    return catalogue;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

} // namespace

const std::vector<ServerTemplate> &all_templates() {
    static const std::vector<ServerTemplate> catalogue = build_catalogue();
    return catalogue;
}

std::vector<std::string> template_categories() {
    return {"filesystem", "git", "database", "api", "utility"};
}

std::vector<ServerTemplate> templates_by_category(const std::string &category) {
    std::vector<ServerTemplate> matches;
    for (const auto &server_template : all_templates()) {
        if (server_template.category == category) {
            matches.push_back(server_template);
        }
    }
    return matches;
}

const ServerTemplate *find_template(const std::string &template_id) {
    for (const auto &server_template : all_templates()) {
        if (server_template.id == template_id) {
            return &server_template;
        }
    }
    return nullptr;
}

std::vector<ServerTemplate> search_templates(const std::string &query) {
    const std::string needle = to_lower(query);
    std::vector<ServerTemplate> matches;
    for (const auto &server_template : all_templates()) {
        if (to_lower(server_template.id).find(needle) != std::string::npos ||
            to_lower(server_template.name).find(needle) != std::string::npos ||
            to_lower(server_template.description).find(needle) != std::string::npos) {
            matches.push_back(server_template);
        }
    }
    return matches;
}

TemplateEnvCheck validate_template_env(const ServerTemplate &server_template) {
    TemplateEnvCheck check;
    for (const auto &variable : server_template.required_env_vars) {
        const char *value = std::getenv(variable.c_str());
        if (value == nullptr || value[0] == '\0') {
            check.missing.push_back(variable);
        }
    }
    check.valid = check.missing.empty();
    return check;
}

mcp_config::ServerConfig config_from_template(const ServerTemplate &server_template, const std::string &server_name) {
    mcp_config::ServerConfig config;
    config.name = server_name.empty() ? server_template.id : server_name;
    config.description = server_template.description;
    config.command = server_template.command;
    config.args = server_template.args;
    config.env = server_template.env;
    config.enabled = false;
    config.health_check_interval_milliseconds = kTemplateHealthCheckIntervalMilliseconds;
    config.auto_restart = true;
    config.max_restart_attempts = mcp_config::kDefaultMaxRestartAttempts;

    if (!server_template.permissions.empty()) {
        const std::string template_segment = "mcp__" + server_template.id + "__";
        const std::string server_segment = "mcp__" + config.name + "__";
        std::vector<std::string> permissions;
        for (std::string rule : server_template.permissions) {
            auto position = rule.find(template_segment);
            if (position != std::string::npos) {
                rule.replace(position, template_segment.size(), server_segment);
            }
            permissions.push_back(std::move(rule));
        }
        config.permissions = std::move(permissions);
    }
    return config;
}

} // namespace mcp_templates
