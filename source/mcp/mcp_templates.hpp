#ifndef MCPHOST_MCP_TEMPLATES_HPP
#define MCPHOST_MCP_TEMPLATES_HPP

// Built-in catalogue of well-known tool servers that can be added as
// configurations without writing the JSON by hand.

#include "mcp/mcp_config.hpp"

#include <map>
#include <string>
#include <vector>

namespace mcp_templates {

struct ServerTemplate {
    std::string id;
    std::string name;
    std::string description;
    std::string category; // filesystem, git, database, api, utility
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<std::string> required_env_vars;
    std::vector<std::string> permissions;
};

struct TemplateEnvCheck {
    bool valid = true;
    std::vector<std::string> missing;
};

const std::vector<ServerTemplate> &all_templates();

std::vector<std::string> template_categories();

std::vector<ServerTemplate> templates_by_category(const std::string &category);

// Returns nullptr if no template has this id.
const ServerTemplate *find_template(const std::string &template_id);

// Case-insensitive substring search over id, name and description.
std::vector<ServerTemplate> search_templates(const std::string &query);

// Report required environment variables that are unset or empty in the host environment.
TemplateEnvCheck validate_template_env(const ServerTemplate &server_template);

// Disabled configuration built from a template. Permission patterns naming the
// template id are rewritten to server_name. An empty server_name uses the id.
mcp_config::ServerConfig config_from_template(const ServerTemplate &server_template,
                                              const std::string &server_name = "");

} // namespace mcp_templates

#endif // MCPHOST_MCP_TEMPLATES_HPP
