#ifndef MCPHOST_MCP_PERMISSIONS_HPP
#define MCPHOST_MCP_PERMISSIONS_HPP

// Allow/deny evaluation of fully-qualified tool names (mcp__<server>__<tool>).
//
// Rules are strings with an optional "allow:" or "deny:" prefix; the rest is a
// pattern where '*' matches any run of characters. A rule list denies a name
// if any deny rule matches; otherwise, if it has allow rules, at least one of
// them must match. Empty lists allow everything.

#include "mcp/mcp_config.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace mcp_permissions {

constexpr const char *kToolNamespace = "mcp";

struct PermissionRule {
    std::string pattern;
    bool allowed = true;
};

// Anchored wildcard match of the whole name against pattern.
bool match_wildcard(const std::string &name, const std::string &pattern);

PermissionRule parse_rule(const std::string &raw_rule);

// Evaluate a name against raw rule strings.
bool evaluate(const std::string &name, const std::vector<std::string> &rules);

// "mcp__<server>__<tool>"
std::string qualified_tool_name(const std::string &server_name, const std::string &tool_name);

// Split a comma-separated rule list (as found in MCPHOST_GLOBAL_PERMISSIONS),
// trimming whitespace and dropping empty entries.
std::vector<std::string> parse_rule_list(const std::string &comma_separated);

class PermissionEvaluator {
public:
    explicit PermissionEvaluator(const mcp_config::ConfigStore &config_store);

    void set_global_rules(std::vector<std::string> rules);
    std::vector<std::string> global_rules() const;

    // Server rules first (a server-level deny is final), then the global rules.
    bool is_tool_allowed(const std::string &server_name, const std::string &tool_name) const;

    std::vector<std::string> filter_allowed_tools(const std::string &server_name,
                                                  const std::vector<std::string> &tool_names) const;

private:
    const mcp_config::ConfigStore &config_store_;
    mutable std::mutex rules_mutex_;
    std::vector<std::string> global_rules_;
};

} // namespace mcp_permissions

#endif // MCPHOST_MCP_PERMISSIONS_HPP
