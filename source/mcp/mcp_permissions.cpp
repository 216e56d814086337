#include "mcp/mcp_permissions.hpp"

#include "utils/debug_log.hpp"

#include <regex>

namespace mcp_permissions {

namespace {

constexpr const char *kAllowPrefix = "allow:";
constexpr const char *kDenyPrefix = "deny:";

bool starts_with(const std::string &text, const std::string &prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string wildcard_to_regex(const std::string &pattern) {
    static const std::string metacharacters = ".+?^${}()|[]\\";
    std::string translated;
    translated.reserve(pattern.size() * 2);
    for (char character : pattern) {
        if (character == '*') {
            translated += ".*";
        } else {
            if (metacharacters.find(character) != std::string::npos) {
                translated += '\\';
            }
            translated += character;
        }
    }
    return translated;
}

std::string trim(const std::string &text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

bool match_wildcard(const std::string &name, const std::string &pattern) {
    if (name == pattern) {
        return true;
    }
    if (pattern.find('*') == std::string::npos) {
        return false;
    }
    try {
        return std::regex_match(name, std::regex(wildcard_to_regex(pattern)));
    } catch (const std::regex_error &regex_failure) {
        debug_log::warn("Invalid permission pattern '" + pattern + "': " + regex_failure.what());
        return false;
    }
}

PermissionRule parse_rule(const std::string &raw_rule) {
    PermissionRule rule;
    if (starts_with(raw_rule, kDenyPrefix)) {
        rule.pattern = raw_rule.substr(std::string(kDenyPrefix).size());
        rule.allowed = false;
    } else if (starts_with(raw_rule, kAllowPrefix)) {
        rule.pattern = raw_rule.substr(std::string(kAllowPrefix).size());
        rule.allowed = true;
    } else {
        rule.pattern = raw_rule;
        rule.allowed = true;
    }
    return rule;
}

bool evaluate(const std::string &name, const std::vector<std::string> &rules) {
    if (rules.empty()) {
        return true;
    }

    std::vector<PermissionRule> allow_rules;
    for (const auto &raw_rule : rules) {
        PermissionRule rule = parse_rule(raw_rule);
        if (!rule.allowed) {
            if (match_wildcard(name, rule.pattern)) {
                return false;
            }
        } else {
            allow_rules.push_back(std::move(rule));
        }
    }

    if (allow_rules.empty()) {
        return true;
    }
    for (const auto &rule : allow_rules) {
        if (match_wildcard(name, rule.pattern)) {
            return true;
        }
    }
    return false;
}

std::string qualified_tool_name(const std::string &server_name, const std::string &tool_name) {
    return std::string(kToolNamespace) + "__" + server_name + "__" + tool_name;
}

std::vector<std::string> parse_rule_list(const std::string &comma_separated) {
    std::vector<std::string> rules;
    std::string::size_type start = 0;
    while (start <= comma_separated.size()) {
        auto comma = comma_separated.find(',', start);
        if (comma == std::string::npos) {
            comma = comma_separated.size();
        }
        std::string rule = trim(comma_separated.substr(start, comma - start));
        if (!rule.empty()) {
            rules.push_back(std::move(rule));
        }
        start = comma + 1;
    }
    return rules;
}

// --- PermissionEvaluator ---

PermissionEvaluator::PermissionEvaluator(const mcp_config::ConfigStore &config_store)
    : config_store_(config_store) {}

void PermissionEvaluator::set_global_rules(std::vector<std::string> rules) {
    std::lock_guard<std::mutex> lock(rules_mutex_);
    global_rules_ = std::move(rules);
}

std::vector<std::string> PermissionEvaluator::global_rules() const {
    std::lock_guard<std::mutex> lock(rules_mutex_);
    return global_rules_;
}

bool PermissionEvaluator::is_tool_allowed(const std::string &server_name, const std::string &tool_name) const {
    const std::string full_name = qualified_tool_name(server_name, tool_name);

    auto config = config_store_.get_config(server_name);
    if (config && config->permissions && !evaluate(full_name, *config->permissions)) {
        debug_log::log("Denied " + full_name + " by server rules");
        return false;
    }

    if (!evaluate(full_name, global_rules())) {
        debug_log::log("Denied " + full_name + " by global rules");
        return false;
    }
    return true;
}

std::vector<std::string> PermissionEvaluator::filter_allowed_tools(const std::string &server_name,
                                                                   const std::vector<std::string> &tool_names) const {
    std::vector<std::string> allowed;
    for (const auto &tool_name : tool_names) {
        if (is_tool_allowed(server_name, tool_name)) {
            allowed.push_back(tool_name);
        }
    }
    return allowed;
}

} // namespace mcp_permissions
