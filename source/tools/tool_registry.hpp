#ifndef MCPHOST_TOOL_REGISTRY_HPP
#define MCPHOST_TOOL_REGISTRY_HPP

// Host-side tool registry: the single namespace of invocable tools.
//
// Every entry is tagged with the owner that registered it, and only that owner
// may remove it, so several tool managers can register and unregister
// concurrently without stepping on each other's entries.

#include "mcp/mcp_errors.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tool_registry {

using json = nlohmann::json;
using mcp_errors::ErrorKind;

enum class ParameterType { String, Number, Boolean, Array };

// "string", "number", "boolean", "array"
std::string to_string(ParameterType type);

struct ToolParameter {
    std::string name;
    ParameterType type = ParameterType::String;
    std::string description;
    bool required = false;
    json default_value; // null when the schema gives none
};

// Outcome of one invocation. data carries the tool's content on success.
struct ToolResult {
    bool success = false;
    json data;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
};

using ToolExecutor = std::function<ToolResult(const json &arguments)>;

struct RegisteredTool {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    ToolExecutor execute;
};

enum class RegisterOutcome {
    Registered,
    AlreadyRegistered, // same owner, same name: nothing changed
    NameCollision      // name held by a different owner: nothing changed
};

class ToolRegistry {
public:
    RegisterOutcome register_tool(RegisteredTool tool, const std::string &owner);

    // Returns false if the name is unknown or belongs to another owner.
    bool unregister_tool(const std::string &name, const std::string &owner);

    // Remove every tool registered by owner; returns how many were removed.
    std::size_t unregister_owner(const std::string &owner);

    std::optional<RegisteredTool> get_tool(const std::string &name) const;
    bool has_tool(const std::string &name) const;
    std::string owner_of(const std::string &name) const;

    // Sorted by name.
    std::vector<RegisteredTool> list_tools() const;
    std::size_t tool_count() const;

    // Run a tool by name. Never throws: unknown names and executor exceptions
    // come back as failed results.
    ToolResult invoke(const std::string &name, const json &arguments) const;

private:
    struct Entry {
        RegisteredTool tool;
        std::string owner;
    };

    mutable std::mutex registry_mutex_;
    std::map<std::string, Entry> tools_;
};

} // namespace tool_registry

#endif // MCPHOST_TOOL_REGISTRY_HPP
