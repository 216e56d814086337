#ifndef MCPHOST_MCP_TOOL_MANAGER_HPP
#define MCPHOST_MCP_TOOL_MANAGER_HPP

// Bridges one connected tool server into the host tool registry.
//
// discover_tools() fetches tools/list; register_tools() wraps each descriptor
// as a RegisteredTool named mcp_<server>_<tool> whose executor forwards to
// execute_tool(). The manager owns the entries it registered and removes them
// in unregister_tools() and on destruction.

#include "mcp/mcp_connection.hpp"
#include "mcp/mcp_errors.hpp"
#include "mcp/mcp_permissions.hpp"
#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcp_tool_manager {

using json = nlohmann::json;
using mcp_errors::ErrorKind;
using tool_registry::ToolResult;

constexpr const char *kExposedPrefix = "mcp";

// One entry of a tools/list reply, kept as received.
struct ToolDescriptor {
    std::string name;
    std::string title;
    std::string description;
    json input_schema;  // always an object; {"type":"object","properties":{}} if absent
    json output_schema; // null if absent
};

struct DiscoverResult {
    bool success = false;
    std::size_t tool_count = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct RegisterSummary {
    std::size_t registered = 0;
    std::size_t already_registered = 0;
    std::size_t collisions = 0;
    std::vector<std::string> exposed_names; // newly registered ones
};

struct ToolCall {
    std::string name; // original (server-side) tool name
    json arguments = json::object();
};

struct ToolCallOutcome {
    std::string tool_name;
    ToolResult result;
};

class ToolManager {
public:
    // permissions may be null, in which case every call is allowed.
    // Executors handed to the registry stay safe to call after the manager is
    // gone: they fail with NotConnected. Destruction waits for calls in flight.
    ToolManager(std::string server_name, mcp_connection::ConnectionManager &connection,
                tool_registry::ToolRegistry &registry,
                const mcp_permissions::PermissionEvaluator *permissions = nullptr);
    ~ToolManager();

    ToolManager(const ToolManager &) = delete;
    ToolManager &operator=(const ToolManager &) = delete;

    // Replace the known tool set with the server's tools/list reply.
    DiscoverResult discover_tools();

    std::vector<ToolDescriptor> tools() const;
    std::optional<ToolDescriptor> find_tool(const std::string &tool_name) const;

    // Register every discovered tool not yet in the registry. Names held by
    // another owner are skipped with a warning.
    RegisterSummary register_tools();

    // Remove exactly the entries this manager registered.
    void unregister_tools();
    std::vector<std::string> registered_names() const;

    // Call a tool by its original name. Never throws.
    ToolResult execute_tool(const std::string &tool_name, const json &arguments);

    // Run calls in order; a failing call does not stop the rest.
    std::vector<ToolCallOutcome> execute_tools(const std::vector<ToolCall> &calls);

    std::string exposed_name(const std::string &tool_name) const;
    const std::string &server_name() const { return server_name_; }
    const std::string &owner_id() const { return owner_id_; }

    // inputSchema.properties -> generic parameter list.
    static std::vector<tool_registry::ToolParameter> convert_parameters(const json &input_schema);

    // Plain-text rendering of several outcomes.
    static std::string format_tool_results(const std::vector<ToolCallOutcome> &outcomes);

private:
    // Shared with every registered executor.
    struct Anchor {
        std::shared_mutex mutex;
        ToolManager *manager = nullptr; // null once the manager is destroyed
    };

    static ToolDescriptor parse_descriptor(const json &entry);

    std::string server_name_;
    std::string owner_id_;
    mcp_connection::ConnectionManager &connection_;
    tool_registry::ToolRegistry &registry_;
    const mcp_permissions::PermissionEvaluator *permissions_;
    std::shared_ptr<Anchor> anchor_;

    mutable std::mutex tools_mutex_;
    std::vector<ToolDescriptor> tools_;
    std::vector<std::string> registered_names_;
};

} // namespace mcp_tool_manager

#endif // MCPHOST_MCP_TOOL_MANAGER_HPP
