#include "mcp/mcp_tool_manager.hpp"

#include "utils/debug_log.hpp"

#include <algorithm>
#include <sstream>

namespace mcp_tool_manager {

namespace {

ToolResult make_failure(ErrorKind kind, const std::string &message) {
    ToolResult result;
    result.error_kind = kind;
    result.error = message;
    return result;
}

std::string string_member(const json &object, const char *key) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

// First text block of a content array, used as the error text of failed calls.
std::string first_text(const json &content) {
    if (content.is_array() && !content.empty() && content[0].is_object()) {
        std::string text = string_member(content[0], "text");
        if (!text.empty()) {
            return text;
        }
    }
    return "Unknown error";
}

} // namespace

ToolManager::ToolManager(std::string server_name, mcp_connection::ConnectionManager &connection,
                         tool_registry::ToolRegistry &registry,
                         const mcp_permissions::PermissionEvaluator *permissions)
    : server_name_(std::move(server_name)),
      owner_id_("mcp:" + server_name_),
      connection_(connection),
      registry_(registry),
      permissions_(permissions),
      anchor_(std::make_shared<Anchor>()) {
    anchor_->manager = this;
}

ToolManager::~ToolManager() {
    unregister_tools();
    // Executors copied out of the registry may still be running.
    std::unique_lock<std::shared_mutex> lock(anchor_->mutex);
    anchor_->manager = nullptr;
}

ToolDescriptor ToolManager::parse_descriptor(const json &entry) {
    ToolDescriptor descriptor;
    descriptor.name = string_member(entry, "name");
    descriptor.title = string_member(entry, "title");
    descriptor.description = string_member(entry, "description");
    if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
        descriptor.input_schema = entry["inputSchema"];
    } else {
        descriptor.input_schema = {{"type", "object"}, {"properties", json::object()}};
    }
    if (entry.contains("outputSchema") && entry["outputSchema"].is_object()) {
        descriptor.output_schema = entry["outputSchema"];
    }
    return descriptor;
}

DiscoverResult ToolManager::discover_tools() {
    DiscoverResult result;

    mcp_protocol::RequestResult reply = connection_.send_request("tools/list", json::object());
    if (!reply.success) {
        result.error_kind = reply.error_kind;
        result.error_message = "Failed to list tools from MCP server '" + server_name_ + "': " + reply.error_message;
        debug_log::warn(result.error_message);
        return result;
    }
    if (!reply.result.is_object() || !reply.result.contains("tools") || !reply.result["tools"].is_array()) {
        result.error_kind = ErrorKind::MalformedFrame;
        result.error_message = "MCP server '" + server_name_ + "' returned a tools/list result without a tools array";
        debug_log::warn(result.error_message);
        return result;
    }

    std::vector<ToolDescriptor> discovered;
    for (const auto &entry : reply.result["tools"]) {
        if (!entry.is_object() || string_member(entry, "name").empty()) {
            debug_log::warn("Skipping unnamed tool from MCP server '" + server_name_ + "'");
            continue;
        }
        discovered.push_back(parse_descriptor(entry));
    }

    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        tools_ = std::move(discovered);
        result.tool_count = tools_.size();
    }
    debug_log::log("Discovered " + std::to_string(result.tool_count) + " tool(s) on MCP server '" + server_name_ +
                   "'");
    result.success = true;
    return result;
}

std::vector<ToolDescriptor> ToolManager::tools() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return tools_;
}

std::optional<ToolDescriptor> ToolManager::find_tool(const std::string &tool_name) const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    for (const auto &descriptor : tools_) {
        if (descriptor.name == tool_name) {
            return descriptor;
        }
    }
    return std::nullopt;
}

std::string ToolManager::exposed_name(const std::string &tool_name) const {
    return std::string(kExposedPrefix) + "_" + server_name_ + "_" + tool_name;
}

std::vector<tool_registry::ToolParameter> ToolManager::convert_parameters(const json &input_schema) {
    std::vector<tool_registry::ToolParameter> parameters;
    if (!input_schema.is_object() || !input_schema.contains("properties") ||
        !input_schema["properties"].is_object()) {
        return parameters;
    }

    std::vector<std::string> required_names;
    if (input_schema.contains("required") && input_schema["required"].is_array()) {
        for (const auto &name : input_schema["required"]) {
            if (name.is_string()) {
                required_names.push_back(name.get<std::string>());
            }
        }
    }

    for (const auto &property : input_schema["properties"].items()) {
        tool_registry::ToolParameter parameter;
        parameter.name = property.key();
        parameter.required =
            std::find(required_names.begin(), required_names.end(), parameter.name) != required_names.end();

        const json &schema = property.value();
        std::string type = schema.is_object() ? string_member(schema, "type") : "";
        if (type == "number" || type == "integer") {
            parameter.type = tool_registry::ParameterType::Number;
        } else if (type == "boolean") {
            parameter.type = tool_registry::ParameterType::Boolean;
        } else if (type == "array") {
            parameter.type = tool_registry::ParameterType::Array;
        } else {
            parameter.type = tool_registry::ParameterType::String;
        }

        parameter.description = schema.is_object() ? string_member(schema, "description") : "";
        if (parameter.description.empty()) {
            parameter.description = "Parameter " + parameter.name;
        }
        if (schema.is_object() && schema.contains("default")) {
            parameter.default_value = schema["default"];
        }
        parameters.push_back(std::move(parameter));
    }
    return parameters;
}

RegisterSummary ToolManager::register_tools() {
    RegisterSummary summary;
    std::vector<ToolDescriptor> descriptors = tools();

    for (const auto &descriptor : descriptors) {
        tool_registry::RegisteredTool tool;
        tool.name = exposed_name(descriptor.name);
        tool.description = descriptor.description.empty()
                               ? "MCP tool: " + descriptor.name + " (" + server_name_ + ")"
                               : descriptor.description;
        tool.parameters = convert_parameters(descriptor.input_schema);
        tool.execute = [anchor = anchor_, original_name = descriptor.name,
                        server_name = server_name_](const json &arguments) {
            std::shared_lock<std::shared_mutex> lock(anchor->mutex);
            if (anchor->manager == nullptr) {
                return make_failure(ErrorKind::NotConnected, "MCP server '" + server_name + "' is no longer active");
            }
            return anchor->manager->execute_tool(original_name, arguments);
        };

        const std::string name = tool.name;
        switch (registry_.register_tool(std::move(tool), owner_id_)) {
        case tool_registry::RegisterOutcome::Registered: {
            std::lock_guard<std::mutex> lock(tools_mutex_);
            registered_names_.push_back(name);
            summary.exposed_names.push_back(name);
            ++summary.registered;
            break;
        }
        case tool_registry::RegisterOutcome::AlreadyRegistered:
            ++summary.already_registered;
            break;
        case tool_registry::RegisterOutcome::NameCollision:
            debug_log::warn("Tool name '" + name + "' from MCP server '" + server_name_ + "' is already registered by " +
                            registry_.owner_of(name) + "; skipping");
            ++summary.collisions;
            break;
        }
    }

    debug_log::log("Registered " + std::to_string(summary.registered) + " tool(s) from MCP server '" + server_name_ +
                   "'");
    return summary;
}

void ToolManager::unregister_tools() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        names.swap(registered_names_);
    }
    for (const auto &name : names) {
        registry_.unregister_tool(name, owner_id_);
    }
}

std::vector<std::string> ToolManager::registered_names() const {
    std::lock_guard<std::mutex> lock(tools_mutex_);
    return registered_names_;
}

ToolResult ToolManager::execute_tool(const std::string &tool_name, const json &arguments) {
    if (permissions_ != nullptr && !permissions_->is_tool_allowed(server_name_, tool_name)) {
        std::string message = "Permission denied for tool " + mcp_permissions::qualified_tool_name(server_name_, tool_name);
        debug_log::log(message);
        return make_failure(ErrorKind::PermissionDenied, message);
    }

    json params;
    params["name"] = tool_name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;

    mcp_protocol::RequestResult reply = connection_.send_request("tools/call", params);
    if (!reply.success) {
        return make_failure(reply.error_kind, reply.error_message);
    }
    if (!reply.result.is_object()) {
        return make_failure(ErrorKind::MalformedFrame, "Malformed tools/call result from MCP server '" +
                                                           server_name_ + "'");
    }

    json content = reply.result.contains("content") ? reply.result["content"] : json::array();
    const bool is_error = reply.result.contains("isError") && reply.result["isError"].is_boolean() &&
                          reply.result["isError"].get<bool>();
    if (is_error) {
        ToolResult failed = make_failure(ErrorKind::ToolApplicationError, first_text(content));
        failed.data = content;
        return failed;
    }

    ToolResult result;
    result.success = true;
    result.data = std::move(content);
    return result;
}

std::vector<ToolCallOutcome> ToolManager::execute_tools(const std::vector<ToolCall> &calls) {
    std::vector<ToolCallOutcome> outcomes;
    outcomes.reserve(calls.size());
    for (const auto &call : calls) {
        ToolCallOutcome outcome;
        outcome.tool_name = call.name;
        outcome.result = execute_tool(call.name, call.arguments);
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

std::string ToolManager::format_tool_results(const std::vector<ToolCallOutcome> &outcomes) {
    std::ostringstream output;
    output << "MCP Tool Results:\n\n";
    for (const auto &outcome : outcomes) {
        output << "Tool: " << outcome.tool_name << "\n";
        if (outcome.result.success) {
            output << "Success:\n";
            if (outcome.result.data.is_array()) {
                for (const auto &block : outcome.result.data) {
                    if (block.is_object() && string_member(block, "type") == "text") {
                        output << "   " << string_member(block, "text") << "\n";
                    }
                }
            }
        } else {
            output << "Error: " << outcome.result.error << "\n";
        }
        output << "\n";
    }
    return output.str();
}

} // namespace mcp_tool_manager
