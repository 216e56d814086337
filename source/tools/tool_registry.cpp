#include "tools/tool_registry.hpp"

#include "utils/debug_log.hpp"

#include <exception>

namespace tool_registry {

std::string to_string(ParameterType type) {
    switch (type) {
    case ParameterType::String:
        return "string";
    case ParameterType::Number:
        return "number";
    case ParameterType::Boolean:
        return "boolean";
    case ParameterType::Array:
        return "array";
    }
    return "string";
}

RegisterOutcome ToolRegistry::register_tool(RegisteredTool tool, const std::string &owner) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto existing = tools_.find(tool.name);
    if (existing != tools_.end()) {
        return existing->second.owner == owner ? RegisterOutcome::AlreadyRegistered : RegisterOutcome::NameCollision;
    }
    std::string name = tool.name;
    tools_.emplace(std::move(name), Entry{std::move(tool), owner});
    return RegisterOutcome::Registered;
}

bool ToolRegistry::unregister_tool(const std::string &name, const std::string &owner) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto iterator = tools_.find(name);
    if (iterator == tools_.end() || iterator->second.owner != owner) {
        return false;
    }
    tools_.erase(iterator);
    return true;
}

std::size_t ToolRegistry::unregister_owner(const std::string &owner) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::size_t removed = 0;
    for (auto iterator = tools_.begin(); iterator != tools_.end();) {
        if (iterator->second.owner == owner) {
            iterator = tools_.erase(iterator);
            ++removed;
        } else {
            ++iterator;
        }
    }
    return removed;
}

std::optional<RegisteredTool> ToolRegistry::get_tool(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto iterator = tools_.find(name);
    if (iterator == tools_.end()) {
        return std::nullopt;
    }
    return iterator->second.tool;
}

bool ToolRegistry::has_tool(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return tools_.count(name) > 0;
}

std::string ToolRegistry::owner_of(const std::string &name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto iterator = tools_.find(name);
    return iterator == tools_.end() ? std::string() : iterator->second.owner;
}

std::vector<RegisteredTool> ToolRegistry::list_tools() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<RegisteredTool> tools;
    tools.reserve(tools_.size());
    for (const auto &entry : tools_) {
        tools.push_back(entry.second.tool);
    }
    return tools;
}

std::size_t ToolRegistry::tool_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return tools_.size();
}

ToolResult ToolRegistry::invoke(const std::string &name, const json &arguments) const {
    // Copy the executor out so a slow tool does not hold the registry lock.
    ToolExecutor executor;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto iterator = tools_.find(name);
        if (iterator != tools_.end()) {
            executor = iterator->second.tool.execute;
        }
    }

    ToolResult result;
    if (!executor) {
        result.error = "Unknown tool: " + name;
        return result;
    }

    try {
        return executor(arguments);
    } catch (const std::exception &error) {
        debug_log::warn("Tool '" + name + "' threw: " + error.what());
        result.error = std::string("Tool execution failed: ") + error.what();
        return result;
    }
}

} // namespace tool_registry
