// mcphost: host for Model Context Protocol tool servers.
// Entry point: command-line front end over ServerManager.
//
// Results go to stdout; logs go to stderr (set MCPHOST_DEBUG=1 for detail).

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "mcp/mcp_config.hpp"
#include "mcp/mcp_errors.hpp"
#include "mcp/mcp_permissions.hpp"
#include "mcp/mcp_server_manager.hpp"
#include "mcp/mcp_templates.hpp"
#include "tools/tool_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
    std::cerr << "Usage: mcphost <command> [arguments]\n"
                 "\n"
                 "Commands:\n"
                 "  servers                      List configured servers and their state\n"
                 "  tools                        Start enabled servers and list their tools\n"
                 "  call <tool> [json-arguments] Invoke a tool by its exposed name\n"
                 "  enable <name>                Enable a server and check that it starts\n"
                 "  disable <name>               Disable a server\n"
                 "  templates [query]            List built-in server templates\n"
                 "  add <template-id> [name]     Add a server configuration from a template\n"
                 "  remove <name>                Delete a server configuration\n"
                 "  doc <tool>                   Show documentation for a tool\n"
                 "  health                       Start enabled servers and ping each one\n"
                 "\n"
                 "Configuration directory: $MCPHOST_CONFIG_DIR or ~/.config/mcphost/mcp.d\n"
                 "Global permission rules: $MCPHOST_GLOBAL_PERMISSIONS (comma-separated)\n";
}

void print_text_content(const json &content) {
    if (!content.is_array()) {
        std::cout << content.dump(2) << std::endl;
        return;
    }
    for (const auto &block : content) {
        if (block.is_object() && block.value("type", "") == "text" && block.contains("text") &&
            block["text"].is_string()) {
            std::cout << block["text"].get<std::string>() << std::endl;
        } else {
            std::cout << block.dump() << std::endl;
        }
    }
}

// Start enabled servers; partial failures are reported but do not stop the command.
void start_servers(mcp_server_manager::ServerManager &manager) {
    mcp_server_manager::ManagerResult started = manager.start_enabled_servers();
    if (!started.success) {
        debug_log::warn(started.error_message);
    }
}

int command_servers(mcp_server_manager::ServerManager &manager) {
    auto statuses = manager.server_status();
    if (statuses.empty()) {
        std::cout << "No MCP servers configured." << std::endl;
        return EXIT_OK;
    }
    for (const auto &status : statuses) {
        std::cout << status.name << "  [" << (status.config.enabled ? "enabled" : "disabled") << "]  "
                  << status.config.command;
        for (const auto &argument : status.config.args) {
            std::cout << " " << argument;
        }
        std::cout << std::endl;
        if (!status.config.description.empty()) {
            std::cout << "    " << status.config.description << std::endl;
        }
    }
    return EXIT_OK;
}

int command_tools(mcp_server_manager::ServerManager &manager, tool_registry::ToolRegistry &registry) {
    start_servers(manager);
    auto tools = registry.list_tools();
    if (tools.empty()) {
        std::cout << "No tools available." << std::endl;
        return EXIT_OK;
    }
    for (const auto &tool : tools) {
        std::cout << tool.name << " - " << tool.description << std::endl;
        for (const auto &parameter : tool.parameters) {
            std::cout << "    " << parameter.name << " (" << tool_registry::to_string(parameter.type)
                      << (parameter.required ? ", required" : "") << "): " << parameter.description << std::endl;
        }
    }
    return EXIT_OK;
}

int command_call(mcp_server_manager::ServerManager &manager, tool_registry::ToolRegistry &registry,
                 const std::vector<std::string> &arguments) {
    if (arguments.empty()) {
        print_usage();
        return EXIT_USAGE;
    }

    json tool_arguments = json::object();
    if (arguments.size() > 1) {
        try {
            tool_arguments = json::parse(arguments[1]);
        } catch (const json::parse_error &error) {
            std::cerr << "[mcphost] Invalid JSON arguments: " << error.what() << std::endl;
            return EXIT_USAGE;
        }
        if (!tool_arguments.is_object()) {
            std::cerr << "[mcphost] Tool arguments must be a JSON object" << std::endl;
            return EXIT_USAGE;
        }
    }

    start_servers(manager);
    tool_registry::ToolResult result = registry.invoke(arguments[0], tool_arguments);
    if (!result.success) {
        std::cerr << "[mcphost] " << arguments[0] << " failed";
        if (result.error_kind != mcp_errors::ErrorKind::None) {
            std::cerr << " (" << mcp_errors::to_string(result.error_kind) << ")";
        }
        std::cerr << ": " << result.error << std::endl;
        return EXIT_FAILED;
    }
    print_text_content(result.data);
    return EXIT_OK;
}

int command_enable(mcp_server_manager::ServerManager &manager, const std::string &server_name) {
    mcp_server_manager::ManagerResult result = manager.enable_server(server_name);
    if (!result.success) {
        std::cerr << "[mcphost] " << result.error_message << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Enabled " << server_name << std::endl;
    return EXIT_OK;
}

int command_disable(mcp_server_manager::ServerManager &manager, const std::string &server_name) {
    mcp_server_manager::ManagerResult result = manager.disable_server(server_name);
    if (!result.success) {
        std::cerr << "[mcphost] " << result.error_message << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Disabled " << server_name << std::endl;
    return EXIT_OK;
}

int command_templates(const std::vector<std::string> &arguments) {
    auto templates = arguments.empty() ? mcp_templates::all_templates() : mcp_templates::search_templates(arguments[0]);
    for (const auto &category : mcp_templates::template_categories()) {
        bool printed_heading = false;
        for (const auto &server_template : templates) {
            if (server_template.category != category) {
                continue;
            }
            if (!printed_heading) {
                std::cout << category << ":" << std::endl;
                printed_heading = true;
            }
            std::cout << "  " << server_template.id << " - " << server_template.description;
            if (!server_template.required_env_vars.empty()) {
                std::cout << " (needs";
                for (const auto &variable : server_template.required_env_vars) {
                    std::cout << " " << variable;
                }
                std::cout << ")";
            }
            std::cout << std::endl;
        }
    }
    return EXIT_OK;
}

int command_add(mcp_server_manager::ServerManager &manager, const std::vector<std::string> &arguments) {
    if (arguments.empty()) {
        print_usage();
        return EXIT_USAGE;
    }
    const mcp_templates::ServerTemplate *server_template = mcp_templates::find_template(arguments[0]);
    if (server_template == nullptr) {
        std::cerr << "[mcphost] Unknown template: " << arguments[0] << std::endl;
        return EXIT_FAILED;
    }
    const std::string server_name = arguments.size() > 1 ? arguments[1] : server_template->id;
    mcp_server_manager::ManagerResult result = manager.add_server_from_template(*server_template, server_name);
    if (!result.success) {
        std::cerr << "[mcphost] " << result.error_message << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Added " << server_name << " (disabled; run 'mcphost enable " << server_name << "')" << std::endl;
    return EXIT_OK;
}

int command_remove(mcp_server_manager::ServerManager &manager, const std::string &server_name) {
    mcp_server_manager::ManagerResult result = manager.remove_server(server_name);
    if (!result.success) {
        std::cerr << "[mcphost] " << result.error_message << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Removed " << server_name << std::endl;
    return EXIT_OK;
}

int command_doc(mcp_server_manager::ServerManager &manager, const std::string &tool_name) {
    start_servers(manager);
    auto documentation = manager.get_tool_documentation(tool_name);
    if (!documentation) {
        std::cerr << "[mcphost] No tool matching '" << tool_name << "'" << std::endl;
        return EXIT_FAILED;
    }
    std::cout << documentation->tool_name << " (" << documentation->exposed_name << ", server "
              << documentation->server_name << ")" << std::endl;
    std::cout << "  " << documentation->description << std::endl;
    for (const auto &parameter : documentation->parameters) {
        std::cout << "  - " << parameter.name << ": " << parameter.type << (parameter.required ? ", required" : "");
        if (!parameter.default_value.is_null()) {
            std::cout << ", default " << parameter.default_value.dump();
        }
        std::cout << std::endl << "      " << parameter.description << std::endl;
    }
    return EXIT_OK;
}

int command_health(mcp_server_manager::ServerManager &manager) {
    start_servers(manager);
    auto records = manager.check_all_health();
    if (records.empty()) {
        std::cout << "No active MCP servers." << std::endl;
        return EXIT_OK;
    }
    int exit_code = EXIT_OK;
    for (const auto &health : records) {
        std::cout << health.server_name << ": " << mcp_server_manager::to_string(health.status);
        if (health.restart_count > 0) {
            std::cout << " (failed restart attempts: " << health.restart_count << ")";
        }
        if (!health.last_error.empty()) {
            std::cout << " - " << health.last_error;
        }
        std::cout << std::endl;
        if (health.status != mcp_server_manager::HealthStatus::Healthy) {
            exit_code = EXIT_FAILED;
        }
    }
    return exit_code;
}

int run_command(const std::string &command, const std::vector<std::string> &arguments) {
    mcp_config::ConfigStore config_store;
    tool_registry::ToolRegistry registry;
    mcp_server_manager::ServerManager manager(config_store, registry);

    const char *global_rules = std::getenv("MCPHOST_GLOBAL_PERMISSIONS");
    if (global_rules != nullptr) {
        manager.permissions().set_global_rules(mcp_permissions::parse_rule_list(global_rules));
    }

    mcp_config::ConfigLoadResult loaded = manager.initialize();
    if (!loaded.success) {
        std::cerr << "[mcphost] " << loaded.error_message << std::endl;
        return EXIT_FAILED;
    }

    int exit_code = EXIT_USAGE;
    if (command == "servers") {
        exit_code = command_servers(manager);
    } else if (command == "tools") {
        exit_code = command_tools(manager, registry);
    } else if (command == "call") {
        exit_code = command_call(manager, registry, arguments);
    } else if (command == "templates") {
        exit_code = command_templates(arguments);
    } else if (command == "add") {
        exit_code = command_add(manager, arguments);
    } else if (command == "health") {
        exit_code = command_health(manager);
    } else if (arguments.size() != 1) {
        print_usage();
    } else if (command == "enable") {
        exit_code = command_enable(manager, arguments[0]);
    } else if (command == "disable") {
        exit_code = command_disable(manager, arguments[0]);
    } else if (command == "remove") {
        exit_code = command_remove(manager, arguments[0]);
    } else if (command == "doc") {
        exit_code = command_doc(manager, arguments[0]);
    } else {
        print_usage();
    }

    manager.cleanup();
    return exit_code;
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_USAGE;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage();
        return EXIT_OK;
    }

    std::vector<std::string> arguments(argv + 2, argv + argc);
    return run_command(command, arguments);
}
