// Tests for the multi-server orchestration layer: enable/disable persistence,
// documentation lookup, templates and health-driven restarts.

#include "mcp/mcp_config.hpp"
#include "mcp/mcp_server_manager.hpp"
#include "mcp/mcp_templates.hpp"
#include "test_support.hpp"
#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using mcp_errors::ErrorKind;
using mcp_server_manager::HealthEvent;
using mcp_server_manager::HealthEventType;
using mcp_server_manager::HealthStatus;
using mcp_server_manager::ServerManager;

namespace test_server_manager {

static mcp_server_manager::ManagerOptions fast_options() {
    mcp_server_manager::ManagerOptions options;
    options.connect_options.spawn_grace_milliseconds = 50;
    options.restart_backoff_milliseconds = 0;
    options.health_ping_timeout_milliseconds = 300;
    options.monitor_tick_milliseconds = 20;
    return options;
}

// Writes a config to disk the way a user would, without going through the manager.
static void save_disabled(mcp_config::ConfigStore &store, mcp_config::ServerConfig config) {
    config.enabled = false;
    store.save_config(config);
}

// Test: enable persists enabled=true and registers tools; disable undoes both.
static bool test_enable_disable_persists() {
    std::string directory = test_support::make_temp_directory();
    bool persisted_enabled = false;
    bool persisted_disabled = false;
    bool active_after_enable = false;
    std::size_t tools_after_enable = 0;
    std::size_t tools_after_disable = 0;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        save_disabled(store, test_support::fake_server_config("fs"));
        ServerManager manager(store, registry, fast_options());
        manager.initialize();

        auto enabled = manager.enable_server("fs");
        active_after_enable = enabled.success && manager.is_server_active("fs");
        tools_after_enable = registry.tool_count();

        mcp_config::ConfigStore reread(directory);
        reread.load_configs();
        persisted_enabled = reread.get_config("fs") && reread.get_config("fs")->enabled;

        manager.disable_server("fs");
        tools_after_disable = registry.tool_count();
        reread.load_configs();
        persisted_disabled = reread.get_config("fs") && !reread.get_config("fs")->enabled &&
                             !manager.is_server_active("fs");
    }
    test_support::remove_directory(directory);

    bool success = active_after_enable && tools_after_enable == 1 && persisted_enabled && tools_after_disable == 0 &&
                   persisted_disabled;
    if (success) {
        std::cout << "  OK: Enable and disable are persisted" << std::endl;
    } else {
        std::cout << "  FAIL: Enable/disable (active=" << active_after_enable << ", tools=" << tools_after_enable
                  << ", persisted=" << persisted_enabled << "/" << persisted_disabled << ")" << std::endl;
    }
    return success;
}

// Test: Unknown servers are InvalidConfig; enable_servers reports every failure at once.
static bool test_enable_servers_aggregates_errors() {
    std::string directory = test_support::make_temp_directory();
    bool success = false;
    std::string message;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        save_disabled(store, test_support::fake_server_config("good"));
        save_disabled(store, test_support::fake_server_config("broken", {"--fail-initialize"}));
        ServerManager manager(store, registry, fast_options());
        manager.initialize();

        auto missing = manager.enable_server("nope");
        auto result = manager.enable_servers({"good", "broken", "nope"});
        message = result.error_message;

        success = !missing.success && missing.error_kind == ErrorKind::InvalidConfig && !result.success &&
                  message.find("Failed to enable some servers:") == 0 &&
                  message.find("broken: ") != std::string::npos && message.find("nope: ") != std::string::npos &&
                  message.find("good: ") == std::string::npos && manager.is_server_active("good") &&
                  !manager.is_server_active("broken") && registry.has_tool("mcp_good_read");
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Failures aggregated, healthy servers still enabled" << std::endl;
    } else {
        std::cout << "  FAIL: Aggregated error message was: " << message << std::endl;
    }
    return success;
}

// Test: start_enabled_servers connects exactly the enabled configs; cleanup leaves files alone.
static bool test_start_enabled_and_cleanup() {
    std::string directory = test_support::make_temp_directory();
    bool success = false;
    std::vector<mcp_server_manager::ServerStatus> statuses;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        store.save_config(test_support::fake_server_config("on"));
        save_disabled(store, test_support::fake_server_config("off"));
        ServerManager manager(store, registry, fast_options());
        manager.initialize();

        auto started = manager.start_enabled_servers();
        statuses = manager.server_status();
        manager.cleanup();

        mcp_config::ConfigStore reread(directory);
        reread.load_configs();

        success = started.success && statuses.size() == 2 && statuses[0].name == "off" && !statuses[0].active &&
                  statuses[1].name == "on" && statuses[1].active &&
                  statuses[1].state == mcp_connection::ConnectionState::Ready && statuses[1].tool_count == 1 &&
                  !manager.is_server_active("on") && registry.tool_count() == 0 && reread.get_config("on") &&
                  reread.get_config("on")->enabled;
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Enabled servers started, cleanup kept configs" << std::endl;
    } else {
        std::cout << "  FAIL: start_enabled_servers reported " << statuses.size() << " status entries" << std::endl;
    }
    return success;
}

// Test: Documentation lookup by original name, exposed name and substring.
static bool test_tool_documentation() {
    std::string directory = test_support::make_temp_directory();
    bool success = false;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        save_disabled(store, test_support::fake_server_config("docs", {"--extra-tools"}));
        ServerManager manager(store, registry, fast_options());
        manager.initialize();
        manager.enable_server("docs");

        auto by_name = manager.get_tool_documentation("echo");
        auto by_exposed = manager.get_tool_documentation("mcp_docs_fail");
        auto by_substring = manager.get_tool_documentation("rea");
        auto unknown = manager.get_tool_documentation("zzz");

        bool echo_ok = false;
        if (by_name) {
            int checked = 0;
            for (const auto &parameter : by_name->parameters) {
                if (parameter.name == "text") {
                    checked += parameter.required && parameter.type == "string" &&
                               parameter.description == "Text to echo";
                } else if (parameter.name == "count") {
                    checked += !parameter.required && parameter.type == "integer" && parameter.default_value == 1;
                }
            }
            echo_ok = checked == 2 && by_name->parameters.size() == 4 &&
                      by_name->description == "No description available" && by_name->exposed_name == "mcp_docs_echo";
        }

        success = echo_ok && by_exposed && by_exposed->tool_name == "fail" &&
                  by_exposed->description == "Always reports an error" && by_exposed->parameters.empty() &&
                  by_substring && by_substring->tool_name == "read" && by_substring->server_name == "docs" &&
                  !unknown;
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Tool documentation lookups" << std::endl;
    } else {
        std::cout << "  FAIL: Tool documentation lookups" << std::endl;
    }
    return success;
}

// Test: Templates become disabled configs; duplicates are refused; remove deletes.
static bool test_templates_add_and_remove() {
    std::string directory = test_support::make_temp_directory();
    bool success = false;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        ServerManager manager(store, registry, fast_options());
        manager.initialize();

        const mcp_templates::ServerTemplate *time_template = mcp_templates::find_template("time");
        auto added = time_template ? manager.add_server_from_template(*time_template, "clock")
                                   : mcp_server_manager::ManagerResult{};
        auto duplicate = time_template ? manager.add_server_from_template(*time_template, "clock")
                                       : mcp_server_manager::ManagerResult{};
        auto config = store.get_config("clock");

        auto removed = manager.remove_server("clock");
        auto removed_again = manager.remove_server("clock");

        success = added.success && !duplicate.success && duplicate.error_kind == ErrorKind::InvalidConfig && config &&
                  !config->enabled && config->permissions && !config->permissions->empty() &&
                  (*config->permissions)[0] == "mcp__clock__*" && removed.success && !removed_again.success &&
                  !store.get_config("clock") && manager.available_servers().empty();
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Template add and server removal" << std::endl;
    } else {
        std::cout << "  FAIL: Template add and server removal" << std::endl;
    }
    return success;
}

// Test: A server that stops answering pings is restarted; success resets the attempt count.
static bool test_health_restart_cycle() {
    std::string directory = test_support::make_temp_directory();
    std::vector<HealthEvent> events;
    std::mutex events_mutex;
    bool success = false;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        auto config = test_support::fake_server_config("mute", {"--never-reply", "ping"});
        config.max_restart_attempts = 1;
        save_disabled(store, config);
        ServerManager manager(store, registry, fast_options());
        manager.initialize();
        manager.subscribe_health_events([&events, &events_mutex](const HealthEvent &event) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(event);
        });

        bool enabled = manager.enable_server("mute").success;
        auto first = manager.check_health("mute");
        auto second = manager.check_health("mute");
        auto inactive = manager.check_health("ghost");

        std::lock_guard<std::mutex> lock(events_mutex);
        std::vector<HealthEventType> types;
        for (const auto &event : events) {
            types.push_back(event.type);
        }
        std::vector<HealthEventType> expected = {HealthEventType::Unhealthy,  HealthEventType::Restarting,
                                                 HealthEventType::Restarted,  HealthEventType::Unhealthy,
                                                 HealthEventType::Restarting, HealthEventType::Restarted};

        success = enabled && types == expected &&
                  events[0].error.find("MCP request timeout: ping") != std::string::npos && events[1].attempt == 1 &&
                  events[4].attempt == 1 && first.status == HealthStatus::Healthy &&
                  first.restart_count == 0 && second.status == HealthStatus::Healthy && second.restart_count == 0 &&
                  inactive.status == HealthStatus::Unknown && registry.has_tool("mcp_mute_read");
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Unhealthy server restarted on every failed check" << std::endl;
    } else {
        std::cout << "  FAIL: Health restart cycle produced " << events.size() << " event(s)" << std::endl;
    }
    return success;
}

// Test: Restart attempts run out when the server cannot come back.
static bool test_restart_attempts_exhausted() {
    std::string directory = test_support::make_temp_directory();
    std::vector<HealthEvent> events;
    std::mutex events_mutex;
    bool success = false;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        // The first process answers everything but pings; every later spawn exits at once.
        auto config = test_support::fake_server_config(
            "once", {"--never-reply", "ping", "--single-start", directory + "/started"});
        config.max_restart_attempts = 2;
        save_disabled(store, config);
        ServerManager manager(store, registry, fast_options());
        manager.initialize();
        manager.subscribe_health_events([&events, &events_mutex](const HealthEvent &event) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(event);
        });

        bool enabled = manager.enable_server("once").success;
        auto first = manager.check_health("once");
        auto second = manager.check_health("once");

        std::lock_guard<std::mutex> lock(events_mutex);
        std::vector<HealthEventType> types;
        for (const auto &event : events) {
            types.push_back(event.type);
        }
        std::vector<HealthEventType> expected = {HealthEventType::Unhealthy,     HealthEventType::Restarting,
                                                 HealthEventType::Restarting,    HealthEventType::RestartFailed,
                                                 HealthEventType::Unhealthy,     HealthEventType::RestartFailed};

        success = enabled && types == expected && events[1].attempt == 1 && events[2].attempt == 2 &&
                  !events[3].error.empty() && events[5].error == "Max restart attempts (2) exceeded" &&
                  first.status == HealthStatus::Unhealthy && first.restart_count == 2 &&
                  second.status == HealthStatus::Unhealthy && second.restart_count == 2 &&
                  manager.is_server_active("once") && !registry.has_tool("mcp_once_read");
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Restarts stop after the configured number of attempts" << std::endl;
    } else {
        std::cout << "  FAIL: Exhausted restarts produced " << events.size() << " event(s)" << std::endl;
    }
    return success;
}

// Test: A server process that exits on its own is marked unhealthy and restarted.
static bool test_process_exit_restarts_server() {
    std::string directory = test_support::make_temp_directory();
    std::vector<HealthEvent> events;
    std::mutex events_mutex;
    bool success = false;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        save_disabled(store, test_support::fake_server_config("crash", {"--stdio", "--exit-on-call"}));
        ServerManager manager(store, registry, fast_options());
        manager.initialize();
        std::atomic<bool> restarted{false};
        manager.subscribe_health_events([&events, &events_mutex, &restarted](const HealthEvent &event) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(event);
            if (event.type == HealthEventType::Restarted) {
                restarted = true;
            }
        });

        bool enabled = manager.enable_server("crash").success;
        auto tool = registry.get_tool("mcp_crash_read");
        tool_registry::ToolResult crashed;
        if (tool) {
            crashed = tool->execute({{"path", "/tmp/x"}});
        }
        for (int waited = 0; waited < 5000 && !restarted.load(); waited += 20) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        auto health = manager.server_health("crash");
        auto statuses = manager.server_status();
        std::lock_guard<std::mutex> lock(events_mutex);
        success = enabled && tool && !crashed.success && crashed.error_kind == ErrorKind::ConnectionClosed &&
                  events.size() == 3 && events[0].type == HealthEventType::Unhealthy &&
                  events[1].type == HealthEventType::Restarting && events[1].attempt == 1 &&
                  events[2].type == HealthEventType::Restarted && health &&
                  health->status == HealthStatus::Healthy && health->restart_count == 0 && statuses.size() == 1 &&
                  statuses[0].state == mcp_connection::ConnectionState::Ready && registry.has_tool("mcp_crash_read");
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Exited server process restarted in the background" << std::endl;
    } else {
        std::cout << "  FAIL: Process exit produced " << events.size() << " health event(s)" << std::endl;
    }
    return success;
}

// Test: Status queries answer while a health check waits on a silent server.
static bool test_status_not_blocked_by_health_check() {
    std::string directory = test_support::make_temp_directory();
    bool success = false;
    long long status_milliseconds = -1;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        auto config = test_support::fake_server_config("slow", {"--never-reply", "ping"});
        config.auto_restart = false;
        save_disabled(store, config);
        auto options = fast_options();
        options.health_ping_timeout_milliseconds = 1500;
        ServerManager manager(store, registry, options);
        manager.initialize();

        bool enabled = manager.enable_server("slow").success;
        auto check = std::async(std::launch::async, [&manager] { return manager.check_health("slow"); });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        auto started = std::chrono::steady_clock::now();
        auto statuses = manager.server_status();
        bool active = manager.is_server_active("slow");
        auto health = manager.server_health("slow");
        auto documentation = manager.get_tool_documentation("read");
        status_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - started)
                                  .count();
        bool check_still_running = check.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready;
        auto checked = check.get();

        success = enabled && check_still_running && status_milliseconds < 500 && statuses.size() == 1 && active &&
                  health && documentation && checked.status == HealthStatus::Unhealthy;
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Status answered in " << status_milliseconds << " ms during a health check" << std::endl;
    } else {
        std::cout << "  FAIL: Status queries took " << status_milliseconds << " ms during a health check"
                  << std::endl;
    }
    return success;
}

// Test: An executor copied out of the registry fails cleanly once its server is disabled.
static bool test_executor_after_disable() {
    std::string directory = test_support::make_temp_directory();
    bool success = false;
    tool_registry::ToolResult late;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        save_disabled(store, test_support::fake_server_config("fs"));
        ServerManager manager(store, registry, fast_options());
        manager.initialize();

        bool enabled = manager.enable_server("fs").success;
        auto tool = registry.get_tool("mcp_fs_read");
        manager.disable_server("fs");
        if (tool) {
            late = tool->execute({{"path", "/tmp/x"}});
        }

        success = enabled && tool && !late.success && late.error_kind == ErrorKind::NotConnected &&
                  !registry.has_tool("mcp_fs_read");
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Stale executor reports NotConnected" << std::endl;
    } else {
        std::cout << "  FAIL: Stale executor returned '" << late.error << "'" << std::endl;
    }
    return success;
}

// Test: Enabling a server with a check interval starts the monitoring thread.
static bool test_health_monitoring_thread() {
    std::string directory = test_support::make_temp_directory();
    std::atomic<int> healthy_events{0};
    bool success = false;
    {
        mcp_config::ConfigStore store(directory);
        tool_registry::ToolRegistry registry;
        auto config = test_support::fake_server_config("steady");
        config.health_check_interval_milliseconds = 50;
        save_disabled(store, config);
        ServerManager manager(store, registry, fast_options());
        manager.initialize();
        manager.subscribe_health_events([&healthy_events](const HealthEvent &event) {
            if (event.type == HealthEventType::Healthy) {
                ++healthy_events;
            }
        });

        bool enabled = manager.enable_server("steady").success;
        for (int waited = 0; waited < 3000 && healthy_events.load() < 2; waited += 20) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        manager.stop_health_monitoring();

        auto health = manager.server_health("steady");
        success = enabled && healthy_events.load() >= 2 && health && health->status == HealthStatus::Healthy &&
                  manager.health_status().size() == 1;
    }
    test_support::remove_directory(directory);

    if (success) {
        std::cout << "  OK: Monitoring started on enable and checks servers periodically" << std::endl;
    } else {
        std::cout << "  FAIL: Monitoring thread produced " << healthy_events.load() << " healthy event(s)"
                  << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_enable_disable_persists();
    all_passed &= test_enable_servers_aggregates_errors();
    all_passed &= test_start_enabled_and_cleanup();
    all_passed &= test_tool_documentation();
    all_passed &= test_templates_add_and_remove();
    all_passed &= test_health_restart_cycle();
    all_passed &= test_restart_attempts_exhausted();
    all_passed &= test_process_exit_restarts_server();
    all_passed &= test_status_not_blocked_by_health_check();
    all_passed &= test_executor_after_disable();
    all_passed &= test_health_monitoring_thread();
    return all_passed;
}

} // namespace test_server_manager
