// Tests for the shared tool registry: ownership, idempotent registration, invocation.

#include "tools/tool_registry.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace test_tool_registry {

static tool_registry::RegisteredTool make_tool(const std::string &name, const std::string &reply) {
    tool_registry::RegisteredTool tool;
    tool.name = name;
    tool.description = "test tool " + name;
    tool.execute = [reply](const json &) {
        tool_registry::ToolResult result;
        result.success = true;
        result.data = reply;
        return result;
    };
    return tool;
}

// Test: Registering the same name twice leaves exactly one entry.
static bool test_register_is_idempotent() {
    tool_registry::ToolRegistry registry;
    auto first = registry.register_tool(make_tool("mcp_fs_read", "one"), "mcp:fs");
    auto second = registry.register_tool(make_tool("mcp_fs_read", "two"), "mcp:fs");
    auto invoked = registry.invoke("mcp_fs_read", json::object());

    bool success = first == tool_registry::RegisterOutcome::Registered &&
                   second == tool_registry::RegisterOutcome::AlreadyRegistered && registry.tool_count() == 1 &&
                   invoked.success && invoked.data == "one";

    if (success) {
        std::cout << "  OK: Duplicate registration is a no-op" << std::endl;
    } else {
        std::cout << "  FAIL: Registry holds " << registry.tool_count() << " entries" << std::endl;
    }
    return success;
}

// Test: A name held by another owner is a collision and keeps the first entry.
static bool test_collision_keeps_first() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_tool("shared", "first"), "owner-a");
    auto outcome = registry.register_tool(make_tool("shared", "second"), "owner-b");

    bool success = outcome == tool_registry::RegisterOutcome::NameCollision && registry.owner_of("shared") == "owner-a" &&
                   registry.invoke("shared", json::object()).data == "first";

    if (success) {
        std::cout << "  OK: Collision skipped, first registration wins" << std::endl;
    } else {
        std::cout << "  FAIL: Collision handling" << std::endl;
    }
    return success;
}

// Test: Only the owner can unregister an entry.
static bool test_unregister_respects_owner() {
    tool_registry::ToolRegistry registry;
    registry.register_tool(make_tool("a_tool", "a"), "owner-a");
    registry.register_tool(make_tool("b_tool", "b"), "owner-b");
    registry.register_tool(make_tool("b_other", "b"), "owner-b");

    bool foreign = registry.unregister_tool("a_tool", "owner-b");
    std::size_t removed = registry.unregister_owner("owner-b");

    bool success = !foreign && removed == 2 && registry.has_tool("a_tool") && registry.tool_count() == 1 &&
                   registry.unregister_tool("a_tool", "owner-a") && registry.tool_count() == 0;

    if (success) {
        std::cout << "  OK: Unregistration limited to owned entries" << std::endl;
    } else {
        std::cout << "  FAIL: Owner check on unregister" << std::endl;
    }
    return success;
}

// Test: Unknown tools and throwing executors come back as failed results.
static bool test_invoke_never_throws() {
    tool_registry::ToolRegistry registry;
    tool_registry::RegisteredTool throwing;
    throwing.name = "explodes";
    throwing.execute = [](const json &) -> tool_registry::ToolResult { throw std::runtime_error("kaboom"); };
    registry.register_tool(throwing, "owner");

    auto unknown = registry.invoke("missing", json::object());
    auto exploded = registry.invoke("explodes", json::object());

    bool success = !unknown.success && unknown.error == "Unknown tool: missing" && !exploded.success &&
                   exploded.error.find("kaboom") != std::string::npos;

    if (success) {
        std::cout << "  OK: invoke reports failures as results" << std::endl;
    } else {
        std::cout << "  FAIL: invoke error handling" << std::endl;
    }
    return success;
}

// Test: Concurrent managers registering and unregistering do not disturb each other.
static bool test_concurrent_owners() {
    tool_registry::ToolRegistry registry;
    const int owner_count = 8;
    const int tools_per_owner = 50;

    std::vector<std::thread> threads;
    for (int owner = 0; owner < owner_count; ++owner) {
        threads.emplace_back([&registry, owner, tools_per_owner] {
            const std::string owner_id = "owner-" + std::to_string(owner);
            for (int index = 0; index < tools_per_owner; ++index) {
                registry.register_tool(make_tool(owner_id + "_tool_" + std::to_string(index), owner_id), owner_id);
            }
            // Odd owners remove their entries again.
            if (owner % 2 == 1) {
                for (int index = 0; index < tools_per_owner; ++index) {
                    registry.unregister_tool(owner_id + "_tool_" + std::to_string(index), owner_id);
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    bool success = registry.tool_count() == static_cast<std::size_t>((owner_count / 2) * tools_per_owner) &&
                   registry.has_tool("owner-0_tool_0") && !registry.has_tool("owner-1_tool_0");

    if (success) {
        std::cout << "  OK: Concurrent owners keep their own entries" << std::endl;
    } else {
        std::cout << "  FAIL: Registry holds " << registry.tool_count() << " entries after concurrent use" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_register_is_idempotent();
    all_passed &= test_collision_keeps_first();
    all_passed &= test_unregister_respects_owner();
    all_passed &= test_invoke_never_throws();
    all_passed &= test_concurrent_owners();
    return all_passed;
}

} // namespace test_tool_registry
