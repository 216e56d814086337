// Test runner: runs every test suite and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_json_rpc_framing {
    bool run_all_tests();
}

namespace test_permissions {
    bool run_all_tests();
}

namespace test_config_store {
    bool run_all_tests();
}

namespace test_tool_registry {
    bool run_all_tests();
}

namespace test_protocol_handler {
    bool run_all_tests();
}

namespace test_connection {
    bool run_all_tests();
}

namespace test_tool_manager {
    bool run_all_tests();
}

namespace test_server_manager {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_json_rpc_framing", test_json_rpc_framing::run_all_tests},
        {"test_permissions", test_permissions::run_all_tests},
        {"test_config_store", test_config_store::run_all_tests},
        {"test_tool_registry", test_tool_registry::run_all_tests},
        {"test_protocol_handler", test_protocol_handler::run_all_tests},
        {"test_connection", test_connection::run_all_tests},
        {"test_tool_manager", test_tool_manager::run_all_tests},
        {"test_server_manager", test_server_manager::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== MCPHOST Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
