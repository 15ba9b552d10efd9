// Test runner: runs all protocol, routing, handler and session tests and
// reports results. Uses the in-memory studio backend; no application needed.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

// Forward declarations of test functions from other test files.
namespace test_json_rpc {
    bool run_all_tests();
}

namespace test_tool_catalog {
    bool run_all_tests();
}

namespace test_context_refresh {
    bool run_all_tests();
}

namespace test_handlers {
    bool run_all_tests();
}

namespace test_session {
    bool run_all_tests();
}

namespace test_server_config {
    bool run_all_tests();
}

namespace test_utf8_sanitize {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    // Handler diagnostics would drown the report.
    if (!debug_log::is_debug_env_enabled()) {
        debug_log::set_level(debug_log::Level::Error);
    }

    // The catalog is process-wide, filled once with the default config.
    tool_handlers::register_all_tools();

    std::vector<TestSuite> suites = {
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_tool_catalog", test_tool_catalog::run_all_tests},
        {"test_context_refresh", test_context_refresh::run_all_tests},
        {"test_handlers", test_handlers::run_all_tests},
        {"test_session", test_session::run_all_tests},
        {"test_server_config", test_server_config::run_all_tests},
        {"test_utf8_sanitize", test_utf8_sanitize::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== EDMCPS Test Runner ===" << std::endl;
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
