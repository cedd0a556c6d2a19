// Test runner: runs every unit test suite and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_argument_reconciler {
    bool run_all_tests();
}

namespace test_tool_registry {
    bool run_all_tests();
}

namespace test_json_rpc {
    bool run_all_tests();
}

namespace test_mcp_dispatch {
    bool run_all_tests();
}

namespace test_access_gate {
    bool run_all_tests();
}

namespace test_http_routes {
    bool run_all_tests();
}

namespace test_server_config {
    bool run_all_tests();
}

namespace test_platform {
    bool run_all_tests();
}

namespace test_shell_words {
    bool run_all_tests();
}

namespace test_utf8_sanitize {
    bool run_all_tests();
}

namespace test_tool_handlers {
    bool run_all_tests();
}

namespace test_worker_pool {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_argument_reconciler", test_argument_reconciler::run_all_tests},
        {"test_tool_registry", test_tool_registry::run_all_tests},
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_mcp_dispatch", test_mcp_dispatch::run_all_tests},
        {"test_access_gate", test_access_gate::run_all_tests},
        {"test_http_routes", test_http_routes::run_all_tests},
        {"test_server_config", test_server_config::run_all_tests},
        {"test_platform", test_platform::run_all_tests},
        {"test_shell_words", test_shell_words::run_all_tests},
        {"test_utf8_sanitize", test_utf8_sanitize::run_all_tests},
        {"test_tool_handlers", test_tool_handlers::run_all_tests},
        {"test_worker_pool", test_worker_pool::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== AIMCPS Test Runner ===" << std::endl;
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
