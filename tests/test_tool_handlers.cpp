// Tests for the built-in tools, called through the registry the way
// tools/call does (bind first, then invoke).

#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_tool_handlers {

namespace fs = std::filesystem;

static json call(const mcp_tools::ToolRegistry &registry, const std::string &name, const json &arguments) {
    const mcp_tools::ToolDefinition *tool = registry.find(name);
    if (tool == nullptr) {
        throw std::runtime_error("tool not registered: " + name);
    }
    return tool->handler(mcp_tools::bind_arguments(*tool, arguments));
}

static bool report(const std::string &label, bool success, const std::string &detail = "") {
    if (success) {
        std::cout << "  OK: " << label << std::endl;
    } else {
        std::cout << "  FAIL: " << label << (detail.empty() ? "" : ": " + detail) << std::endl;
    }
    return success;
}

// Test: all six modules register.
static bool test_builtin_registration() {
    mcp_tools::ToolRegistry registry;
    auto skipped = tool_handlers::register_all_tools(registry);
    json tools = registry.list()["tools"];

    bool success = skipped.empty() && registry.size() == 6 && tools[0]["name"] == "fs_list" &&
                   registry.find("shell_run") != nullptr && registry.find("test_run") != nullptr;
    return report("Built-in tools register", success, tools.dump());
}

static void broken_module(mcp_tools::ToolRegistry &) {
    throw std::runtime_error("missing dependency");
}

// Test: one failing module does not stop the others.
static bool test_failing_module_skipped() {
    mcp_tools::ToolRegistry registry;
    std::vector<tool_handlers::ToolModule> modules = {
        {"broken", broken_module},
        tool_handlers::builtin_modules().front(),
    };
    auto skipped = tool_handlers::register_modules(registry, modules);

    bool success = skipped.size() == 1 && skipped[0] == "broken" && registry.size() == 1;
    return report("Throwing module is skipped, others register", success);
}

// Test: fs_write, fs_read and fs_list on a temporary tree.
static bool test_filesystem_tools() {
    std::string pattern = (fs::temp_directory_path() / "aimcps-tools-XXXXXX").string();
    if (mkdtemp(&pattern[0]) == nullptr) {
        return report("Filesystem tools", false, "mkdtemp failed");
    }
    fs::path root(pattern);

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    bool success = true;
    std::string detail;
    try {
        json written = call(registry, "fs_write", {{"path", (root / "notes/todo.txt").string()}, {"content", "abcdef"}});
        json read_all = call(registry, "fs_read", {{"path", (root / "notes/todo.txt").string()}});
        json read_some = call(registry, "fs_read", {{"path", (root / "notes/todo.txt").string()}, {"max_bytes", 3}});
        json read_missing = call(registry, "fs_read", {{"path", (root / "nope.txt").string()}});
        json listed = call(registry, "fs_list", {{"dir", root.string()}, {"glob", "**/*.txt"}});
        json listed_missing = call(registry, "fs_list", {{"dir", (root / "absent").string()}});

        success = written["ok"] == true && read_all["text"] == "abcdef" && read_all["truncated"] == false &&
                  read_some["text"] == "abc" && read_some["truncated"] == true && read_missing["ok"] == false &&
                  read_missing["error"] == "not found" && listed["items"].size() == 1 &&
                  listed["items"][0]["size"] == 6 && listed_missing["ok"] == false &&
                  listed_missing["error"] == "dir not found";
        detail = listed.dump();
    } catch (const std::exception &error) {
        success = false;
        detail = error.what();
    }

    std::error_code ignored;
    fs::remove_all(root, ignored);
    return report("fs_write, fs_read and fs_list round trip on disk", success, detail);
}

// Test: invalid UTF-8 in a file comes back replaced.
static bool test_fs_read_replaces_invalid_utf8() {
    std::string pattern = (fs::temp_directory_path() / "aimcps-utf8-XXXXXX").string();
    if (mkdtemp(&pattern[0]) == nullptr) {
        return report("fs_read invalid UTF-8", false, "mkdtemp failed");
    }
    fs::path file = fs::path(pattern) / "binary.dat";
    {
        std::ofstream stream(file, std::ios::binary);
        stream << "ok\xFF";
    }

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);
    json result = call(registry, "fs_read", {{"path", file.string()}});

    std::error_code ignored;
    fs::remove_all(pattern, ignored);
    return report("fs_read replaces invalid UTF-8", result["text"] == "ok\xEF\xBF\xBD", result.dump());
}

// Test: shell_run allow-list and quoting.
static bool test_shell_run() {
    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    json echoed = call(registry, "shell_run", {{"cmd", "echo 'a  b' c"}});
    json refused = call(registry, "shell_run", {{"cmd", "rm -rf /tmp/x"}});
    json chained = call(registry, "shell_run", {{"cmd", "cat /etc/passwd; ls"}});
    json unbalanced = call(registry, "shell_run", {{"cmd", "echo 'oops"}});

    bool success = echoed["ok"] == true && echoed["output"] == "a  b c\n" && refused["ok"] == false &&
                   refused["error"] == "command not allowed: rm" && chained["ok"] == false &&
                   unbalanced["ok"] == false && unbalanced["error"] == "No closing quotation";
    return report("shell_run runs allowed programs only", success, echoed.dump() + " " + refused.dump());
}

// Test: a failing allowed command raises ToolError.
static bool test_shell_run_failure() {
    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    bool raised = false;
    std::string message;
    try {
        call(registry, "shell_run", {{"cmd", "ls /nonexistent/aimcps-missing"}});
    } catch (const mcp_tools::ToolError &error) {
        raised = true;
        message = error.what();
    }
    return report("Non-zero exit raises ToolError",
                  raised && message.find("command exited with code") != std::string::npos, message);
}

// Test: test_detect suggestions.
static bool test_test_detect() {
    std::string pattern = (fs::temp_directory_path() / "aimcps-detect-XXXXXX").string();
    if (mkdtemp(&pattern[0]) == nullptr) {
        return report("test_detect", false, "mkdtemp failed");
    }

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    json python_project = call(registry, "test_detect", {{"cwd", pattern}});
    {
        std::ofstream stream(fs::path(pattern) / "package.json");
        stream << "{}";
    }
    json node_project = call(registry, "test_detect", {{"cwd", pattern}});

    std::error_code ignored;
    fs::remove_all(pattern, ignored);

    bool success = python_project["cmd"] == "pytest -q" && node_project["cmd"] == "pnpm test || npm test";
    return report("test_detect picks pytest or npm", success);
}

// Test: test_run goes through the shell and enforces its timeout.
static bool test_test_run() {
    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    json passed = call(registry, "test_run", {{"cmd", "false || echo fallback"}, {"timeout", 10}});

    bool timed_out = false;
    try {
        call(registry, "test_run", {{"cmd", "sleep 30"}, {"timeout", 1}});
    } catch (const mcp_tools::ToolError &error) {
        timed_out = std::string(error.what()).find("timed out") != std::string::npos;
    }

    bool rejected = false;
    try {
        call(registry, "test_run", {{"cmd", "true"}, {"timeout", 0}});
    } catch (const mcp_tools::ArgumentError &) {
        rejected = true;
    }

    bool success = passed["ok"] == true && passed["output"] == "fallback\n" && timed_out && rejected;
    return report("test_run uses the shell, times out and validates timeout", success, passed.dump());
}

// Test: a command that silences its output still times out.
static bool test_test_run_silent_timeout() {
    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    auto started_at = std::chrono::steady_clock::now();
    std::string message;
    try {
        call(registry, "test_run", {{"cmd", "exec >/dev/null 2>&1; sleep 8"}, {"timeout", 1}});
    } catch (const mcp_tools::ToolError &error) {
        message = error.what();
    }
    auto elapsed = std::chrono::steady_clock::now() - started_at;

    bool success = message.find("timed out") != std::string::npos && elapsed < std::chrono::seconds(5);
    return report("test_run with redirected output is killed at its timeout", success, message);
}

// Test: fs_read on something that is not a readable regular file is a tool error.
static bool test_fs_read_directory() {
    std::string pattern = (fs::temp_directory_path() / "aimcps-readdir-XXXXXX").string();
    if (mkdtemp(&pattern[0]) == nullptr) {
        return report("fs_read on a directory", false, "mkdtemp failed");
    }

    mcp_tools::ToolRegistry registry;
    tool_handlers::register_all_tools(registry);

    std::string message;
    try {
        json result = call(registry, "fs_read", {{"path", pattern}});
        message = "returned " + result.dump();
    } catch (const mcp_tools::ToolError &error) {
        message = error.what();
    }

    std::error_code ignored;
    fs::remove_all(pattern, ignored);
    return report("fs_read on a directory raises ToolError",
                  message.find("not a regular file") != std::string::npos, message);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_builtin_registration();
    all_passed &= test_failing_module_skipped();
    all_passed &= test_filesystem_tools();
    all_passed &= test_fs_read_replaces_invalid_utf8();
    all_passed &= test_shell_run();
    all_passed &= test_shell_run_failure();
    all_passed &= test_test_detect();
    all_passed &= test_test_run();
    all_passed &= test_test_run_silent_timeout();
    all_passed &= test_fs_read_directory();
    return all_passed;
}

} // namespace test_tool_handlers
