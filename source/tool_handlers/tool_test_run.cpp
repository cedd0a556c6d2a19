#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

// Tool handler for "test_run".
// Runs a test command through /bin/sh so that "a || b" style commands from
// test_detect work as written.

static json handle_test_run(const json &arguments) {
    std::string command_line = arguments.at("cmd").get<std::string>();
    std::string working_directory = arguments.at("cwd").get<std::string>();
    int timeout_seconds = static_cast<int>(
        std::min(tool_handlers::integer_argument(arguments, "timeout", 1), tool_handlers::kMaxTimeoutSeconds));

    debug_log::log("test_run cmd=" + command_line + " cwd=" + working_directory +
                   " timeout=" + std::to_string(timeout_seconds));
    return tool_handlers::run_command({"/bin/sh", "-c", command_line}, working_directory, timeout_seconds);
}

namespace tool_test_run {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "test_run",
        "Run the project's test command through the shell and return its output.",
        {
            {"cmd", "string", json("pytest -q"), "Test command line."},
            {"cwd", "string", json("."), "Project directory."},
            {"timeout", "integer", json(120), "Seconds before the tests are killed."},
        },
        handle_test_run
    });
}

} // namespace tool_test_run
