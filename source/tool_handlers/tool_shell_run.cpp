#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/shell_words.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <set>

using json = nlohmann::json;

// Tool handler for "shell_run".
// Runs an allow-listed program directly (no shell). Only the first word of
// the command line is checked against the allow-list.

namespace tool_shell_run {

// Programs shell_run may start.
const std::set<std::string> &allowed_programs() {
    static const std::set<std::string> programs = {"pwd", "whoami", "uname", "echo", "ls"};
    return programs;
}

} // namespace tool_shell_run

static json refuse(const std::string &error_message) {
    json result;
    result["ok"] = false;
    result["error"] = error_message;
    return result;
}

static json handle_shell_run(const json &arguments) {
    const std::string &command_line = arguments.at("cmd").get_ref<const std::string &>();
    std::string working_directory = arguments.at("cwd").get<std::string>();
    int timeout_seconds = static_cast<int>(
        std::min(tool_handlers::integer_argument(arguments, "timeout", 1), tool_handlers::kMaxTimeoutSeconds));

    shell_words::SplitResult split = shell_words::split(command_line);
    if (!split.success) {
        return refuse(split.error_message);
    }
    if (split.words.empty()) {
        return refuse("empty command");
    }

    const std::string &program = split.words.front();
    if (tool_shell_run::allowed_programs().count(program) == 0) {
        debug_log::log("shell_run refused program: " + program);
        return refuse("command not allowed: " + program);
    }

    debug_log::log("shell_run cmd=" + command_line + " cwd=" + working_directory);
    return tool_handlers::run_command(split.words, working_directory, timeout_seconds);
}

namespace tool_shell_run {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "shell_run",
        "Run a whitelisted command (pwd, whoami, uname, echo, ls) and return its output. "
        "Arguments are split with shell quoting rules but nothing is expanded.",
        {
            {"cmd", "string", std::nullopt, "Command line, e.g. \"ls -la src\"."},
            {"cwd", "string", json("."), "Working directory."},
            {"timeout", "integer", json(30), "Seconds before the command is killed."},
        },
        handle_shell_run
    });
}

} // namespace tool_shell_run
