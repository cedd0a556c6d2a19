#include "tool_handlers/tool_handlers.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <exception>

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_fs_read { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_fs_list { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_fs_write { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_shell_run { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_test_detect { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_test_run { void register_tool(mcp_tools::ToolRegistry &registry); }

namespace tool_handlers {

const std::vector<ToolModule> &builtin_modules() {
    static const std::vector<ToolModule> modules = {
        {"fs_read", tool_fs_read::register_tool},
        {"fs_list", tool_fs_list::register_tool},
        {"fs_write", tool_fs_write::register_tool},
        {"shell_run", tool_shell_run::register_tool},
        {"test_detect", tool_test_detect::register_tool},
        {"test_run", tool_test_run::register_tool},
    };
    return modules;
}

std::vector<std::string> register_modules(mcp_tools::ToolRegistry &registry, const std::vector<ToolModule> &modules) {
    std::vector<std::string> skipped;
    for (const auto &module : modules) {
        try {
            module.register_function(registry);
            debug_log::log("Registered tool module " + std::string(module.name));
        } catch (const std::exception &error) {
            debug_log::warn("skipped tool module " + std::string(module.name) + ": " + error.what());
            skipped.push_back(module.name);
        }
    }
    return skipped;
}

std::vector<std::string> register_all_tools(mcp_tools::ToolRegistry &registry) {
    return register_modules(registry, builtin_modules());
}

json run_command(const std::vector<std::string> &argv, const std::string &working_directory, int timeout_seconds) {
    platform::ProcessResult process = platform::run_process(argv, working_directory, timeout_seconds,
                                                            kMaxToolOutputBytes);
    std::string output = utf8_sanitize::clean_output(process.output, kMaxToolOutputBytes);

    if (!process.started) {
        throw mcp_tools::ToolError(process.error_message);
    }
    if (process.timed_out) {
        throw mcp_tools::ToolError("command timed out after " + std::to_string(timeout_seconds) + "s" +
                                   (output.empty() ? "" : "; output: " + output));
    }
    if (!process.error_message.empty()) {
        throw mcp_tools::ToolError(process.error_message);
    }
    if (process.exit_code != 0) {
        throw mcp_tools::ToolError("command exited with code " + std::to_string(process.exit_code) +
                                   (output.empty() ? "" : ": " + output));
    }

    json result;
    result["ok"] = true;
    result["output"] = output;
    return result;
}

long long integer_argument(const json &arguments, const std::string &name, long long minimum) {
    long long value = arguments.at(name).get<long long>();
    if (value < minimum) {
        throw mcp_tools::ArgumentError("parameter '" + name + "' must be >= " + std::to_string(minimum));
    }
    return value;
}

} // namespace tool_handlers
