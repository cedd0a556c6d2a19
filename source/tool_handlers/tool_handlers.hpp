#ifndef AIMCPS_TOOL_HANDLERS_HPP
#define AIMCPS_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register_tool(registry) function; the list
// of modules is fixed at compile time and each one is registered in its own
// recoverable scope.

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

using json = nlohmann::json;

// Output and error text returned by tools is capped at this many bytes.
constexpr std::size_t kMaxToolOutputBytes = 20000;

// Longer timeouts are clamped to this.
constexpr long long kMaxTimeoutSeconds = 24 * 60 * 60;

using RegisterFunction = void (*)(mcp_tools::ToolRegistry &registry);

struct ToolModule {
    const char *name;
    RegisterFunction register_function;
};

// The modules this server ships with.
const std::vector<ToolModule> &builtin_modules();

// Register each module; a module that throws is logged and skipped without
// affecting the others. Returns the names of the skipped modules.
std::vector<std::string> register_modules(mcp_tools::ToolRegistry &registry, const std::vector<ToolModule> &modules);

// register_modules() over builtin_modules().
std::vector<std::string> register_all_tools(mcp_tools::ToolRegistry &registry);

// Run a command for a tool and translate the outcome: {"ok": true, "output"}
// on exit code 0; ToolError for spawn failure, timeout or non-zero exit, with
// the (capped) output in the message.
json run_command(const std::vector<std::string> &argv, const std::string &working_directory, int timeout_seconds);

// Reads an integer argument that must be >= minimum. Throws ArgumentError.
long long integer_argument(const json &arguments, const std::string &name, long long minimum);

} // namespace tool_handlers

#endif // AIMCPS_TOOL_HANDLERS_HPP
