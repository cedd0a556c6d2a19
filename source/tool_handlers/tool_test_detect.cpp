#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

// Tool handler for "test_detect".
// Suggests a test command for the project in cwd.

static json handle_test_detect(const json &arguments) {
    std::filesystem::path working_directory(arguments.at("cwd").get<std::string>());

    std::error_code error;
    json result;
    result["ok"] = true;
    if (std::filesystem::exists(working_directory / "package.json", error)) {
        result["cmd"] = "pnpm test || npm test";
    } else {
        result["cmd"] = "pytest -q";
    }
    return result;
}

namespace tool_test_detect {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "test_detect",
        "Suggest the test command for a project: npm/pnpm when package.json exists, pytest otherwise.",
        {
            {"cwd", "string", json("."), "Project directory."},
        },
        handle_test_detect
    });
}

} // namespace tool_test_detect
