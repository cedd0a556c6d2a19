#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "fs_write".
// Writes UTF-8 text to a file, creating parent directories as needed.

static json handle_fs_write(const json &arguments) {
    std::string path = arguments.at("path").get<std::string>();
    const std::string &content = arguments.at("content").get_ref<const std::string &>();

    debug_log::log("fs_write path=" + path + " bytes=" + std::to_string(content.size()));

    std::string error_message;
    if (!platform::write_file_contents(path, content, error_message)) {
        throw mcp_tools::ToolError(error_message);
    }

    json result;
    result["ok"] = true;
    result["path"] = path;
    return result;
}

namespace tool_fs_write {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "fs_write",
        "Write text to a file, replacing it if it exists and creating parent directories.",
        {
            {"path", "string", std::nullopt, "File to write."},
            {"content", "string", std::nullopt, "Text to write."},
        },
        handle_fs_write
    });
}

} // namespace tool_fs_write
