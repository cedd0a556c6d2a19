#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "fs_read".
// Returns the text of a file, optionally capped at max_bytes (0 = no cap).
// A missing path is a negative result; anything else that stops the read is a
// tool error.

static json handle_fs_read(const json &arguments) {
    std::string path = arguments.at("path").get<std::string>();
    auto max_bytes = static_cast<std::size_t>(tool_handlers::integer_argument(arguments, "max_bytes", 0));

    debug_log::log("fs_read path=" + path + " max_bytes=" + std::to_string(max_bytes));

    json result;
    std::string contents;
    bool truncated = false;
    std::string error_message;
    platform::ReadStatus status = platform::read_file_contents(path, max_bytes, contents, truncated, error_message);
    if (status == platform::ReadStatus::NotFound) {
        result["ok"] = false;
        result["error"] = "not found";
        result["path"] = path;
        return result;
    }
    if (status == platform::ReadStatus::Failed) {
        throw mcp_tools::ToolError(error_message);
    }

    utf8_sanitize::sanitize(contents);
    result["ok"] = true;
    result["path"] = path;
    result["text"] = contents;
    result["truncated"] = truncated;
    return result;
}

namespace tool_fs_read {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "fs_read",
        "Read a text file. Returns its contents (invalid UTF-8 replaced) and whether it was cut at max_bytes.",
        {
            {"path", "string", std::nullopt, "File to read."},
            {"max_bytes", "integer", json(1024 * 1024), "Maximum bytes to return; 0 reads the whole file."},
        },
        handle_fs_read
    });
}

} // namespace tool_fs_read
