#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

// Tool handler for "fs_list".
// Lists regular files under dir matching glob ("**" spans directories).
// Matches are sorted and at most `limit` of them are considered.

static json handle_fs_list(const json &arguments) {
    std::string directory = arguments.at("dir").get<std::string>();
    std::string pattern = arguments.at("glob").get<std::string>();
    auto limit = static_cast<std::size_t>(tool_handlers::integer_argument(arguments, "limit", 0));

    debug_log::log("fs_list dir=" + directory + " glob=" + pattern);

    json result;
    std::error_code error;
    if (!std::filesystem::exists(directory, error)) {
        result["ok"] = false;
        result["error"] = "dir not found";
        result["dir"] = directory;
        return result;
    }

    json items = json::array();
    for (const auto &entry : platform::list_files(directory, pattern, limit)) {
        items.push_back({{"path", entry.path}, {"size", entry.size}});
    }

    result["ok"] = true;
    result["dir"] = directory;
    result["items"] = items;
    return result;
}

namespace tool_fs_list {

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool({
        "fs_list",
        "List files under a directory matching a glob pattern, with their sizes.",
        {
            {"dir", "string", std::nullopt, "Directory to search."},
            {"glob", "string", json("**/*"), "Pattern relative to dir; ** matches any number of directories."},
            {"limit", "integer", json(200), "Maximum number of matches to consider."},
        },
        handle_fs_list
    });
}

} // namespace tool_fs_list
