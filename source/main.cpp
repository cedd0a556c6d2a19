// aimcps – AI-assist MCP server
// Entry point: JSON-RPC over HTTP front end for the tool registry.
//
// Configuration comes from the environment (see config/server_config.hpp).
// Logs go to stderr.

#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config/server_config.hpp"
#include "http/http_server.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    std::cerr << "[aimcps] aimcps – AI-assist MCP server, build " << __DATE__ << " " << __TIME__ << std::endl;

    server_config::ServerConfig config;
    try {
        config = server_config::load_from_environment();
    } catch (const std::exception &error) {
        std::cerr << "config error: " << error.what() << '\n';
        return 1;
    }
    debug_log::info("config: " + server_config::describe(config));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A client hanging up mid-response must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    mcp_tools::ToolRegistry registry;
    std::vector<std::string> skipped_modules = tool_handlers::register_all_tools(registry);
    debug_log::info("registered " + std::to_string(registry.size()) + " tools" +
                    (skipped_modules.empty() ? "" : " (" + std::to_string(skipped_modules.size()) +
                                                        " modules skipped)"));

    http_server::HttpServer server(config, registry);
    if (!server.start()) {
        return 1;
    }

    server.run(shutdown_requested);

    debug_log::info("Shutdown requested; draining workers.");
    server.stop();
    debug_log::info("aimcps shut down.");
    return 0;
}
