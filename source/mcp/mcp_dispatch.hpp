#ifndef AIMCPS_MCP_DISPATCH_HPP
#define AIMCPS_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch over a ToolRegistry.
// Stateless: each call parses, validates, routes and answers one request body.

#include <nlohmann/json.hpp>
#include <string>

#include "mcp/mcp_tools.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

constexpr const char *SERVER_NAME = "aimcps";
constexpr const char *SERVER_VERSION = "0.1.0";
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

// Error messages are capped at this many bytes.
constexpr std::size_t kMaxErrorMessageBytes = 20000;

// A JSON-RPC response together with the HTTP status it travels with.
struct DispatchResult {
    int http_status = 200;
    json response;
};

// Handle one raw request body. Never throws for anything a caller can send;
// tool failures are converted to error envelopes.
DispatchResult dispatch_body(const mcp_tools::ToolRegistry &registry, const std::string &body);

// Same, for an already parsed message.
DispatchResult dispatch_message(const mcp_tools::ToolRegistry &registry, const json &message);

} // namespace mcp_dispatch

#endif // AIMCPS_MCP_DISPATCH_HPP
