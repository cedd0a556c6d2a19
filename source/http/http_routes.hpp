#ifndef AIMCPS_HTTP_ROUTES_HPP
#define AIMCPS_HTTP_ROUTES_HPP

// Transport-independent HTTP handling: access gate, routing to the JSON-RPC
// dispatcher and the informational endpoints, CORS decoration.
// http_server feeds this from libwebsockets; tests call it directly.

#include <string>

#include "config/server_config.hpp"
#include "http/access_gate.hpp"
#include "mcp/mcp_tools.hpp"

namespace http_routes {

struct HttpRequest {
    std::string method; // "GET", "POST", "OPTIONS", ...
    std::string path;   // may include a query string, which is ignored
    std::string authorization;
    std::string origin;
    std::string body;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    access_gate::HeaderList headers;
};

// Everything a request may read. Both members outlive the server and are
// never modified while it runs.
struct RouteContext {
    const server_config::ServerConfig &config;
    const mcp_tools::ToolRegistry &registry;
};

HttpResponse route_request(const RouteContext &context, const HttpRequest &request);

// True when serving the request may run a tool, which can block on disk or a
// child process. Everything else is answered without touching a tool.
bool may_block(const HttpRequest &request);

// Plain JSON error body used for non-RPC failures ({"error": message}).
HttpResponse make_error_response(int status, const std::string &message);

} // namespace http_routes

#endif // AIMCPS_HTTP_ROUTES_HPP
