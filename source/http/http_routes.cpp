#include "http/http_routes.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <exception>

namespace http_routes {

using json = nlohmann::json;

namespace {

// Invalid UTF-8 in a tool result must not turn into a failed response.
std::string serialize(const json &value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

HttpResponse json_response(int status, const json &value) {
    HttpResponse response;
    response.status = status;
    response.body = serialize(value);
    return response;
}

std::string strip_query(const std::string &path) {
    auto question_mark = path.find('?');
    if (question_mark == std::string::npos) {
        return path;
    }
    return path.substr(0, question_mark);
}

bool is_rpc_path(const std::string &path) {
    return path == "/mcp" || path == "/mcp/rpc";
}

HttpResponse handle_rpc(const RouteContext &context, const HttpRequest &request) {
    mcp_dispatch::DispatchResult result = mcp_dispatch::dispatch_body(context.registry, request.body);
    return json_response(result.http_status, result.response);
}

HttpResponse handle_health(const RouteContext &context) {
    json body;
    body["status"] = "ok";
    body["service"] = mcp_dispatch::SERVER_NAME;
    body["version"] = mcp_dispatch::SERVER_VERSION;
    body["tools"] = context.registry.size();
    return json_response(200, body);
}

HttpResponse handle_root() {
    json body;
    body["service"] = mcp_dispatch::SERVER_NAME;
    body["version"] = mcp_dispatch::SERVER_VERSION;
    body["paths"] = json::array({"POST /mcp", "POST /mcp/rpc", "GET /health", "GET /"});
    return json_response(200, body);
}

HttpResponse route_unchecked(const RouteContext &context, const HttpRequest &request, const std::string &path) {
    if (!access_gate::authorize(context.config.access_token, path, request.authorization)) {
        debug_log::log("Rejected unauthorized " + request.method + " " + path);
        return make_error_response(401, "unauthorized");
    }

    if (request.method == "OPTIONS") {
        HttpResponse response;
        response.status = 204;
        return response;
    }

    if (is_rpc_path(path)) {
        if (request.method != "POST") {
            return make_error_response(405, "method not allowed");
        }
        return handle_rpc(context, request);
    }
    if (path == "/health") {
        if (request.method != "GET") {
            return make_error_response(405, "method not allowed");
        }
        return handle_health(context);
    }
    if (path == "/") {
        if (request.method != "GET") {
            return make_error_response(405, "method not allowed");
        }
        return handle_root();
    }

    return make_error_response(404, "not found");
}

} // namespace

HttpResponse make_error_response(int status, const std::string &message) {
    json body;
    body["error"] = message;
    return json_response(status, body);
}

bool may_block(const HttpRequest &request) {
    if (request.method != "POST" || !is_rpc_path(strip_query(request.path))) {
        return false;
    }
    json message = json::parse(request.body, nullptr, false);
    if (!message.is_object()) {
        return false;
    }
    auto method = message.find("method");
    return method != message.end() && method->is_string() && *method == "tools/call";
}

HttpResponse route_request(const RouteContext &context, const HttpRequest &request) {
    std::string path = strip_query(request.path);

    HttpResponse response;
    try {
        response = route_unchecked(context, request, path);
    } catch (const std::exception &error) {
        debug_log::warn("Unhandled error while serving " + request.method + " " + path + ": " + error.what());
        response = json_response(500, json_rpc::build_error_response(nullptr, json_rpc::INTERNAL_ERROR,
                                                                      "Internal error"));
    }

    access_gate::HeaderList cors = access_gate::cors_headers(context.config.allowed_origins, request.origin);
    response.headers.insert(response.headers.end(), cors.begin(), cors.end());
    return response;
}

} // namespace http_routes
