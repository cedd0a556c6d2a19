#include "mcp/mcp_dispatch.hpp"
#include "mcp/argument_reconciler.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <exception>
#include <string>

// Routes parsed JSON-RPC messages to the tool registry.

namespace mcp_dispatch {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpNotFound = 404;
constexpr int kHttpInternalError = 500;

DispatchResult success(const json &request_id, const json &result) {
    return {kHttpOk, json_rpc::build_response(request_id, result)};
}

DispatchResult failure(int http_status, const json &request_id, int code, const std::string &message) {
    return {http_status, json_rpc::build_error_response(request_id, code, message)};
}

std::string bounded_message(const std::string &message) {
    return utf8_sanitize::clean_output(message, kMaxErrorMessageBytes);
}

// params.name as a string, or empty when absent or of another type.
std::string requested_tool_name(const json &params) {
    if (params.contains("name") && params["name"].is_string()) {
        return params["name"].get<std::string>();
    }
    return "";
}

DispatchResult tool_not_found(const json &request_id, const std::string &tool_name) {
    return failure(kHttpNotFound, request_id, json_rpc::METHOD_NOT_FOUND,
                   bounded_message("Tool not found: " + tool_name));
}

// Handle the "initialize" request.
DispatchResult handle_initialize(const json &request_id) {
    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"]["tools"] = json::object();
    result["serverInfo"] = server_info;
    return success(request_id, result);
}

// Handle "tools/describe" and its alias "tools/spec".
DispatchResult handle_tools_describe(const mcp_tools::ToolRegistry &registry, const json &request_id,
                                     const json &params) {
    std::string tool_name = requested_tool_name(params);
    auto descriptor = registry.describe(tool_name);
    if (!descriptor.has_value()) {
        return tool_not_found(request_id, tool_name);
    }
    return success(request_id, *descriptor);
}

// Handle the "tools/call" request.
DispatchResult handle_tools_call(const mcp_tools::ToolRegistry &registry, const json &request_id,
                                 const json &params) {
    std::string tool_name = requested_tool_name(params);
    const mcp_tools::ToolDefinition *tool = registry.find(tool_name);
    if (tool == nullptr) {
        return tool_not_found(request_id, tool_name);
    }

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    try {
        json reconciled = argument_reconciler::reconcile(tool->parameter_names(), arguments);
        json bound = mcp_tools::bind_arguments(*tool, reconciled);
        debug_log::log("tools/call " + tool_name + " " + bound.dump());
        return success(request_id, tool->handler(bound));
    } catch (const mcp_tools::ArgumentError &error) {
        json descriptor = mcp_tools::describe_tool(*tool);
        std::string message = "Invalid params: " + std::string(error.what()) + "; expected " +
                              descriptor["signature"].get<std::string>();
        return {kHttpBadRequest, json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                                bounded_message(message), descriptor)};
    } catch (const std::exception &error) {
        debug_log::log("Tool '" + tool_name + "' failed: " + error.what());
        return failure(kHttpInternalError, request_id, json_rpc::TOOL_ERROR,
                       bounded_message("Tool error: " + std::string(error.what())));
    } catch (...) {
        debug_log::log("Tool '" + tool_name + "' failed with a non-standard exception.");
        return failure(kHttpInternalError, request_id, json_rpc::TOOL_ERROR, "Tool error: unknown failure");
    }
}

} // namespace

DispatchResult dispatch_message(const mcp_tools::ToolRegistry &registry, const json &message) {
    json request_id = json_rpc::get_id(message);
    std::string method = json_rpc::get_method(message);

    if (!json_rpc::has_valid_version(message) || method.empty()) {
        return failure(kHttpBadRequest, request_id, json_rpc::INVALID_REQUEST, "Invalid Request");
    }

    json params = json_rpc::get_params(message);
    debug_log::log("Dispatching method: " + method);

    if (method == "tools/list") {
        return success(request_id, registry.list());
    }
    if (method == "tools/describe" || method == "tools/spec") {
        return handle_tools_describe(registry, request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(registry, request_id, params);
    }
    if (method == "initialize") {
        return handle_initialize(request_id);
    }
    if (method == "ping") {
        return success(request_id, json::object());
    }

    return failure(kHttpNotFound, request_id, json_rpc::METHOD_NOT_FOUND,
                   bounded_message("Method not found: " + method));
}

DispatchResult dispatch_body(const mcp_tools::ToolRegistry &registry, const std::string &body) {
    json message;
    try {
        message = json::parse(body);
    } catch (const json::parse_error &error) {
        debug_log::log("Failed to parse request body: " + std::string(error.what()));
        return failure(kHttpBadRequest, nullptr, json_rpc::PARSE_ERROR, "Parse error");
    }
    return dispatch_message(registry, message);
}

} // namespace mcp_dispatch
