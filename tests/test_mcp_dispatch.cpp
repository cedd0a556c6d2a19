// Tests for JSON-RPC dispatch: error codes, HTTP statuses and tool routing.
// Uses an in-memory registry with small handlers; no network involved.

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace test_mcp_dispatch {

static mcp_tools::ToolRegistry make_registry() {
    mcp_tools::ToolRegistry registry;
    registry.register_tool(
        "echo_dir", [](const json &arguments) { return json{{"dir", arguments.at("dir")}}; },
        {{"dir", "string", std::nullopt, ""}, {"glob", "string", json("*"), ""}}, "Echo the directory.");
    registry.register_tool(
        "explode", [](const json &) -> json { throw std::runtime_error("disk on fire"); }, {}, "Always fails.");
    registry.register_tool(
        "big_error", [](const json &) -> json { throw std::runtime_error(std::string(50000, 'x')); }, {},
        "Fails with a long message.");
    registry.register_tool(
        "wait_for", [](const json &arguments) { return json{{"seconds", arguments.at("seconds")}}; },
        {{"seconds", "integer", json(30), ""}}, "Echo a timeout.");
    return registry;
}

static json request(const std::string &method, const json &params, const json &id = 1) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

static bool check(const std::string &label, bool success, const mcp_dispatch::DispatchResult &result) {
    if (success) {
        std::cout << "  OK: " << label << std::endl;
    } else {
        std::cout << "  FAIL: " << label << " (status " << result.http_status << ", " << result.response.dump()
                  << ")" << std::endl;
    }
    return success;
}

// Test: unparseable body.
static bool test_parse_error() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_body(registry, "{not json");
    return check("Unparseable body gives -32700/400 with null id",
                 result.http_status == 400 && result.response["error"]["code"] == -32700 &&
                     result.response["id"].is_null(),
                 result);
}

// Test: wrong protocol version.
static bool test_invalid_version() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_body(registry, R"({"jsonrpc": "1.0", "id": 9, "method": "tools/list"})");
    return check("jsonrpc 1.0 gives -32600/400",
                 result.http_status == 400 && result.response["error"]["code"] == -32600 && result.response["id"] == 9,
                 result);
}

// Test: valid JSON that is not a request object.
static bool test_non_object_body() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_body(registry, "[1, 2, 3]");
    return check("Array body gives -32600/400",
                 result.http_status == 400 && result.response["error"]["code"] == -32600, result);
}

// Test: tools/list returns names and descriptions, id echoed verbatim.
static bool test_tools_list() {
    auto registry = make_registry();
    json id = {{"trace", "abc"}};
    auto result = mcp_dispatch::dispatch_message(registry, request("tools/list", json::object(), id));
    json tools = result.response["result"]["tools"];
    return check("tools/list succeeds and echoes an object id",
                 result.http_status == 200 && result.response["id"] == id && tools.size() == 4 &&
                     tools[0]["name"] == "big_error",
                 result);
}

// Test: describe and its alias behave the same.
static bool test_describe_and_alias() {
    auto registry = make_registry();
    auto described = mcp_dispatch::dispatch_message(registry, request("tools/describe", {{"name", "echo_dir"}}));
    auto aliased = mcp_dispatch::dispatch_message(registry, request("tools/spec", {{"name", "echo_dir"}}));
    auto missing = mcp_dispatch::dispatch_message(registry, request("tools/spec", {{"name", "nope"}}));

    bool success = described.http_status == 200 && described.response == aliased.response &&
                   described.response["result"]["name"] == "echo_dir" && missing.http_status == 404 &&
                   missing.response["error"]["code"] == -32601 &&
                   missing.response["error"]["message"] == "Tool not found: nope";
    return check("tools/describe and tools/spec agree; unknown tool is -32601/404", success, missing);
}

// Test: tools/call applies reconciliation and returns the handler value.
static bool test_call_success() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_message(
        registry, request("tools/call", {{"name", "echo_dir"}, {"arguments", {{"path", "/tmp"}}}}));
    return check("tools/call reconciles 'path' to 'dir'",
                 result.http_status == 200 && result.response["result"]["dir"] == "/tmp", result);
}

// Test: missing required parameter.
static bool test_call_invalid_params() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_message(registry, request("tools/call", {{"name", "echo_dir"}}));
    std::string message = result.response["error"].value("message", "");
    bool success = result.http_status == 400 && result.response["error"]["code"] == -32602 &&
                   message.find("dir") != std::string::npos && message.find("glob") != std::string::npos &&
                   result.response["error"]["data"]["name"] == "echo_dir";
    return check("Missing parameter gives -32602/400 naming the parameters", success, result);
}

// Test: an integer outside the int64 range is a caller error.
static bool test_call_integer_out_of_range() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_body(
        registry, R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"wait_for","arguments":{"seconds":1e30}}})");
    std::string message = result.response["error"].value("message", "");
    bool success = result.http_status == 400 && result.response["error"]["code"] == -32602 &&
                   message.find("out of range") != std::string::npos;
    return check("Integer argument 1e30 gives -32602/400", success, result);
}

// Test: the tool throws.
static bool test_call_tool_error() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_message(registry, request("tools/call", {{"name", "explode"}}));
    std::string message = result.response["error"].value("message", "");
    bool success = result.http_status == 500 && result.response["error"]["code"] == -32000 &&
                   message.find("disk on fire") != std::string::npos;
    return check("Tool exception gives -32000/500 with its message", success, result);
}

// Test: long tool errors are capped.
static bool test_call_tool_error_truncated() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_message(registry, request("tools/call", {{"name", "big_error"}}));
    std::string message = result.response["error"].value("message", "");
    return check("Tool error message is capped",
                 result.http_status == 500 && message.size() <= mcp_dispatch::kMaxErrorMessageBytes, result);
}

// Test: calling an unknown tool.
static bool test_call_unknown_tool() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_message(registry, request("tools/call", {{"name", "ghost"}}));
    return check("Unknown tool in tools/call gives -32601/404",
                 result.http_status == 404 && result.response["error"]["code"] == -32601, result);
}

// Test: unknown method.
static bool test_unknown_method() {
    auto registry = make_registry();
    auto result = mcp_dispatch::dispatch_message(registry, request("resources/list", json::object()));
    return check("Unknown method gives -32601/404",
                 result.http_status == 404 &&
                     result.response["error"]["message"] == "Method not found: resources/list",
                 result);
}

// Test: initialize and ping.
static bool test_initialize_and_ping() {
    auto registry = make_registry();
    auto initialized = mcp_dispatch::dispatch_message(registry, request("initialize", json::object()));
    auto pinged = mcp_dispatch::dispatch_message(registry, request("ping", json::object(), "p"));
    bool success = initialized.response["result"]["serverInfo"]["name"] == mcp_dispatch::SERVER_NAME &&
                   initialized.response["result"]["protocolVersion"] == mcp_dispatch::PROTOCOL_VERSION &&
                   pinged.response["result"] == json::object() && pinged.response["id"] == "p";
    return check("initialize and ping answer", success, initialized);
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_error();
    all_passed &= test_invalid_version();
    all_passed &= test_non_object_body();
    all_passed &= test_tools_list();
    all_passed &= test_describe_and_alias();
    all_passed &= test_call_success();
    all_passed &= test_call_invalid_params();
    all_passed &= test_call_integer_out_of_range();
    all_passed &= test_call_tool_error();
    all_passed &= test_call_tool_error_truncated();
    all_passed &= test_call_unknown_tool();
    all_passed &= test_unknown_method();
    all_passed &= test_initialize_and_ping();
    return all_passed;
}

} // namespace test_mcp_dispatch
