#ifndef AIMCPS_JSON_RPC_HPP
#define AIMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelope helpers.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *VERSION = "2.0";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
// Server-defined: the tool itself failed.
constexpr int TOOL_ERROR = -32000;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data);

// True when message carries "jsonrpc": "2.0".
bool has_valid_version(const json &message);

// Extract method name from a request. Returns empty if missing or not a string.
std::string get_method(const json &message);

// Extract the id verbatim. Returns null json if missing.
json get_id(const json &message);

// Extract params. Returns empty object if missing or not an object.
json get_params(const json &message);

} // namespace json_rpc

#endif // AIMCPS_JSON_RPC_HPP
