#ifndef AIMCPS_MCP_TOOLS_HPP
#define AIMCPS_MCP_TOOLS_HPP

// MCP tool registry: registration, lookup, description and argument binding.
//
// The registry is filled once at startup by the tool modules and is only read
// afterwards, so worker threads share it without locking.

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler: receives the bound arguments object, returns the result.
// Throwing ArgumentError reports a caller mistake, any other exception is a
// tool failure.
using ToolHandler = std::function<json(const json &arguments)>;

// Raised when arguments do not fit the tool's declared parameters.
class ArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raised by a tool whose own work failed (non-zero exit, timeout, I/O).
class ToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One declared parameter. No default value means the parameter is required.
// type is one of: string, integer, number, boolean, object, array, any.
struct ToolParameter {
    std::string name;
    std::string type = "any";
    std::optional<json> default_value;
    std::string description;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
    ToolHandler handler;

    // Declared parameter names, in declaration order.
    std::vector<std::string> parameter_names() const;
};

// Render a definition for tools/describe: name, description, parameters and
// a one-line signature such as fs_read(path: string, max_bytes: integer = 1048576).
json describe_tool(const ToolDefinition &definition);

// Only the signature line of describe_tool().
std::string format_signature(const ToolDefinition &definition);

// Check arguments against the declared parameters and fill in defaults.
// Throws ArgumentError for a non-object, unknown keys, missing required
// parameters or values of the wrong JSON type.
json bind_arguments(const ToolDefinition &definition, const json &arguments);

class ToolRegistry {
public:
    // Insert or replace the tool named definition.name (last registration wins).
    // Throws std::invalid_argument for an empty name or a missing handler.
    void register_tool(ToolDefinition definition);

    // Convenience form mirroring register(name, invocable, params, description).
    void register_tool(const std::string &name, ToolHandler handler,
                       std::vector<ToolParameter> parameters, const std::string &description);

    // Returns nullptr when no tool has this name.
    const ToolDefinition *find(const std::string &name) const;

    // Build the tools/list payload: {"tools": [{name, description}...]} ordered by name.
    json list() const;

    // Full descriptor, or nullopt when the tool does not exist.
    std::optional<json> describe(const std::string &name) const;

    std::size_t size() const { return tools_.size(); }

private:
    // Ordered by name so that listing is deterministic.
    std::map<std::string, ToolDefinition> tools_;
};

} // namespace mcp_tools

#endif // AIMCPS_MCP_TOOLS_HPP
