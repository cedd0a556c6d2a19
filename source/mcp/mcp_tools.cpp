#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace mcp_tools {

namespace {

const ToolParameter *find_parameter(const ToolDefinition &definition, const std::string &name) {
    for (const auto &parameter : definition.parameters) {
        if (parameter.name == name) {
            return &parameter;
        }
    }
    return nullptr;
}

// Returns true if value fits the declared type. Integral floats (3.0) are
// accepted for "integer" and normalized by the caller.
bool matches_type(const std::string &type, const json &value) {
    if (type == "any" || type.empty()) {
        return true;
    }
    if (type == "string") {
        return value.is_string();
    }
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            double number = value.get<double>();
            return std::isfinite(number) && std::floor(number) == number;
        }
        return false;
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "object") {
        return value.is_object();
    }
    if (type == "array") {
        return value.is_array();
    }
    return false;
}

// "integer" values must fit a signed 64-bit integer. The upper bound is
// exclusive for doubles because 2^63 itself is representable as a double.
bool fits_int64(const json &value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    if (value.is_number_float()) {
        double number = value.get<double>();
        return number >= -9223372036854775808.0 && number < 9223372036854775808.0;
    }
    return true;
}

} // namespace

std::vector<std::string> ToolDefinition::parameter_names() const {
    std::vector<std::string> names;
    names.reserve(parameters.size());
    for (const auto &parameter : parameters) {
        names.push_back(parameter.name);
    }
    return names;
}

std::string format_signature(const ToolDefinition &definition) {
    std::string signature = definition.name + "(";
    for (std::size_t index = 0; index < definition.parameters.size(); ++index) {
        const auto &parameter = definition.parameters[index];
        if (index > 0) {
            signature += ", ";
        }
        signature += parameter.name + ": " + parameter.type;
        if (parameter.default_value.has_value()) {
            signature += " = " + parameter.default_value->dump();
        }
    }
    signature += ")";
    return signature;
}

json describe_tool(const ToolDefinition &definition) {
    json parameters = json::array();
    for (const auto &parameter : definition.parameters) {
        json entry;
        entry["name"] = parameter.name;
        entry["type"] = parameter.type;
        entry["required"] = !parameter.default_value.has_value();
        if (parameter.default_value.has_value()) {
            entry["default"] = *parameter.default_value;
        }
        if (!parameter.description.empty()) {
            entry["description"] = parameter.description;
        }
        parameters.push_back(entry);
    }

    json descriptor;
    descriptor["name"] = definition.name;
    descriptor["description"] = definition.description;
    descriptor["parameters"] = parameters;
    descriptor["signature"] = format_signature(definition);
    return descriptor;
}

json bind_arguments(const ToolDefinition &definition, const json &arguments) {
    if (!arguments.is_object()) {
        throw ArgumentError("arguments must be an object, got " + std::string(arguments.type_name()));
    }

    for (const auto &item : arguments.items()) {
        if (find_parameter(definition, item.key()) == nullptr) {
            throw ArgumentError("unexpected parameter '" + item.key() + "'");
        }
    }

    json bound = json::object();
    for (const auto &parameter : definition.parameters) {
        auto supplied = arguments.find(parameter.name);
        bool absent = (supplied == arguments.end() || supplied->is_null());

        if (absent) {
            if (!parameter.default_value.has_value()) {
                throw ArgumentError("missing required parameter '" + parameter.name + "'");
            }
            bound[parameter.name] = *parameter.default_value;
            continue;
        }

        if (!matches_type(parameter.type, *supplied)) {
            throw ArgumentError("parameter '" + parameter.name + "' must be " + parameter.type + ", got " +
                                supplied->type_name());
        }

        if (parameter.type == "integer" && !fits_int64(*supplied)) {
            throw ArgumentError("parameter '" + parameter.name + "' is out of range for integer");
        }

        if (parameter.type == "integer" && supplied->is_number_float()) {
            bound[parameter.name] = static_cast<std::int64_t>(supplied->get<double>());
        } else {
            bound[parameter.name] = *supplied;
        }
    }
    return bound;
}

void ToolRegistry::register_tool(ToolDefinition definition) {
    if (definition.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!definition.handler) {
        throw std::invalid_argument("tool '" + definition.name + "' has no handler");
    }

    auto existing = tools_.find(definition.name);
    if (existing != tools_.end()) {
        debug_log::log("Tool '" + definition.name + "' registered again; replacing previous definition.");
        existing->second = std::move(definition);
        return;
    }
    std::string name = definition.name;
    tools_.emplace(std::move(name), std::move(definition));
}

void ToolRegistry::register_tool(const std::string &name, ToolHandler handler,
                                 std::vector<ToolParameter> parameters, const std::string &description) {
    ToolDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.parameters = std::move(parameters);
    definition.handler = std::move(handler);
    register_tool(std::move(definition));
}

const ToolDefinition *ToolRegistry::find(const std::string &name) const {
    auto iterator = tools_.find(name);
    if (iterator == tools_.end()) {
        return nullptr;
    }
    return &iterator->second;
}

json ToolRegistry::list() const {
    json tools_array = json::array();
    for (const auto &entry : tools_) {
        json tool_entry;
        tool_entry["name"] = entry.second.name;
        tool_entry["description"] = entry.second.description;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

std::optional<json> ToolRegistry::describe(const std::string &name) const {
    const ToolDefinition *definition = find(name);
    if (definition == nullptr) {
        return std::nullopt;
    }
    return describe_tool(*definition);
}

} // namespace mcp_tools
