#include "mcp/argument_reconciler.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <set>

namespace argument_reconciler {

static bool is_declared(const std::vector<std::string> &declared_parameters, const std::string &name) {
    return std::find(declared_parameters.begin(), declared_parameters.end(), name) != declared_parameters.end();
}

// Move arguments[from] to arguments[to]. Refuses to clobber an existing key
// or to touch a key produced by an earlier rule.
static bool rename_key(json &arguments, const std::string &from, const std::string &to,
                       std::set<std::string> &renamed_keys) {
    if (from == to || !arguments.contains(from) || arguments.contains(to)) {
        return false;
    }
    if (renamed_keys.count(from) != 0 || renamed_keys.count(to) != 0) {
        return false;
    }

    arguments[to] = std::move(arguments[from]);
    arguments.erase(from);
    renamed_keys.insert(to);
    debug_log::log("Reconciled argument '" + from + "' -> '" + to + "'");
    return true;
}

json reconcile(const std::vector<std::string> &declared_parameters, const json &supplied_arguments) {
    if (!supplied_arguments.is_object()) {
        return supplied_arguments;
    }

    json arguments = supplied_arguments;
    std::set<std::string> renamed_keys;

    // Rule 1: single-parameter tools accept "path" for whatever they call it.
    if (declared_parameters.size() == 1 && !is_declared(declared_parameters, "path")) {
        rename_key(arguments, "path", declared_parameters.front(), renamed_keys);
    }

    // Rule 2: "cmd" and "command" are interchangeable for single-parameter tools.
    if (declared_parameters.size() == 1) {
        const std::string &sole_parameter = declared_parameters.front();
        if (sole_parameter == "command") {
            rename_key(arguments, "cmd", "command", renamed_keys);
        } else if (sole_parameter == "cmd") {
            rename_key(arguments, "command", "cmd", renamed_keys);
        }
    }

    // Rule 3: directory-taking tools accept "path" for "dir".
    if (is_declared(declared_parameters, "dir")) {
        rename_key(arguments, "path", "dir", renamed_keys);
    }

    return arguments;
}

} // namespace argument_reconciler
