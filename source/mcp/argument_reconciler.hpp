#ifndef AIMCPS_ARGUMENT_RECONCILER_HPP
#define AIMCPS_ARGUMENT_RECONCILER_HPP

// Argument name reconciliation for tools/call.
//
// Callers (usually language models) often send "path" where a tool declares
// "dir", or "cmd" where it declares "command". reconcile() renames such
// near-miss keys before the arguments are bound to the tool's parameters.
// Rules, in order:
//   1. Exactly one declared parameter and a supplied "path" that is not
//      declared: "path" becomes the declared name.
//   2. Sole declared parameter "command" and supplied "cmd" (no "command"):
//      "cmd" becomes "command". The reverse for a sole "cmd" parameter.
//   3. "dir" declared, "dir" not supplied, "path" supplied: "path" becomes "dir".
// A key renamed by one rule is not touched by a later one, and a rename never
// overwrites a key the caller already supplied.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace argument_reconciler {

using json = nlohmann::json;

// Returns an adjusted copy of supplied_arguments. Non-object input is
// returned unchanged; binding reports it as an argument-shape error later.
json reconcile(const std::vector<std::string> &declared_parameters, const json &supplied_arguments);

} // namespace argument_reconciler

#endif // AIMCPS_ARGUMENT_RECONCILER_HPP
