#ifndef AIMCPS_DEBUG_LOG_HPP
#define AIMCPS_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if AIMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [aimcps] prefix only when is_debug_enabled().
void log(const std::string &message);

// Always written to stderr with the [aimcps] prefix.
void info(const std::string &message);

// Always written to stderr as "[aimcps] warning: ...".
void warn(const std::string &message);

} // namespace debug_log

#endif // AIMCPS_DEBUG_LOG_HPP
