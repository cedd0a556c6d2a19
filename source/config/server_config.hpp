#ifndef AIMCPS_SERVER_CONFIG_HPP
#define AIMCPS_SERVER_CONFIG_HPP

// Process configuration, read once from the environment at startup and then
// passed by const reference into the HTTP layer.

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace server_config {

struct ServerConfig {
    // Expected bearer token; empty disables authorization.
    std::string access_token;
    // CORS allow-list; a single "*" allows any origin.
    std::vector<std::string> allowed_origins{"*"};
    int port = 9999;
    // Interface to bind; empty binds all interfaces.
    std::string bind_address;
    // Tool calls start on worker_threads threads; the pool grows up to
    // max_worker_threads while all of them are busy.
    int worker_threads = 4;
    int max_worker_threads = 64;
    std::size_t max_body_bytes = 1024 * 1024;
};

// Returns the value of a variable, or nullopt when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &name)>;

// Build a config from an arbitrary lookup. Throws std::runtime_error naming
// the variable when a numeric value is malformed or out of range.
ServerConfig load(const EnvironmentLookup &lookup);

// load() over the process environment.
ServerConfig load_from_environment();

// Split a comma-separated origin list; entries are trimmed, empty ones dropped.
std::vector<std::string> parse_origin_list(const std::string &value);

// One-line summary for the startup log. Never prints the token itself.
std::string describe(const ServerConfig &config);

} // namespace server_config

#endif // AIMCPS_SERVER_CONFIG_HPP
