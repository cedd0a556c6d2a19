#ifndef AIMCPS_ACCESS_GATE_HPP
#define AIMCPS_ACCESS_GATE_HPP

// Request-level access policy: bearer-token check for the protocol paths and
// CORS response headers for every path.

#include <string>
#include <utility>
#include <vector>

namespace access_gate {

// Paths under this prefix carry protocol traffic and are token-protected.
constexpr const char *PROTECTED_PREFIX = "/mcp";

// True when path starts with PROTECTED_PREFIX.
bool is_protected_path(const std::string &path);

// Decide whether a request may proceed. An empty expected_token means open
// mode: everything passes. Otherwise protected paths need an Authorization
// header equal to "Bearer <expected_token>".
bool authorize(const std::string &expected_token, const std::string &path,
               const std::string &authorization_header);

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// CORS headers for a response. allowed_origins containing "*" allows all;
// otherwise the request Origin is echoed only when it is listed.
HeaderList cors_headers(const std::vector<std::string> &allowed_origins, const std::string &request_origin);

} // namespace access_gate

#endif // AIMCPS_ACCESS_GATE_HPP
