#include "http/access_gate.hpp"

#include <algorithm>

namespace access_gate {

// Compares without an early exit so that timing does not reveal how much of
// the token matched.
static bool constant_time_equals(const std::string &left, const std::string &right) {
    unsigned char difference = left.size() == right.size() ? 0 : 1;
    for (std::size_t index = 0; index < left.size(); ++index) {
        unsigned char other = index < right.size() ? static_cast<unsigned char>(right[index]) : 0;
        difference |= static_cast<unsigned char>(static_cast<unsigned char>(left[index]) ^ other);
    }
    return difference == 0;
}

bool is_protected_path(const std::string &path) {
    return path.compare(0, std::char_traits<char>::length(PROTECTED_PREFIX), PROTECTED_PREFIX) == 0;
}

bool authorize(const std::string &expected_token, const std::string &path,
               const std::string &authorization_header) {
    if (expected_token.empty() || !is_protected_path(path)) {
        return true;
    }
    return constant_time_equals(authorization_header, "Bearer " + expected_token);
}

HeaderList cors_headers(const std::vector<std::string> &allowed_origins, const std::string &request_origin) {
    HeaderList headers;

    bool allow_any = std::find(allowed_origins.begin(), allowed_origins.end(), "*") != allowed_origins.end();
    if (allow_any) {
        headers.emplace_back("Access-Control-Allow-Origin", "*");
    } else if (!request_origin.empty() &&
               std::find(allowed_origins.begin(), allowed_origins.end(), request_origin) != allowed_origins.end()) {
        headers.emplace_back("Access-Control-Allow-Origin", request_origin);
        headers.emplace_back("Vary", "Origin");
    }

    headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    headers.emplace_back("Access-Control-Allow-Headers", "Authorization, Content-Type");
    return headers;
}

} // namespace access_gate
