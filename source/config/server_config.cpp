#include "config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace server_config {

namespace {

std::string trim(const std::string &value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char character) { return std::isspace(character) != 0; });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char character) { return std::isspace(character) != 0; }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

// Parses a whole-string integer in [minimum, maximum].
long long parse_bounded(const std::string &name, const std::string &value, long long minimum, long long maximum) {
    std::string text = trim(value);
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(text, &consumed);
    } catch (const std::exception &) {
        throw std::runtime_error(name + " must be an integer, got '" + value + "'");
    }
    if (consumed != text.size()) {
        throw std::runtime_error(name + " must be an integer, got '" + value + "'");
    }
    if (parsed < minimum || parsed > maximum) {
        throw std::runtime_error(name + " must be in range " + std::to_string(minimum) + ".." +
                                 std::to_string(maximum));
    }
    return parsed;
}

// Unset and blank variables both mean "use the default".
bool has_text(const std::optional<std::string> &value) {
    return value.has_value() && !trim(*value).empty();
}

} // namespace

std::vector<std::string> parse_origin_list(const std::string &value) {
    std::vector<std::string> origins;
    std::stringstream stream(value);
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        entry = trim(entry);
        if (!entry.empty()) {
            origins.push_back(entry);
        }
    }
    return origins;
}

ServerConfig load(const EnvironmentLookup &lookup) {
    ServerConfig config;

    if (auto token = lookup("AIASSIST_MCP_TOKEN")) {
        config.access_token = *token;
    }

    if (auto origins = lookup("AIASSIST_MCP_ALLOWED_ORIGINS")) {
        auto parsed = parse_origin_list(*origins);
        if (!parsed.empty()) {
            config.allowed_origins = parsed;
        }
    }

    auto port = lookup("PORT");
    if (has_text(port)) {
        config.port = static_cast<int>(parse_bounded("PORT", *port, 1, 65535));
    }

    if (auto bind_address = lookup("AIMCPS_BIND_ADDRESS")) {
        config.bind_address = trim(*bind_address);
    }

    auto workers = lookup("AIMCPS_WORKERS");
    if (has_text(workers)) {
        config.worker_threads = static_cast<int>(parse_bounded("AIMCPS_WORKERS", *workers, 1, 256));
    }

    auto max_workers = lookup("AIMCPS_MAX_WORKERS");
    if (has_text(max_workers)) {
        config.max_worker_threads = static_cast<int>(parse_bounded("AIMCPS_MAX_WORKERS", *max_workers, 1, 1024));
    }

    auto max_body = lookup("AIMCPS_MAX_BODY_BYTES");
    if (has_text(max_body)) {
        config.max_body_bytes =
            static_cast<std::size_t>(parse_bounded("AIMCPS_MAX_BODY_BYTES", *max_body, 1, 256LL * 1024 * 1024));
    }

    return config;
}

ServerConfig load_from_environment() {
    return load([](const std::string &name) -> std::optional<std::string> {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

std::string describe(const ServerConfig &config) {
    std::ostringstream output;
    output << "port=" << config.port
           << " | bind=" << (config.bind_address.empty() ? "*" : config.bind_address)
           << " | token=" << (config.access_token.empty() ? "unset (open mode)" : "set")
           << " | workers=" << config.worker_threads << ".." << std::max(config.worker_threads, config.max_worker_threads)
           << " | max_body_bytes=" << config.max_body_bytes
           << " | allowed_origins=";
    for (std::size_t index = 0; index < config.allowed_origins.size(); ++index) {
        if (index > 0) {
            output << ',';
        }
        output << config.allowed_origins[index];
    }
    return output.str();
}

} // namespace server_config
