#include "http/http_server.hpp"
#include "http/access_gate.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <exception>
#include <string>

namespace http_server {

namespace {

// Per-connection data allocated (and zeroed) by libwebsockets.
struct SessionData {
    std::uint64_t exchange_id;
};

int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                  void *session, void *incoming, size_t length) {
    auto *server = static_cast<HttpServer *>(lws_context_user(lws_get_context(connection)));
    if (server == nullptr) {
        return lws_callback_http_dummy(connection, reason, session, incoming, length);
    }
    return server->handle_callback(connection, static_cast<int>(reason), session, incoming, length);
}

const struct lws_protocols http_protocols[] = {
    {
        "http",
        http_callback,
        sizeof(SessionData), // per-session data size
        0                    // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

std::string read_header(struct lws *connection, enum lws_token_indexes token) {
    int length = lws_hdr_total_length(connection, token);
    if (length <= 0) {
        return "";
    }
    std::vector<char> buffer(static_cast<std::size_t>(length) + 1, '\0');
    int copied = lws_hdr_copy(connection, buffer.data(), length + 1, token);
    if (copied < 0) {
        return "";
    }
    return std::string(buffer.data(), static_cast<std::size_t>(copied));
}

std::string request_method(struct lws *connection) {
    if (lws_hdr_total_length(connection, WSI_TOKEN_POST_URI) > 0) {
        return "POST";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_GET_URI) > 0) {
        return "GET";
    }
#if defined(LWS_WITH_HTTP_UNCOMMON_HEADERS) || defined(LWS_HTTP_HEADERS_ALL)
    if (lws_hdr_total_length(connection, WSI_TOKEN_OPTIONS_URI) > 0) {
        return "OPTIONS";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_PUT_URI) > 0) {
        return "PUT";
    }
    if (lws_hdr_total_length(connection, WSI_TOKEN_DELETE_URI) > 0) {
        return "DELETE";
    }
#endif
    return "UNKNOWN";
}

// lws expects lowercase header names with the trailing colon.
std::string header_token(const std::string &name) {
    std::string token = name;
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return token + ":";
}

} // namespace

HttpServer::HttpServer(const server_config::ServerConfig &config, const mcp_tools::ToolRegistry &registry)
    : config_(config), route_context_{config, registry} {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = config_.port;
    context_info.iface = config_.bind_address.empty() ? nullptr : config_.bind_address.c_str();
    context_info.protocols = http_protocols;
    context_info.user = this;
    context_info.gid = -1;
    context_info.uid = -1;

    context_ = lws_create_context(&context_info);
    if (context_ == nullptr) {
        debug_log::warn("Failed to create libwebsockets context on port " + std::to_string(config_.port) + ".");
        return false;
    }

    workers_ = std::make_unique<WorkerPool>(config_.worker_threads,
                                            std::max(config_.worker_threads, config_.max_worker_threads));
    debug_log::info("HTTP on :" + std::to_string(config_.port) + " (paths /mcp, /mcp/rpc, /health, /)");
    return true;
}

void HttpServer::run(const volatile std::sig_atomic_t &stop_requested) {
    while (stop_requested == 0 && context_ != nullptr) {
        if (lws_service(context_, 0) < 0) {
            debug_log::warn("lws_service failed; leaving event loop.");
            break;
        }
    }
}

void HttpServer::stop() {
    // Workers may still call lws_cancel_service(), so they go first.
    if (workers_) {
        workers_->stop();
        workers_.reset();
    }
    if (context_ != nullptr) {
        lws_context_destroy(context_);
        context_ = nullptr;
        debug_log::log("stop(): libwebsockets context destroyed.");
    }
    exchanges_.clear();
}

int HttpServer::handle_callback(struct lws *connection, int reason, void *session, void *incoming,
                                std::size_t length) {
    auto *session_data = static_cast<SessionData *>(session);

    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_HTTP:
        return on_request(connection, session_data->exchange_id, static_cast<const char *>(incoming));

    case LWS_CALLBACK_HTTP_BODY:
        return on_body(session_data->exchange_id, static_cast<const char *>(incoming), length);

    case LWS_CALLBACK_HTTP_BODY_COMPLETION:
        return on_body_complete(session_data->exchange_id);

    case LWS_CALLBACK_HTTP_WRITEABLE:
        return on_writeable(connection, session_data->exchange_id);

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        on_wakeup();
        return 0;

    case LWS_CALLBACK_CLOSED_HTTP:
        if (session_data != nullptr) {
            on_closed(session_data->exchange_id);
        }
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, static_cast<enum lws_callback_reasons>(reason), session, incoming,
                                   length);
}

int HttpServer::on_request(struct lws *connection, std::uint64_t &exchange_id, const char *uri) {
    // A keep-alive connection starts a new exchange; drop whatever was left.
    on_closed(exchange_id);

    exchange_id = next_exchange_id_++;
    Exchange &exchange = exchanges_[exchange_id];
    exchange.connection = connection;
    exchange.request.method = request_method(connection);
    exchange.request.path = uri != nullptr ? uri : "/";
    exchange.request.authorization = read_header(connection, WSI_TOKEN_HTTP_AUTHORIZATION);
    exchange.request.origin = read_header(connection, WSI_TOKEN_ORIGIN);

    debug_log::log(exchange.request.method + " " + exchange.request.path);

    if (exchange.request.method != "POST") {
        dispatch(exchange_id);
        return 0;
    }

    std::string content_length = read_header(connection, WSI_TOKEN_HTTP_CONTENT_LENGTH);
    if (!content_length.empty()) {
        unsigned long long declared = 0;
        try {
            declared = std::stoull(content_length);
        } catch (const std::exception &) {
            respond_now(exchange_id, http_routes::make_error_response(400, "bad content-length"), true);
            return 0;
        }
        if (declared > config_.max_body_bytes) {
            respond_now(exchange_id, http_routes::make_error_response(413, "request body too large"), true);
            return 0;
        }
        if (declared == 0) {
            dispatch(exchange_id);
        }
    }

    // Otherwise wait for LWS_CALLBACK_HTTP_BODY / _BODY_COMPLETION.
    return 0;
}

int HttpServer::on_body(std::uint64_t exchange_id, const char *data, std::size_t length) {
    auto iterator = exchanges_.find(exchange_id);
    if (iterator == exchanges_.end() || iterator->second.dispatched) {
        return 0;
    }

    std::string &body = iterator->second.request.body;
    if (body.size() + length > config_.max_body_bytes) {
        respond_now(exchange_id, http_routes::make_error_response(413, "request body too large"), true);
        return 0;
    }
    body.append(data, length);
    return 0;
}

int HttpServer::on_body_complete(std::uint64_t exchange_id) {
    auto iterator = exchanges_.find(exchange_id);
    if (iterator != exchanges_.end() && !iterator->second.dispatched) {
        dispatch(exchange_id);
    }
    return 0;
}

void HttpServer::dispatch(std::uint64_t exchange_id) {
    Exchange &exchange = exchanges_.at(exchange_id);
    exchange.dispatched = true;

    if (!http_routes::may_block(exchange.request)) {
        deliver(exchange_id, http_routes::route_request(route_context_, exchange.request), false);
        return;
    }

    http_routes::HttpRequest request = exchange.request;
    bool queued = workers_ && workers_->submit([this, exchange_id, request]() {
        http_routes::HttpResponse response = http_routes::route_request(route_context_, request);
        {
            std::lock_guard<std::mutex> lock(completed_mutex_);
            completed_.emplace_back(exchange_id, std::move(response));
        }
        lws_cancel_service(context_);
    });

    if (!queued) {
        respond_now(exchange_id, http_routes::make_error_response(503, "shutting down"), true);
    }
}

void HttpServer::respond_now(std::uint64_t exchange_id, http_routes::HttpResponse response, bool close_after) {
    auto iterator = exchanges_.find(exchange_id);
    if (iterator == exchanges_.end()) {
        return;
    }
    access_gate::HeaderList cors =
        access_gate::cors_headers(config_.allowed_origins, iterator->second.request.origin);
    response.headers.insert(response.headers.end(), cors.begin(), cors.end());
    deliver(exchange_id, std::move(response), close_after);
}

void HttpServer::deliver(std::uint64_t exchange_id, http_routes::HttpResponse response, bool close_after) {
    auto iterator = exchanges_.find(exchange_id);
    if (iterator == exchanges_.end()) {
        return;
    }
    Exchange &exchange = iterator->second;
    exchange.dispatched = true;
    exchange.response = std::move(response);
    exchange.response_ready = true;
    exchange.close_after_response = close_after;
    lws_callback_on_writable(exchange.connection);
}

void HttpServer::on_wakeup() {
    std::vector<std::pair<std::uint64_t, http_routes::HttpResponse>> ready;
    {
        std::lock_guard<std::mutex> lock(completed_mutex_);
        ready.swap(completed_);
    }

    for (auto &item : ready) {
        auto iterator = exchanges_.find(item.first);
        if (iterator == exchanges_.end()) {
            // The client went away while the request was running.
            debug_log::log("Dropping response for closed exchange " + std::to_string(item.first));
            continue;
        }
        iterator->second.response = std::move(item.second);
        iterator->second.response_ready = true;
        lws_callback_on_writable(iterator->second.connection);
    }
}

int HttpServer::on_writeable(struct lws *connection, std::uint64_t exchange_id) {
    auto iterator = exchanges_.find(exchange_id);
    if (iterator == exchanges_.end() || !iterator->second.response_ready) {
        return 0;
    }
    Exchange &exchange = iterator->second;
    const http_routes::HttpResponse &response = exchange.response;

    if (!exchange.headers_sent) {
        unsigned char header_buffer[LWS_PRE + 2048];
        unsigned char *start = &header_buffer[LWS_PRE];
        unsigned char *position = start;
        unsigned char *end = &header_buffer[sizeof(header_buffer) - 1];

        if (lws_add_http_common_headers(connection, static_cast<unsigned int>(response.status),
                                        response.content_type.c_str(), response.body.size(), &position, end)) {
            return 1;
        }
        for (const auto &header : response.headers) {
            std::string name = header_token(header.first);
            if (lws_add_http_header_by_name(connection, reinterpret_cast<const unsigned char *>(name.c_str()),
                                            reinterpret_cast<const unsigned char *>(header.second.c_str()),
                                            static_cast<int>(header.second.size()), &position, end)) {
                return 1;
            }
        }
        if (lws_finalize_write_http_header(connection, start, &position, end)) {
            return 1;
        }
        exchange.headers_sent = true;

        if (!response.body.empty()) {
            lws_callback_on_writable(connection);
            return 0;
        }
    } else {
        // libwebsockets needs LWS_PRE bytes of headroom before the payload.
        std::vector<unsigned char> body_buffer(LWS_PRE + response.body.size());
        memcpy(body_buffer.data() + LWS_PRE, response.body.data(), response.body.size());
        int written = lws_write(connection, body_buffer.data() + LWS_PRE, response.body.size(),
                                LWS_WRITE_HTTP_FINAL);
        if (written < 0) {
            debug_log::log("lws_write failed for exchange " + std::to_string(exchange_id));
            return -1;
        }
    }

    bool close_after = exchange.close_after_response;
    exchanges_.erase(iterator);

    if (close_after) {
        return -1;
    }
    if (lws_http_transaction_completed(connection)) {
        return -1;
    }
    return 0;
}

void HttpServer::on_closed(std::uint64_t exchange_id) {
    if (exchange_id != 0) {
        exchanges_.erase(exchange_id);
    }
}

} // namespace http_server
