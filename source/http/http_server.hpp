#ifndef AIMCPS_HTTP_SERVER_HPP
#define AIMCPS_HTTP_SERVER_HPP

// HTTP/1.1 front end on libwebsockets.
//
// The lws event loop runs on the calling thread. Requests that cannot block
// (health, listing, describe, errors) are routed right there. A tools/call is
// handed to the worker pool, which runs http_routes::route_request(); the
// finished response is queued and the loop is woken with lws_cancel_service().

#include <csignal>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "config/server_config.hpp"
#include "http/http_routes.hpp"
#include "http/worker_pool.hpp"
#include "mcp/mcp_tools.hpp"

struct lws;
struct lws_context;

namespace http_server {

class HttpServer {
public:
    HttpServer(const server_config::ServerConfig &config, const mcp_tools::ToolRegistry &registry);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    // Create the lws context and start listening. Returns false on failure.
    bool start();

    // Service the event loop until stop_requested becomes non-zero.
    void run(const volatile std::sig_atomic_t &stop_requested);

    // Drain the worker pool and destroy the context.
    void stop();

    // Entry point for the lws protocol callback; not for other callers.
    int handle_callback(struct lws *connection, int reason, void *session, void *incoming, std::size_t length);

private:
    // One request/response cycle on a connection.
    struct Exchange {
        struct lws *connection = nullptr;
        http_routes::HttpRequest request;
        http_routes::HttpResponse response;
        bool dispatched = false;
        bool response_ready = false;
        bool headers_sent = false;
        bool close_after_response = false;
    };

    int on_request(struct lws *connection, std::uint64_t &exchange_id, const char *uri);
    int on_body(std::uint64_t exchange_id, const char *data, std::size_t length);
    int on_body_complete(std::uint64_t exchange_id);
    int on_writeable(struct lws *connection, std::uint64_t exchange_id);
    void on_wakeup();
    void on_closed(std::uint64_t exchange_id);

    // Route the request inline, or queue it on the worker pool if it may block.
    void dispatch(std::uint64_t exchange_id);
    // Answer a request that never reached the router (413 and similar).
    void respond_now(std::uint64_t exchange_id, http_routes::HttpResponse response, bool close_after);
    // Store a finished response and ask for a writeable callback.
    void deliver(std::uint64_t exchange_id, http_routes::HttpResponse response, bool close_after);

    const server_config::ServerConfig &config_;
    http_routes::RouteContext route_context_;

    struct lws_context *context_ = nullptr;
    std::unique_ptr<WorkerPool> workers_;

    // Event-loop thread only.
    std::map<std::uint64_t, Exchange> exchanges_;
    std::uint64_t next_exchange_id_ = 1;

    // Filled by workers, drained by the event loop.
    std::mutex completed_mutex_;
    std::vector<std::pair<std::uint64_t, http_routes::HttpResponse>> completed_;
};

} // namespace http_server

#endif // AIMCPS_HTTP_SERVER_HPP
