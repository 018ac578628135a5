#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/network/http_parser.hpp"
#include "chunked/network/http_router.hpp"
#include "chunked/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>

namespace chunked {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct ServerOptions {
    std::size_t worker_threads = 4;
    /// Largest body buffered for ordinary routes; streamed routes enforce their own limit
    std::uint64_t max_body_bytes = 64 * 1024;
    /// Bound on receiving one request, head and body
    std::chrono::milliseconds request_timeout{120000};
};

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * One request per connection; the response always carries
 * `Connection: close`.
 *
 * Lifecycle:
 * 1. start() arms the request timer and begins reading the head
 * 2. On a streamed route the body goes straight into the route's BodySink;
 *    otherwise it is buffered and the router runs on the worker pool
 * 3. While the handler runs the connection keeps one read pending; if the
 *    peer goes away the request's CancellationToken is tripped
 * 4. The response is written and the socket shut down
 *
 * All socket work runs on the connection's strand (the socket's executor).
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket,
                   const HttpRouter& router,
                   asio::thread_pool& workers,
                   const ServerOptions& options);

    void start();

private:
    enum class Phase {
        Head,       // reading request line and headers
        Buffering,  // reading a body into the request
        Streaming,  // feeding a body to a sink
        Draining,   // discarding a body we already answered
        Handling,   // handler running on the worker pool
        Writing,
        Closed
    };

    void do_read();
    void on_data(const char* data, std::size_t size);
    void on_headers(const char* data, std::size_t size);
    void feed_stream(const char* data, std::size_t size);
    void feed_drain(std::size_t size);
    void dispatch();
    void watch_peer();

    /// Answer without reading the rest of the body first
    void reject(HttpResponse response);
    /// Answer once the rest of the body has been read and discarded
    void respond_after_body(HttpResponse response, std::size_t buffered);

    void do_write(HttpResponse response);
    void on_timeout();
    void close();

    tcp::socket socket_;
    const HttpRouter& router_;
    asio::thread_pool& workers_;
    ServerOptions options_;

    HttpParser parser_;
    std::array<char, 64 * 1024> buffer_;
    asio::steady_timer timer_;

    Phase phase_ = Phase::Head;
    std::shared_ptr<CancellationToken> cancel_;
    std::unique_ptr<BodySink> sink_;
    std::uint64_t body_remaining_ = 0;
    HttpResponse pending_response_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Accepts on the io_context's threads, gives every connection its own
 * strand and runs buffered-route handlers on a private thread pool so a
 * long merge never stalls socket I/O.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpRouter router;
 * register_upload_routes(router, service);
 * HttpServerAsio server(io_context, 8080, router);
 * io_context.run();
 * ```
 *
 * Port 0 binds an ephemeral port; get_port() reports the real one.
 * The router must outlive the server.
 */
class HttpServerAsio {
public:
    HttpServerAsio(asio::io_context& io_context,
                   uint16_t port,
                   const HttpRouter& router,
                   ServerOptions options = {});
    ~HttpServerAsio();

    HttpServerAsio(const HttpServerAsio&) = delete;
    HttpServerAsio& operator=(const HttpServerAsio&) = delete;

    uint16_t get_port() const { return port_; }

    /**
     * @brief Stop accepting and wait for running handlers to return
     *
     * Call from an io_context thread or after the io_context has stopped.
     */
    void stop();

private:
    void do_accept();

    asio::io_context& io_context_;
    tcp::acceptor acceptor_;
    const HttpRouter& router_;
    ServerOptions options_;
    asio::thread_pool workers_;
    uint16_t port_;
    bool stopped_ = false;
};

} // namespace network
} // namespace chunked
