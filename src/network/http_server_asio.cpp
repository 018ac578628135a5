#include "chunked/network/http_server_asio.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunked {
namespace network {

namespace {

HttpResponse plain_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    return response;
}

} // namespace

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket,
                               const HttpRouter& router,
                               asio::thread_pool& workers,
                               const ServerOptions& options)
    : socket_(std::move(socket))
    , router_(router)
    , workers_(workers)
    , options_(options)
    , parser_()
    , timer_(socket_.get_executor())
    , cancel_(std::make_shared<CancellationToken>()) {
}

void HttpConnection::start() {
    auto self = shared_from_this();

    timer_.expires_after(options_.request_timeout);
    timer_.async_wait([this, self](boost::system::error_code ec) {
        if (!ec) {
            on_timeout();
        }
    });

    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (phase_ == Phase::Closed) {
                return;
            }
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                if (sink_) {
                    sink_->abort("connection lost: " + ec.message());
                    sink_.reset();
                }
                cancel_->cancel();
                close();
                return;
            }
            on_data(buffer_.data(), bytes_transferred);
        }
    );
}

void HttpConnection::on_data(const char* data, std::size_t size) {
    switch (phase_) {
        case Phase::Head: {
            auto consumed = parser_.parse_headers(data, size);
            if (consumed.is_error()) {
                spdlog::warn("Connection error: {}", consumed.error());
                reject(plain_response(HttpStatus::BAD_REQUEST, "Parse error: " + consumed.error()));
                return;
            }
            if (!parser_.headers_complete()) {
                do_read();
                return;
            }
            on_headers(data + consumed.value(), size - consumed.value());
            return;
        }

        case Phase::Buffering:
            parser_.parse_body(data, size);
            if (parser_.is_complete()) {
                dispatch();
            } else {
                do_read();
            }
            return;

        case Phase::Streaming:
            feed_stream(data, size);
            return;

        case Phase::Draining:
            feed_drain(size);
            return;

        default:
            return;
    }
}

void HttpConnection::on_headers(const char* data, std::size_t size) {
    const HttpRequest& request = parser_.request();
    const auto path = request.path();
    body_remaining_ = parser_.content_length();

    spdlog::debug("{} {} HTTP/{} ({} body bytes)",
        HttpMethodUtils::to_string(request.method),
        request.url,
        request.version == HttpVersion::HTTP_1_1 ? "1.1" : "1.0",
        body_remaining_);

    if (router_.has_stream_route(request.method, path)) {
        auto open = router_.open_stream(request, cancel_.get());
        if (!open.sink) {
            respond_after_body(std::move(open.rejection), size);
            return;
        }
        sink_ = std::move(open.sink);
        phase_ = Phase::Streaming;
        feed_stream(data, size);
        return;
    }

    if (body_remaining_ > options_.max_body_bytes) {
        spdlog::warn("{} {}: body of {} bytes exceeds {}", HttpMethodUtils::to_string(request.method),
                     path, body_remaining_, options_.max_body_bytes);
        respond_after_body(plain_response(HttpStatus::PAYLOAD_TOO_LARGE, "Request body too large"), size);
        return;
    }

    parser_.begin_body();
    phase_ = Phase::Buffering;
    if (size > 0) {
        parser_.parse_body(data, size);
    }
    if (parser_.is_complete()) {
        dispatch();
    } else {
        do_read();
    }
}

void HttpConnection::feed_stream(const char* data, std::size_t size) {
    const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(body_remaining_, size));

    if (take > 0 && !sink_->write(reinterpret_cast<const std::uint8_t*>(data), take)) {
        body_remaining_ -= take;
        auto response = sink_->finish();
        sink_.reset();
        respond_after_body(std::move(response), 0);
        return;
    }
    body_remaining_ -= take;

    if (body_remaining_ > 0) {
        do_read();
        return;
    }

    timer_.cancel();
    auto response = sink_->finish();
    sink_.reset();
    do_write(std::move(response));
}

void HttpConnection::feed_drain(std::size_t size) {
    body_remaining_ -= std::min<std::uint64_t>(body_remaining_, size);
    if (body_remaining_ == 0) {
        do_write(std::move(pending_response_));
    } else {
        do_read();
    }
}

void HttpConnection::respond_after_body(HttpResponse response, std::size_t buffered) {
    pending_response_ = std::move(response);
    phase_ = Phase::Draining;
    feed_drain(buffered);
}

void HttpConnection::reject(HttpResponse response) {
    do_write(std::move(response));
}

void HttpConnection::dispatch() {
    phase_ = Phase::Handling;
    timer_.cancel();

    auto self = shared_from_this();
    auto request = std::make_shared<HttpRequest>(parser_.get_request());
    auto token = cancel_;
    auto executor = socket_.get_executor();

    spdlog::info("{} {}", HttpMethodUtils::to_string(request->method), request->url);

    asio::post(workers_, [this, self, request, token, executor]() {
        HttpResponse response;
        try {
            response = router_.handle_request(*request, token.get());
        } catch (const std::exception& e) {
            spdlog::error("Handler threw exception: {}", e.what());
            response = internal_error_response("Internal server error");
        }

        asio::post(executor, [this, self, response = std::move(response)]() mutable {
            if (phase_ != Phase::Handling) {
                // Peer left while the handler ran; nobody to answer
                return;
            }
            do_write(std::move(response));
        });
    });

    watch_peer();
}

void HttpConnection::watch_peer() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t) {
            if (phase_ != Phase::Handling) {
                return;
            }
            if (ec) {
                spdlog::info("Client disconnected before the response was ready; cancelling");
                cancel_->cancel();
                close();
                return;
            }
            // Anything sent after the request is ignored
            watch_peer();
        }
    );
}

void HttpConnection::do_write(HttpResponse response) {
    auto self = shared_from_this();
    phase_ = Phase::Writing;
    timer_.cancel();

    response.set_header("Connection", "close");
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (!ec) {
                spdlog::debug("Sent {} bytes", bytes_transferred);
                boost::system::error_code shutdown_ec;
                socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
            } else if (ec != asio::error::operation_aborted) {
                spdlog::debug("Write error: {}", ec.message());
            }
            close();
        }
    );
}

void HttpConnection::on_timeout() {
    if (phase_ == Phase::Handling || phase_ == Phase::Writing || phase_ == Phase::Closed) {
        return;
    }

    spdlog::warn("Request not received within {}ms; closing connection", options_.request_timeout.count());
    if (sink_) {
        sink_->abort("request timeout");
        sink_.reset();
    }
    cancel_->cancel();
    close();
}

void HttpConnection::close() {
    if (phase_ == Phase::Closed) {
        return;
    }
    phase_ = Phase::Closed;
    timer_.cancel();

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context,
                               uint16_t port,
                               const HttpRouter& router,
                               ServerOptions options)
    : io_context_(io_context)
    , acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , router_(router)
    , options_(options)
    , workers_(std::max<std::size_t>(1, options.worker_threads))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server (Asio event-driven) listening on port {}", port_);

    do_accept();
}

HttpServerAsio::~HttpServerAsio() {
    stop();
}

void HttpServerAsio::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    boost::system::error_code ec;
    acceptor_.close(ec);

    // Queued handlers are dropped; running ones finish
    workers_.stop();
    workers_.join();
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (stopped_ || ec == asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                spdlog::debug("Accepted new connection (Asio)");
                std::make_shared<HttpConnection>(
                    std::move(socket),
                    router_,
                    workers_,
                    options_
                )->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }

            do_accept();
        }
    );
}

} // namespace network
} // namespace chunked
