#include "chunked/network/http_client.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace chunked {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

using Completion = std::function<void(const boost::system::error_code&, std::size_t)>;

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

/**
 * @brief One connection's worth of blocking I/O
 *
 * Every step starts an async operation on a private io_context and polls
 * it in short slices, so cancellation and the overall deadline are
 * noticed while a send or receive is still blocked on the network.
 */
class Exchange {
public:
    explicit Exchange(const RequestOptions& options)
        : socket_(io_),
          options_(options),
          deadline_(std::chrono::steady_clock::now() + options.timeout) {
    }

    ~Exchange() {
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    Result<void> connect(const std::string& host, std::uint16_t port) {
        tcp::resolver resolver(io_);
        boost::system::error_code ec;
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            return Err<void>(ErrorCode::Transport, "cannot resolve " + host + ": " + ec.message());
        }

        auto res = run([&](Completion done) {
            asio::async_connect(socket_, endpoints,
                [done](const boost::system::error_code& e, const tcp::endpoint&) { done(e, 0); });
        }, "connect");
        if (res.is_error()) {
            return Err<void>(res.error());
        }
        return Ok();
    }

    Result<std::size_t> write(asio::const_buffer buffer) {
        return run([&](Completion done) {
            asio::async_write(socket_, buffer, done);
        }, "send");
    }

    Result<std::size_t> read_until(asio::streambuf& incoming, const std::string& delimiter) {
        return run([&](Completion done) {
            asio::async_read_until(socket_, incoming, delimiter, done);
        }, "receive");
    }

    Result<std::size_t> read_exactly(asio::streambuf& incoming, std::size_t count) {
        return run([&](Completion done) {
            asio::async_read(socket_, incoming, asio::transfer_exactly(count), done);
        }, "receive");
    }

    Result<std::size_t> read_to_eof(asio::streambuf& incoming) {
        return run([&](Completion done) {
            asio::async_read(socket_, incoming, asio::transfer_all(),
                [done](const boost::system::error_code& e, std::size_t n) {
                    done(e == asio::error::eof ? boost::system::error_code() : e, n);
                });
        }, "receive");
    }

private:
    template<typename Start>
    Result<std::size_t> run(Start&& start, const char* what) {
        bool done = false;
        boost::system::error_code outcome;
        std::size_t transferred = 0;

        start(Completion([&](const boost::system::error_code& ec, std::size_t n) {
            outcome = ec;
            transferred = n;
            done = true;
        }));

        io_.restart();
        while (!done) {
            io_.run_for(kPollInterval);
            if (done) {
                break;
            }
            if (is_cancelled(options_.cancel)) {
                abandon();
                return Err<std::size_t>(ErrorCode::Cancelled, std::string(what) + " cancelled");
            }
            if (std::chrono::steady_clock::now() >= deadline_) {
                abandon();
                return Err<std::size_t>(ErrorCode::Timeout,
                                        std::string(what) + " timed out after " +
                                        std::to_string(options_.timeout.count()) + "ms");
            }
        }

        if (outcome) {
            return Err<std::size_t>(ErrorCode::Transport, std::string(what) + " failed: " + outcome.message());
        }
        return Ok(transferred);
    }

    // Close the socket and let the aborted handler run while its captures are alive
    void abandon() {
        boost::system::error_code ignored;
        socket_.close(ignored);
        io_.restart();
        io_.run();
    }

    asio::io_context io_;
    tcp::socket socket_;
    const RequestOptions& options_;
    std::chrono::steady_clock::time_point deadline_;
};

} // namespace

Result<HttpResponse> parse_response_head(const std::string& head) {
    std::istringstream stream(head);
    std::string line;

    if (!std::getline(stream, line)) {
        return Err<HttpResponse>(ErrorCode::Protocol, "empty response");
    }
    strip_cr(line);
    if (line.rfind("HTTP/1.", 0) != 0) {
        return Err<HttpResponse>(ErrorCode::Protocol, "not an HTTP/1.x status line: " + line);
    }

    const auto first_space = line.find(' ');
    if (first_space == std::string::npos || line.size() < first_space + 4) {
        return Err<HttpResponse>(ErrorCode::Protocol, "malformed status line: " + line);
    }
    const auto code = line.substr(first_space + 1, 3);
    if (!std::all_of(code.begin(), code.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
        return Err<HttpResponse>(ErrorCode::Protocol, "malformed status code: " + line);
    }

    HttpResponse response;
    response.version = line.rfind("HTTP/1.0", 0) == 0 ? HttpVersion::HTTP_1_0 : HttpVersion::HTTP_1_1;
    response.status_code = std::stoi(code);
    if (line.size() > first_space + 5) {
        response.reason_phrase = line.substr(first_space + 5);
    }

    while (std::getline(stream, line)) {
        strip_cr(line);
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return Err<HttpResponse>(ErrorCode::Protocol, "malformed header: " + line);
        }
        auto value = line.substr(colon + 1);
        const auto first = value.find_first_not_of(" \t");
        const auto last = value.find_last_not_of(" \t");
        value = first == std::string::npos ? std::string() : value.substr(first, last - first + 1);
        response.headers[line.substr(0, colon)] = value;
    }

    return Ok(std::move(response));
}

HttpClient::HttpClient(std::string host, std::uint16_t port)
    : host_(std::move(host)),
      port_(port) {
}

Result<HttpResponse> HttpClient::send(HttpRequest request, const RequestOptions& options) const {
    if (is_cancelled(options.cancel)) {
        return Err<HttpResponse>(ErrorCode::Cancelled, "cancelled before sending");
    }

    request.set_header("Host", host_ + ":" + std::to_string(port_));
    request.set_header("Connection", "close");

    Exchange exchange(options);
    if (auto res = exchange.connect(host_, port_); res.is_error()) {
        return Err<HttpResponse>(res.error());
    }

    const auto head = request.serialize_head();
    if (auto res = exchange.write(asio::buffer(head)); res.is_error()) {
        return Err<HttpResponse>(res.error());
    }

    const std::uint64_t total = request.body.size();
    std::uint64_t sent = 0;
    while (sent < total) {
        const auto slice = static_cast<std::size_t>(std::min<std::uint64_t>(kBodySliceBytes, total - sent));
        auto res = exchange.write(asio::buffer(request.body.data() + sent, slice));
        if (res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
        sent += slice;
        if (options.on_progress) {
            options.on_progress(sent, total);
        }
    }

    asio::streambuf incoming;
    auto head_read = exchange.read_until(incoming, "\r\n\r\n");
    if (head_read.is_error()) {
        return Err<HttpResponse>(head_read.error());
    }

    const auto head_size = head_read.value();
    const std::string head_text(asio::buffers_begin(incoming.data()),
                                asio::buffers_begin(incoming.data()) + static_cast<std::ptrdiff_t>(head_size));
    incoming.consume(head_size);

    auto parsed = parse_response_head(head_text);
    if (parsed.is_error()) {
        return Err<HttpResponse>(parsed.error());
    }
    HttpResponse response = std::move(parsed.value());

    const auto length_header = response.get_header("Content-Length");
    std::size_t body_size = 0;
    if (!length_header.empty()) {
        if (length_header.size() > 19 ||
            !std::all_of(length_header.begin(), length_header.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return Err<HttpResponse>(ErrorCode::Protocol, "invalid Content-Length in response: " + length_header);
        }
        body_size = static_cast<std::size_t>(std::stoull(length_header));
        if (incoming.size() < body_size) {
            auto res = exchange.read_exactly(incoming, body_size - incoming.size());
            if (res.is_error()) {
                return Err<HttpResponse>(res.error());
            }
        }
    } else {
        auto res = exchange.read_to_eof(incoming);
        if (res.is_error()) {
            return Err<HttpResponse>(res.error());
        }
        body_size = incoming.size();
    }

    body_size = std::min(body_size, incoming.size());
    response.body.assign(asio::buffers_begin(incoming.data()),
                         asio::buffers_begin(incoming.data()) + static_cast<std::ptrdiff_t>(body_size));

    spdlog::debug("{} {} -> {}", HttpMethodUtils::to_string(request.method), request.url, response.status_code);
    return Ok(std::move(response));
}

} // namespace network
} // namespace chunked
