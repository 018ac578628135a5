#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/core/result.hpp"
#include "chunked/network/http_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace chunked {
namespace network {

/**
 * @brief Per-call knobs for HttpClient::send()
 */
struct RequestOptions {
    /// Whole exchange: connect, send, receive
    std::chrono::milliseconds timeout{30000};
    /// Polled while the exchange runs; tripping it closes the connection
    const CancellationToken* cancel = nullptr;
    /// Called after each body slice is written: (bytes sent, body size)
    std::function<void(std::uint64_t, std::uint64_t)> on_progress;
};

/**
 * @brief Minimal blocking HTTP/1.1 client on Boost.Asio
 *
 * Each send() opens one connection, writes the request (body in slices so
 * progress can be reported and cancellation noticed mid-transfer), reads
 * the Content-Length-delimited response and closes.
 *
 * ERRORS: Transport (resolve/connect/read/write failure), Protocol
 *         (malformed response), Timeout, Cancelled. HTTP error statuses are not errors here;
 *         they come back as responses.
 *
 * THREAD SAFETY: send() may be called concurrently; calls share nothing.
 */
class HttpClient {
public:
    static constexpr std::size_t kBodySliceBytes = 64 * 1024;

    HttpClient(std::string host, std::uint16_t port);

    Result<HttpResponse> send(HttpRequest request, const RequestOptions& options = {}) const;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
    std::string host_;
    std::uint16_t port_;
};

/**
 * @brief Parse a status line and header block ("HTTP/1.1 200 OK\r\n...\r\n\r\n")
 */
Result<HttpResponse> parse_response_head(const std::string& head);

} // namespace network
} // namespace chunked
