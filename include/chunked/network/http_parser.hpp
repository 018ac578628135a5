#pragma once

#include "chunked/core/result.hpp"
#include "chunked/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace chunked {
namespace network {

/**
 * @brief States of the request parser
 *
 * METHOD SP URL SP VERSION CRLF    <- request line
 * Header-Name: Header-Value CRLF   <- headers (multiple)
 * CRLF                             <- HEADERS_COMPLETE
 * [Body]                           <- BODY, exactly Content-Length bytes
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    HEADERS_COMPLETE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.1 request parser
 *
 * The head is parsed character by character; the body is copied in bulk.
 * Parsing can stop right after the headers (parse_headers()) so the caller
 * decides, before a single body byte is consumed, whether the body is
 * buffered into the request or streamed somewhere else.
 *
 * Usage:
 * ```cpp
 * HttpParser parser;
 * auto consumed = parser.parse_headers(data, len);
 * if (consumed.is_ok() && parser.headers_complete()) {
 *     // route on parser.request(); then either
 *     parser.parse_body(data + consumed.value(), len - consumed.value());
 *     // or hand the remaining bytes to a stream sink
 * }
 * ```
 *
 * Chunked transfer encoding is not supported; requests with a body must
 * carry Content-Length.
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeadBytes = 16 * 1024;

    HttpParser() { reset(); }

    /**
     * @brief Feed bytes until the end of the header block
     *
     * RETURNS: number of bytes consumed; fewer than `len` once the blank
     *          line ending the headers has been reached
     */
    Result<std::size_t, std::string> parse_headers(const char* data, std::size_t len) {
        std::size_t i = 0;
        for (; i < len && !headers_complete(); ++i) {
            const char c = data[i];
            if (++head_bytes_ > kMaxHeadBytes) {
                return fail("request head exceeds " + std::to_string(kMaxHeadBytes) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::PARSE_ERROR:
                    return Err<std::size_t, std::string>(std::string("Parser in error state"));
                default: break;
            }
            if (!ok) {
                return fail(error_);
            }
        }
        return Ok<std::size_t, std::string>(i);
    }

    /**
     * @brief Append body bytes to the request
     *
     * RETURNS: number of bytes consumed (never past Content-Length)
     */
    std::size_t parse_body(const char* data, std::size_t len) {
        if (state_ != ParseState::BODY) {
            return 0;
        }
        const auto remaining = content_length_ - body_bytes_read_;
        const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, len));
        request_.body.insert(request_.body.end(),
                             reinterpret_cast<const uint8_t*>(data),
                             reinterpret_cast<const uint8_t*>(data) + take);
        body_bytes_read_ += take;
        if (body_bytes_read_ >= content_length_) {
            state_ = ParseState::COMPLETE;
        }
        return take;
    }

    /**
     * @brief Parse a whole request, body buffered
     *
     * RETURNS: true once the request is complete, false if more data is needed
     */
    Result<bool, std::string> parse(const char* data, std::size_t len) {
        auto consumed = parse_headers(data, len);
        if (consumed.is_error()) {
            return Err<bool, std::string>(consumed.error());
        }
        if (state_ == ParseState::HEADERS_COMPLETE) {
            begin_body();
        }
        const auto offset = consumed.value();
        if (state_ == ParseState::BODY && offset < len) {
            parse_body(data + offset, len - offset);
        }
        return Ok<bool, std::string>(is_complete());
    }

    /**
     * @brief Leave HEADERS_COMPLETE for BODY (or COMPLETE when there is none)
     */
    void begin_body() {
        if (state_ != ParseState::HEADERS_COMPLETE) {
            return;
        }
        if (content_length_ > 0) {
            request_.body.reserve(static_cast<std::size_t>(
                std::min<std::uint64_t>(content_length_, 1024 * 1024)));
            state_ = ParseState::BODY;
        } else {
            state_ = ParseState::COMPLETE;
        }
    }

    bool headers_complete() const {
        return state_ == ParseState::HEADERS_COMPLETE ||
               state_ == ParseState::BODY ||
               state_ == ParseState::COMPLETE;
    }

    bool is_complete() const { return state_ == ParseState::COMPLETE; }

    ParseState state() const { return state_; }

    std::uint64_t content_length() const { return content_length_; }

    const HttpRequest& request() const { return request_; }

    HttpRequest get_request() const { return request_; }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        content_length_ = 0;
        body_bytes_read_ = 0;
        head_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    std::uint64_t content_length_;
    std::uint64_t body_bytes_read_;
    std::size_t head_bytes_;
    std::size_t line_;
    bool last_char_was_cr_;

    Result<std::size_t, std::string> fail(const std::string& message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<std::size_t, std::string>(message + " at line " + std::to_string(line_));
    }

    bool reject(const std::string& message) {
        error_ = message;
        return false;
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return reject("Empty HTTP method");
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return reject("Unknown HTTP method " + buffer_);
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return reject("Failed to parse HTTP method");
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return reject("Empty URL");
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return reject("Failed to parse URL");
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return reject("Unsupported HTTP version " + buffer_);
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return reject("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return reject("Failed to parse header name");
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool finish_headers() {
        if (!request_.get_header("Transfer-Encoding").empty()) {
            return reject("Transfer-Encoding is not supported; send Content-Length");
        }

        const std::string length = request_.get_header("Content-Length");
        if (!length.empty()) {
            if (length.size() > 19 ||
                !std::all_of(length.begin(), length.end(),
                             [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
                return reject("Invalid Content-Length: " + length);
            }
            content_length_ = std::stoull(length);
        }
        state_ = ParseState::HEADERS_COMPLETE;
        return true;
    }
};

} // namespace network
} // namespace chunked
