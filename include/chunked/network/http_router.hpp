#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunked {
namespace network {

/**
 * @brief Request context with URL parameters extracted from route
 *
 * `cancel` is tripped by the server when the client disconnects while the
 * handler is still running; long handlers poll it.
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :id
    const CancellationToken* cancel = nullptr;

    explicit HttpContext(const HttpRequest& req, const CancellationToken* token = nullptr)
        : request(req), cancel(token) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }
};

/**
 * @brief Receiver for a request body that is not buffered in memory
 *
 * The server calls write() for every slice of the body as it arrives and
 * finish() once Content-Length bytes have been delivered. If the transfer
 * breaks off (peer gone, timeout) abort() is called instead of finish().
 */
class BodySink {
public:
    virtual ~BodySink() = default;

    /**
     * RETURNS: false to stop consuming; finish() then describes the failure
     */
    virtual bool write(const std::uint8_t* data, std::size_t size) = 0;

    virtual HttpResponse finish() = 0;

    virtual void abort(const std::string& reason) = 0;
};

/**
 * @brief Outcome of opening a streamed route: a sink, or the response to
 *        send instead of reading the body
 */
struct StreamOpen {
    std::unique_ptr<BodySink> sink;
    HttpResponse rejection;
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;
using StreamHandler = std::function<StreamOpen(const HttpContext&)>;

/**
 * @brief Single route in the router
 */
struct Route {
    HttpMethod method;
    std::string pattern;                   // Original pattern like "/chunk/:fingerprint"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;
    StreamHandler stream_handler;          // Set for streamed routes only

    Route(HttpMethod m, const std::string& pat, RouteHandler h);
    Route(HttpMethod m, const std::string& pat, StreamHandler h);

    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;

    bool is_stream() const { return static_cast<bool>(stream_handler); }

private:
    void compile();
};

/**
 * @brief HTTP Router for organizing request handlers
 *
 * Routes match on the request path (query string ignored), first
 * registration wins. Two kinds of routes exist:
 * - ordinary routes get the request with its body fully buffered
 * - streamed routes are opened as soon as the headers are in, and receive
 *   the body through a BodySink
 *
 * Example usage:
 * @code
 * HttpRouter router;
 *
 * router.get("/api/stats", [](const HttpContext& ctx) {
 *     HttpResponse res(HttpStatus::OK);
 *     res.set_body("{}");
 *     return res;
 * });
 *
 * router.del("/api/upload/chunk/:fingerprint/:index", [](const HttpContext& ctx) {
 *     auto fp = ctx.get_param("fingerprint");
 *     ...
 * });
 *
 * router.stream(HttpMethod::PUT, "/api/upload/chunk", [](const HttpContext& ctx) {
 *     StreamOpen open;
 *     open.sink = std::make_unique<MySink>(...);
 *     return open;
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void del(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Register a route whose body is streamed rather than buffered
     */
    void stream(HttpMethod method, const std::string& pattern, StreamHandler handler);

    void set_not_found_handler(RouteHandler handler);

    /**
     * @brief Handle a buffered request
     *
     * Exceptions escaping a handler are logged and turned into a 500.
     */
    HttpResponse handle_request(const HttpRequest& request, const CancellationToken* cancel = nullptr) const;

    bool has_stream_route(HttpMethod method, const std::string& path) const;

    /**
     * @brief Open the streamed route matching the request's head
     *
     * Without a matching streamed route the rejection is a 404.
     */
    StreamOpen open_stream(const HttpRequest& request, const CancellationToken* cancel = nullptr) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    RouteHandler not_found_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path, bool stream) const;
};

/**
 * @brief Convert URL pattern to regex
 *
 * Converts:
 *   "/users/:id"           → "^/users/([^/]+)$"
 *   "/posts/:id/comments"  → "^/posts/([^/]+)/comments$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

/// 500 response used when a handler throws
HttpResponse internal_error_response(const std::string& message);

} // namespace network
} // namespace chunked
