#include "chunked/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace chunked {
namespace network {

// ────────────────────────────────────────────────────────────
// Helper: Convert URL pattern to regex
// ────────────────────────────────────────────────────────────

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            // Found parameter like :fingerprint
            ++i;
            std::string param_name;

            // Extract parameter name (alphanumeric + underscore)
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }

            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";  // Match any characters except /
            }
        } else if (pattern[i] == '*') {
            // Wildcard - match everything
            regex_pattern += "(.*)";
            ++i;
        } else {
            // Regular character - escape if needed
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";  // End of string
    return regex_pattern;
}

HttpResponse internal_error_response(const std::string& message) {
    HttpResponse response(HttpStatus::INTERNAL_SERVER_ERROR);
    response.set_body(message);
    response.set_header("Content-Type", "text/plain");
    return response;
}

// ────────────────────────────────────────────────────────────
// Route Implementation
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {
    compile();
}

Route::Route(HttpMethod m, const std::string& pat, StreamHandler h)
    : method(m), pattern(pat), stream_handler(std::move(h)) {
    compile();
}

void Route::compile() {
    // Convert pattern to regex
    std::string regex_str = pattern_to_regex(pattern, param_names);

    try {
        regex = std::regex(regex_str);
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid route pattern '{}': {}", pattern, e.what());
        // Fallback: exact match only
        param_names.clear();
        regex = std::regex("^" + std::regex_replace(pattern, std::regex(R"([.^$|()\[\]{}*+?\\])"), R"(\$&)") + "$");
    }
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    // Method must match
    if (method != req_method) {
        return false;
    }

    // URL must match regex
    return std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        // match[0] is the full string, match[1+] are capture groups
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }

    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter Implementation
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::del(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::stream(HttpMethod method, const std::string& pattern, StreamHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered streamed route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request, const CancellationToken* cancel) const {
    // Create context
    HttpContext ctx(request, cancel);
    const auto path = request.path();

    // Find matching route
    const Route* route = find_route(request.method, path, false);
    if (!route) {
        // No matching route - call 404 handler
        return not_found_handler_(ctx);
    }

    // Extract URL parameters
    ctx.params = route->extract_params(path);

    // Call route handler
    try {
        return route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw: {}", route->pattern, e.what());
        return internal_error_response("Internal Server Error");
    }
}

bool HttpRouter::has_stream_route(HttpMethod method, const std::string& path) const {
    return find_route(method, path, true) != nullptr;
}

StreamOpen HttpRouter::open_stream(const HttpRequest& request, const CancellationToken* cancel) const {
    HttpContext ctx(request, cancel);
    const auto path = request.path();

    StreamOpen open;
    const Route* route = find_route(request.method, path, true);
    if (!route) {
        open.rejection = not_found_handler_(ctx);
        return open;
    }

    ctx.params = route->extract_params(path);

    // The handler decides from the headers alone whether to take the body
    try {
        open = route->stream_handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Stream handler for {} threw: {}", route->pattern, e.what());
        open.sink.reset();
        open.rejection = internal_error_response("Internal Server Error");
    }
    return open;
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;

    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.pattern;
        if (route.is_stream()) {
            oss << " (streamed)";
        }
        route_list.push_back(oss.str());
    }

    return route_list;
}

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    HttpResponse response(HttpStatus::NOT_FOUND);
    response.set_body("No route for " + HttpMethodUtils::to_string(ctx.request.method) + " " + ctx.request.path());
    response.set_header("Content-Type", "text/plain");
    return response;
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path, bool stream) const {
    // First registered match wins
    for (const auto& route : routes_) {
        if (route.is_stream() == stream && route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

} // namespace network
} // namespace chunked
