#include "chunked/client/http_transport.hpp"

#include "chunked/core/identifiers.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <optional>

namespace chunked::client {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using json = nlohmann::json;

namespace {

std::optional<ErrorCode> code_from_name(const std::string& name) {
    static const ErrorCode all[] = {
        ErrorCode::MissingIdentifier, ErrorCode::InvalidArgument, ErrorCode::ChunkCountMismatch,
        ErrorCode::ChunkTooLarge, ErrorCode::MergeInProgress, ErrorCode::IoFailure,
        ErrorCode::Timeout, ErrorCode::Cancelled, ErrorCode::Transport, ErrorCode::Protocol
    };
    for (auto code : all) {
        if (name == error_code_name(code)) {
            return code;
        }
    }
    return std::nullopt;
}

ErrorCode code_from_status(int status) {
    switch (status) {
        case 409: return ErrorCode::MergeInProgress;
        case 413: return ErrorCode::ChunkTooLarge;
        case 408:
        case 504: return ErrorCode::Timeout;
        default: break;
    }
    if (status >= 500) {
        return ErrorCode::IoFailure;
    }
    if (status >= 400) {
        return ErrorCode::InvalidArgument;
    }
    return ErrorCode::Protocol;
}

bool is_success(const HttpResponse& response) {
    return response.status_code >= 200 && response.status_code < 300;
}

HttpRequest make_json_request(HttpMethod method, const std::string& url, const json& body) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.set_header("Content-Type", "application/json");
    request.set_body(body.dump());
    return request;
}

Result<json> parse_json_reply(const HttpResponse& response) {
    auto doc = json::parse(response.body_as_string(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<json>(ErrorCode::Protocol, "reply is not a JSON object: HTTP " +
                         std::to_string(response.status_code));
    }
    return Ok(std::move(doc));
}

} // namespace

Error error_from_response(const HttpResponse& response) {
    const auto status_text = "HTTP " + std::to_string(response.status_code);

    auto doc = json::parse(response.body_as_string(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        const auto body = response.body_as_string();
        return Error(code_from_status(response.status_code),
                     body.empty() ? status_text : status_text + ": " + body);
    }

    std::string message = status_text;
    if (auto it = doc.find("error"); it != doc.end() && it->is_string()) {
        message = it->get<std::string>();
    }

    ErrorCode code = code_from_status(response.status_code);
    if (auto it = doc.find("code"); it != doc.end() && it->is_string()) {
        if (auto named = code_from_name(it->get<std::string>())) {
            code = *named;
        }
    }

    Error error(code, message);
    if (code == ErrorCode::ChunkCountMismatch) {
        error.expected = doc.value("expected", 0u);
        error.actual = doc.value("actual", 0u);
    }
    return error;
}

HttpTransport::HttpTransport(const ClientConfig& config)
    : client_(config.host, config.port),
      chunk_timeout_(config.chunk_timeout),
      merge_timeout_(config.merge_timeout),
      status_timeout_(config.status_timeout) {
}

Result<RemoteStatus> HttpTransport::check_status(const std::string& fingerprint,
                                                 const std::string& artifact_name,
                                                 const CancellationToken* cancel) {
    network::RequestOptions options;
    options.timeout = status_timeout_;
    options.cancel = cancel;

    auto reply = client_.send(make_json_request(HttpMethod::POST, "/api/upload/status",
        json{{"fingerprint", fingerprint}, {"artifact_name", artifact_name}}), options);
    if (reply.is_error()) {
        return Err<RemoteStatus>(reply.error());
    }
    if (!is_success(reply.value())) {
        return Err<RemoteStatus>(error_from_response(reply.value()));
    }

    auto doc = parse_json_reply(reply.value());
    if (doc.is_error()) {
        return Err<RemoteStatus>(doc.error());
    }

    RemoteStatus status;
    status.exists = doc.value().value("exists", false);
    if (status.exists) {
        status.location = doc.value().value("location", std::string());
        return Ok(std::move(status));
    }

    auto indices = doc.value().find("stored_indices");
    if (indices == doc.value().end()) {
        return Ok(std::move(status));
    }
    if (!indices->is_array()) {
        return Err<RemoteStatus>(ErrorCode::Protocol, "stored_indices is not an array");
    }
    for (const auto& item : *indices) {
        // Indices arrive as decimal strings; numbers are tolerated
        if (item.is_number_unsigned() && item.get<std::uint64_t>() <= std::numeric_limits<std::uint32_t>::max()) {
            status.stored_indices.push_back(item.get<std::uint32_t>());
            continue;
        }
        if (!item.is_string()) {
            return Err<RemoteStatus>(ErrorCode::Protocol, "unexpected stored index: " + item.dump());
        }
        auto index = parse_chunk_index(item.get<std::string>());
        if (index.is_error()) {
            return Err<RemoteStatus>(ErrorCode::Protocol, "unexpected stored index: " + item.dump());
        }
        status.stored_indices.push_back(index.value());
    }
    return Ok(std::move(status));
}

Result<void> HttpTransport::upload_chunk(const std::string& fingerprint,
                                         std::uint32_t index,
                                         const std::vector<std::uint8_t>& bytes,
                                         const ChunkProgressFn& on_progress,
                                         const CancellationToken* cancel) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = "/api/upload/chunk";
    request.set_header("Content-Type", "application/octet-stream");
    request.set_header("X-Fingerprint", fingerprint);
    request.set_header("X-Chunk-Index", std::to_string(index));
    request.body = bytes;

    network::RequestOptions options;
    options.timeout = chunk_timeout_;
    options.cancel = cancel;
    options.on_progress = on_progress;

    auto reply = client_.send(std::move(request), options);
    if (reply.is_error()) {
        return Err<void>(reply.error());
    }
    if (!is_success(reply.value())) {
        return Err<void>(error_from_response(reply.value()));
    }
    return Ok();
}

Result<std::string> HttpTransport::merge(const std::string& fingerprint,
                                         const std::string& artifact_name,
                                         std::uint32_t total_chunks,
                                         std::uint64_t total_size,
                                         const CancellationToken* cancel) {
    network::RequestOptions options;
    options.timeout = merge_timeout_;
    options.cancel = cancel;

    auto reply = client_.send(make_json_request(HttpMethod::POST, "/api/upload/merge", json{
        {"fingerprint", fingerprint},
        {"artifact_name", artifact_name},
        {"total_chunks", total_chunks},
        {"total_size", total_size}
    }), options);
    if (reply.is_error()) {
        return Err<std::string>(reply.error());
    }
    if (!is_success(reply.value())) {
        return Err<std::string>(error_from_response(reply.value()));
    }

    auto doc = parse_json_reply(reply.value());
    if (doc.is_error()) {
        return Err<std::string>(doc.error());
    }
    auto location = doc.value().find("location");
    if (location == doc.value().end() || !location->is_string()) {
        return Err<std::string>(ErrorCode::Protocol, "merge reply without location");
    }
    return Ok(location->get<std::string>());
}

Result<bool> HttpTransport::cleanup_chunk(const std::string& fingerprint, std::uint32_t index) {
    HttpRequest request;
    request.method = HttpMethod::DELETE_METHOD;
    request.url = "/api/upload/chunk/" + fingerprint + "/" + std::to_string(index);

    network::RequestOptions options;
    options.timeout = status_timeout_;

    auto reply = client_.send(std::move(request), options);
    if (reply.is_error()) {
        return Err<bool>(reply.error());
    }
    if (!is_success(reply.value())) {
        return Err<bool>(error_from_response(reply.value()));
    }

    auto doc = parse_json_reply(reply.value());
    if (doc.is_error()) {
        return Err<bool>(doc.error());
    }
    return Ok(doc.value().value("discarded", false));
}

Result<std::size_t> HttpTransport::abandon(const std::string& fingerprint) {
    HttpRequest request;
    request.method = HttpMethod::DELETE_METHOD;
    request.url = "/api/upload/" + fingerprint;

    network::RequestOptions options;
    options.timeout = status_timeout_;

    auto reply = client_.send(std::move(request), options);
    if (reply.is_error()) {
        return Err<std::size_t>(reply.error());
    }
    if (!is_success(reply.value())) {
        return Err<std::size_t>(error_from_response(reply.value()));
    }

    auto doc = parse_json_reply(reply.value());
    if (doc.is_error()) {
        return Err<std::size_t>(doc.error());
    }
    return Ok(doc.value().value("chunks_removed", std::size_t{0}));
}

} // namespace chunked::client
