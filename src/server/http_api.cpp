#include "chunked/server/http_api.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <limits>
#include <optional>

namespace chunked::server {

using network::HttpContext;
using network::HttpMethod;
using network::HttpResponse;
using network::HttpStatus;
using json = nlohmann::json;

namespace {

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error(ErrorCode code, const std::string& message) {
    return make_error_response(Error(code, message));
}

// Parse a JSON object body; a non-object is reported like a missing field
std::optional<json> parse_object(const HttpContext& ctx) {
    auto doc = json::parse(ctx.request.body_as_string(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    return doc;
}

std::string string_field(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

/**
 * @brief Feeds one streamed chunk body into its ChunkUpload
 */
class ChunkSink : public network::BodySink {
public:
    explicit ChunkSink(std::unique_ptr<ChunkUpload> upload)
        : upload_(std::move(upload)) {}

    bool write(const std::uint8_t* data, std::size_t size) override {
        auto res = upload_->write(data, size);
        if (res.is_error()) {
            failure_ = res.error();
            upload_->abort("write failed: " + res.error().message);
            return false;
        }
        return true;
    }

    HttpResponse finish() override {
        if (failure_) {
            return make_error_response(*failure_);
        }
        auto receipt = upload_->commit();
        if (receipt.is_error()) {
            return make_error_response(receipt.error());
        }
        return make_json_response(HttpStatus::OK, json{
            {"index", receipt.value().index},
            {"fingerprint", receipt.value().fingerprint},
            {"bytes", receipt.value().bytes}
        });
    }

    void abort(const std::string& reason) override {
        upload_->abort(reason);
    }

private:
    std::unique_ptr<ChunkUpload> upload_;
    std::optional<Error> failure_;
};

HttpResponse handle_status(UploadService& service, const HttpContext& ctx) {
    auto doc = parse_object(ctx);
    if (!doc) {
        return make_error(ErrorCode::MissingIdentifier, "JSON body with fingerprint and artifact_name required");
    }

    auto status = service.status(string_field(*doc, "fingerprint"), string_field(*doc, "artifact_name"));
    if (status.is_error()) {
        return make_error_response(status.error());
    }

    const auto& value = status.value();
    if (value.exists) {
        return make_json_response(HttpStatus::OK, json{{"exists", true}, {"location", value.location}});
    }

    json indices = json::array();
    for (auto index : value.stored_indices) {
        indices.push_back(std::to_string(index));
    }
    return make_json_response(HttpStatus::OK, json{{"exists", false}, {"stored_indices", indices}});
}

network::StreamOpen open_chunk(UploadService& service, const HttpContext& ctx) {
    network::StreamOpen open;

    const auto length = ctx.request.get_header("Content-Length");
    if (length.empty() || length.size() > 19 ||
        length.find_first_not_of("0123456789") != std::string::npos) {
        open.rejection = make_error(ErrorCode::InvalidArgument, "Content-Length required");
        return open;
    }

    auto upload = service.begin_chunk(ctx.request.get_header("X-Fingerprint"),
                                      ctx.request.get_header("X-Chunk-Index"),
                                      std::stoull(length));
    if (upload.is_error()) {
        open.rejection = make_error_response(upload.error());
        return open;
    }

    open.sink = std::make_unique<ChunkSink>(std::move(upload.value()));
    return open;
}

HttpResponse handle_merge(UploadService& service, const HttpContext& ctx) {
    auto doc = parse_object(ctx);
    if (!doc) {
        return make_error(ErrorCode::MissingIdentifier,
                          "JSON body with fingerprint, artifact_name and total_chunks required");
    }

    MergeRequest request;
    request.fingerprint = string_field(*doc, "fingerprint");
    request.artifact_name = string_field(*doc, "artifact_name");

    auto total = doc->find("total_chunks");
    if (total == doc->end()) {
        return make_error(ErrorCode::MissingIdentifier, "total_chunks required");
    }
    if (!total->is_number_unsigned() || total->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return make_error(ErrorCode::InvalidArgument, "total_chunks must be a non-negative integer");
    }
    request.total_chunks = total->get<std::uint32_t>();

    auto size = doc->find("total_size");
    if (size != doc->end()) {
        if (!size->is_number_unsigned()) {
            return make_error(ErrorCode::InvalidArgument, "total_size must be a non-negative integer");
        }
        request.total_size = size->get<std::uint64_t>();
    }

    auto receipt = service.merge(request, ctx.cancel);
    if (receipt.is_error()) {
        return make_error_response(receipt.error());
    }
    return make_json_response(HttpStatus::OK, json{
        {"location", receipt.value().location},
        {"chunks", receipt.value().chunk_count},
        {"bytes", receipt.value().total_bytes}
    });
}

HttpResponse handle_discard(UploadService& service, const HttpContext& ctx) {
    auto discarded = service.discard_chunk(ctx.get_param("fingerprint"), ctx.get_param("index"));
    if (discarded.is_error()) {
        return make_error_response(discarded.error());
    }
    return make_json_response(HttpStatus::OK, json{{"discarded", discarded.value()}});
}

HttpResponse handle_abandon(UploadService& service, const HttpContext& ctx) {
    auto removed = service.abandon(ctx.get_param("fingerprint"));
    if (removed.is_error()) {
        return make_error_response(removed.error());
    }
    return make_json_response(HttpStatus::OK, json{{"chunks_removed", removed.value()}});
}

HttpResponse handle_stats(UploadService& service, const events::MetricsComponent* metrics) {
    json body;
    body["artifacts"] = service.catalog().size();
    if (metrics) {
        const auto s = metrics->snapshot();
        body["chunks_stored"] = s.chunks_stored;
        body["bytes_stored"] = s.bytes_stored;
        body["chunks_cancelled"] = s.chunks_cancelled;
        body["chunks_discarded"] = s.chunks_discarded;
        body["chunk_sets_abandoned"] = s.chunk_sets_abandoned;
        body["merges_completed"] = s.merges_completed;
        body["merges_failed"] = s.merges_failed;
        body["bytes_assembled"] = s.bytes_assembled;
        body["chunk_sets_swept"] = s.chunk_sets_swept;
    }
    return make_json_response(HttpStatus::OK, body);
}

} // namespace

HttpStatus http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::MissingIdentifier:
        case ErrorCode::InvalidArgument:
        case ErrorCode::ChunkCountMismatch:
            return HttpStatus::BAD_REQUEST;
        case ErrorCode::ChunkTooLarge:
            return HttpStatus::PAYLOAD_TOO_LARGE;
        case ErrorCode::MergeInProgress:
            return HttpStatus::CONFLICT;
        case ErrorCode::Timeout:
            return HttpStatus::GATEWAY_TIMEOUT;
        case ErrorCode::IoFailure:
        case ErrorCode::Cancelled:
        case ErrorCode::Transport:
        case ErrorCode::Protocol:
            return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse make_error_response(const Error& error) {
    json body{{"error", error.message}, {"code", error_code_name(error.code)}};
    if (error.code == ErrorCode::ChunkCountMismatch) {
        body["expected"] = error.expected;
        body["actual"] = error.actual;
    }
    return make_json_response(http_status_for(error.code), body);
}

void register_upload_routes(network::HttpRouter& router,
                            UploadService& service,
                            const events::MetricsComponent* metrics) {
    router.post("/api/upload/status", [&service](const HttpContext& ctx) {
        return handle_status(service, ctx);
    });

    router.stream(HttpMethod::PUT, "/api/upload/chunk", [&service](const HttpContext& ctx) {
        return open_chunk(service, ctx);
    });

    router.post("/api/upload/merge", [&service](const HttpContext& ctx) {
        return handle_merge(service, ctx);
    });

    router.del("/api/upload/chunk/:fingerprint/:index", [&service](const HttpContext& ctx) {
        return handle_discard(service, ctx);
    });

    router.del("/api/upload/:fingerprint", [&service](const HttpContext& ctx) {
        return handle_abandon(service, ctx);
    });

    router.get("/api/stats", [&service, metrics](const HttpContext&) {
        return handle_stats(service, metrics);
    });

    spdlog::debug("Upload routes registered");
}

} // namespace chunked::server
