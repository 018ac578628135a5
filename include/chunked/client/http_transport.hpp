#pragma once

#include "chunked/client/transport.hpp"
#include "chunked/core/config.hpp"
#include "chunked/network/http_client.hpp"

namespace chunked::client {

/**
 * @brief UploadTransport over the server's HTTP/JSON API
 *
 * Non-2xx replies are turned back into Errors using the `code` field of the
 * JSON error body, so the orchestrator sees the same ErrorCode the server
 * component returned. Replies without a recognisable code are classified by
 * HTTP status; a 2xx reply that is not the expected JSON is a Protocol error.
 */
class HttpTransport : public UploadTransport {
public:
    explicit HttpTransport(const ClientConfig& config);

    Result<RemoteStatus> check_status(const std::string& fingerprint,
                                      const std::string& artifact_name,
                                      const CancellationToken* cancel) override;

    Result<void> upload_chunk(const std::string& fingerprint,
                              std::uint32_t index,
                              const std::vector<std::uint8_t>& bytes,
                              const ChunkProgressFn& on_progress,
                              const CancellationToken* cancel) override;

    Result<std::string> merge(const std::string& fingerprint,
                              const std::string& artifact_name,
                              std::uint32_t total_chunks,
                              std::uint64_t total_size,
                              const CancellationToken* cancel) override;

    Result<bool> cleanup_chunk(const std::string& fingerprint, std::uint32_t index) override;

    Result<std::size_t> abandon(const std::string& fingerprint) override;

private:
    network::HttpClient client_;
    std::chrono::milliseconds chunk_timeout_;
    std::chrono::milliseconds merge_timeout_;
    std::chrono::milliseconds status_timeout_;
};

/**
 * @brief Map a non-2xx reply to an Error
 */
Error error_from_response(const network::HttpResponse& response);

} // namespace chunked::client
