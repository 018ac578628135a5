#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/core/result.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace chunked::client {

/**
 * @brief Server answer to a status query
 */
struct RemoteStatus {
    bool exists = false;
    std::string location;
    std::vector<std::uint32_t> stored_indices;
};

/// (bytes sent, chunk length) for the chunk currently in flight
using ChunkProgressFn = std::function<void(std::uint64_t, std::uint64_t)>;

/**
 * @brief The four protocol operations plus abandon, as seen by the client
 *
 * Implementations must be callable from several worker threads at once.
 * A tripped token makes the in-flight call return Cancelled promptly; the
 * server side then discards whatever partial chunk it was receiving.
 */
class UploadTransport {
public:
    virtual ~UploadTransport() = default;

    virtual Result<RemoteStatus> check_status(const std::string& fingerprint,
                                              const std::string& artifact_name,
                                              const CancellationToken* cancel) = 0;

    virtual Result<void> upload_chunk(const std::string& fingerprint,
                                      std::uint32_t index,
                                      const std::vector<std::uint8_t>& bytes,
                                      const ChunkProgressFn& on_progress,
                                      const CancellationToken* cancel) = 0;

    /// RETURNS: the artifact locator
    virtual Result<std::string> merge(const std::string& fingerprint,
                                      const std::string& artifact_name,
                                      std::uint32_t total_chunks,
                                      std::uint64_t total_size,
                                      const CancellationToken* cancel) = 0;

    /// RETURNS: whether a stored chunk was actually removed
    virtual Result<bool> cleanup_chunk(const std::string& fingerprint, std::uint32_t index) = 0;

    /// RETURNS: number of chunks removed
    virtual Result<std::size_t> abandon(const std::string& fingerprint) = 0;
};

} // namespace chunked::client
