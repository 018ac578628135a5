#pragma once

#include "chunked/core/cancellation.hpp"
#include "chunked/core/result.hpp"
#include "chunked/events/event_bus.hpp"
#include "chunked/storage/artifact_catalog.hpp"
#include "chunked/storage/fingerprint_gate.hpp"
#include "chunked/storage/staging_area.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunked::server {

struct MergeRequest {
    std::string fingerprint;
    std::string artifact_name;
    std::uint32_t total_chunks = 0;
    std::uint64_t total_size = 0;  ///< advisory
};

struct MergeReceipt {
    std::string location;
    std::uint32_t chunk_count = 0;
    std::uint64_t total_bytes = 0;
};

/**
 * @brief Turns a complete Chunk Set into its artifact
 *
 * ALGORITHM:
 * 1. Take the fingerprint's exclusive lease (no chunk writes, no second merge)
 * 2. Require exactly the indices 0..total_chunks-1 to be stored
 * 3. Concatenate them in numeric order into a hidden temp file
 * 4. Rename the temp file onto the artifact name, record it, drop the Chunk Set
 *
 * Any failure before step 4 removes the temp file and leaves the Chunk Set
 * untouched, so the same merge can simply be retried.
 */
class MergeAssembler {
public:
    struct Options {
        std::size_t copy_buffer_bytes = 1024 * 1024;
        std::chrono::milliseconds merge_timeout{600000};
    };

    MergeAssembler(storage::StagingArea& staging,
                   storage::ArtifactCatalog& catalog,
                   storage::FingerprintGate& gate,
                   events::EventBus& bus,
                   Options options);

    /**
     * @brief Assemble one artifact
     *
     * @param cancel Checked between copy blocks; may be null
     *
     * ERRORS: MissingIdentifier, InvalidArgument, MergeInProgress,
     *         ChunkCountMismatch, IoFailure, Timeout, Cancelled
     */
    Result<MergeReceipt> merge(const MergeRequest& request, const CancellationToken* cancel = nullptr);

private:
    Result<MergeReceipt> assemble(const MergeRequest& request,
                                  const std::vector<std::uint32_t>& indices,
                                  const CancellationToken* cancel);

    Result<MergeReceipt> fail(const MergeRequest& request, Error error);

    storage::StagingArea& staging_;
    storage::ArtifactCatalog& catalog_;
    storage::FingerprintGate& gate_;
    events::EventBus& bus_;
    Options options_;
    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace chunked::server
