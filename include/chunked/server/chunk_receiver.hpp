#pragma once

#include "chunked/core/result.hpp"
#include "chunked/events/event_bus.hpp"
#include "chunked/storage/fingerprint_gate.hpp"
#include "chunked/storage/staging_area.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunked::server {

struct ChunkReceipt {
    std::string fingerprint;
    std::uint32_t index = 0;
    std::uint64_t bytes = 0;
};

/**
 * @brief One chunk body in flight
 *
 * Holds a shared lease on the fingerprint for its whole life, so a merge
 * cannot start while the chunk is still arriving. Exactly one of commit()
 * or abort() takes effect; destroying an unfinished upload aborts it.
 */
class ChunkUpload {
public:
    ChunkUpload(std::string fingerprint,
                std::uint32_t index,
                std::uint64_t declared_length,
                std::unique_ptr<storage::ChunkWriter> writer,
                storage::FingerprintGate::Lease lease,
                events::EventBus& bus);
    ~ChunkUpload();

    ChunkUpload(const ChunkUpload&) = delete;
    ChunkUpload& operator=(const ChunkUpload&) = delete;

    Result<void> write(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Publish the chunk under its index
     *
     * Fails with InvalidArgument if fewer or more bytes than declared
     * arrived; the partial data is removed in that case.
     */
    Result<ChunkReceipt> commit();

    /**
     * @brief Drop the partial chunk; the Chunk Set is left as it was
     */
    void abort(const std::string& reason);

    [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] std::uint64_t bytes_received() const noexcept;
    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    std::string fingerprint_;
    std::uint32_t index_;
    std::uint64_t declared_length_;
    std::unique_ptr<storage::ChunkWriter> writer_;
    storage::FingerprintGate::Lease lease_;
    events::EventBus& bus_;
    bool finished_ = false;
};

/**
 * @brief Accepts chunk bodies into the staging area
 *
 * Metadata is checked in begin(), before a single body byte is read, so a
 * request with a bad fingerprint or index never touches the disk.
 */
class ChunkReceiver {
public:
    ChunkReceiver(storage::StagingArea& staging,
                  storage::FingerprintGate& gate,
                  events::EventBus& bus,
                  std::uint64_t max_chunk_bytes);

    /**
     * @brief Validate the chunk's identity and open its temp file
     *
     * ERRORS: MissingIdentifier, InvalidArgument, ChunkTooLarge,
     *         MergeInProgress, IoFailure
     */
    Result<std::unique_ptr<ChunkUpload>> begin(const std::string& fingerprint,
                                               const std::string& index,
                                               std::uint64_t declared_length);

    /// Store a whole chunk held in memory
    Result<ChunkReceipt> receive(const std::string& fingerprint,
                                 const std::string& index,
                                 const std::vector<std::uint8_t>& bytes);

    [[nodiscard]] std::uint64_t max_chunk_bytes() const noexcept { return max_chunk_bytes_; }

private:
    storage::StagingArea& staging_;
    storage::FingerprintGate& gate_;
    events::EventBus& bus_;
    std::uint64_t max_chunk_bytes_;
};

} // namespace chunked::server
