#pragma once

#include "chunked/core/result.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace chunked::storage {

/**
 * @brief Exclusive writer for one chunk file
 *
 * Bytes go to a private temp file next to the final one; commit() renames
 * it over `<index>` so readers only ever see complete chunks and a retry of
 * the same index simply replaces the previous copy. A writer destroyed
 * without commit() deletes its temp file.
 */
class ChunkWriter {
public:
    ChunkWriter(std::filesystem::path temp_path,
                std::filesystem::path final_path,
                std::ofstream stream);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    Result<void> append(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Flush, close and publish the chunk under its index
     */
    Result<void> commit();

    /**
     * @brief Drop everything written so far
     */
    void discard() noexcept;

    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }
    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] const std::filesystem::path& temp_path() const noexcept { return temp_path_; }

private:
    std::filesystem::path temp_path_;
    std::filesystem::path final_path_;
    std::ofstream stream_;
    std::uint64_t bytes_written_ = 0;
    bool finished_ = false;
};

/**
 * @brief Summary of one Chunk Set directory, used by the staging sweep
 */
struct ChunkSetInfo {
    std::string fingerprint;
    std::size_t chunk_count = 0;
    std::filesystem::file_time_type last_activity{};
};

/**
 * @brief On-disk layout of every Chunk Set
 *
 * LAYOUT:
 *   <root>/<fingerprint>/<index>            committed chunk
 *   <root>/<fingerprint>/<index>.part.<n>   chunk still being received
 *
 * Only committed chunks count as stored. Directory creation is idempotent and
 * tolerates concurrent first arrivals for the same fingerprint.
 *
 * THREAD SAFETY: all methods may be called concurrently; arbitration between
 * merges and writes on the same fingerprint is the FingerprintGate's job.
 */
class StagingArea {
public:
    explicit StagingArea(std::filesystem::path root);

    Result<void> initialize();

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    std::filesystem::path chunk_set_path(const std::string& fingerprint) const;
    std::filesystem::path chunk_path(const std::string& fingerprint, std::uint32_t index) const;

    bool has_chunk_set(const std::string& fingerprint) const;

    /**
     * @brief Create the fingerprint's directory if it is not there yet
     */
    Result<void> ensure_chunk_set(const std::string& fingerprint);

    /**
     * @brief Committed chunk indices in ascending numeric order
     *
     * An absent Chunk Set yields an empty list, not an error.
     */
    Result<std::vector<std::uint32_t>> list_indices(const std::string& fingerprint) const;

    Result<std::unique_ptr<ChunkWriter>> open_writer(const std::string& fingerprint, std::uint32_t index);

    /**
     * @brief Delete one committed chunk
     *
     * RETURNS: whether the chunk existed
     */
    Result<bool> remove_chunk(const std::string& fingerprint, std::uint32_t index);

    /**
     * @brief Delete the whole Chunk Set, temp files included
     *
     * RETURNS: number of committed chunks that were removed
     */
    Result<std::size_t> remove_chunk_set(const std::string& fingerprint);

    /**
     * @brief Remove the directory if it no longer holds any file
     */
    Result<void> remove_chunk_set_if_empty(const std::string& fingerprint);

    Result<std::vector<ChunkSetInfo>> list_chunk_sets() const;

private:
    std::filesystem::path root_;
    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace chunked::storage
