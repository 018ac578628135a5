#pragma once

#include "chunked/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace chunked::client {

constexpr std::uint64_t kDefaultChunkSize = 5ULL * 1024 * 1024;

/**
 * @brief One contiguous byte range of a file, addressed by its index
 */
struct ChunkRange {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    bool operator==(const ChunkRange& other) const {
        return index == other.index && offset == other.offset && length == other.length;
    }
};

/**
 * @brief Partition [0, file_size) into ranges of `chunk_size`
 *
 * Ranges are returned in index order and cover the file exactly once; only
 * the last one may be shorter. An empty file yields no ranges.
 *
 * ERRORS: InvalidArgument (chunk_size == 0, or more than 2^32 chunks)
 */
Result<std::vector<ChunkRange>> split_into_chunks(std::uint64_t file_size,
                                                  std::uint64_t chunk_size = kDefaultChunkSize);

/**
 * @brief Read one range from disk
 *
 * ERRORS: IoFailure (cannot open, or file shorter than the range)
 */
Result<std::vector<std::uint8_t>> read_chunk(const std::filesystem::path& path, const ChunkRange& range);

} // namespace chunked::client
