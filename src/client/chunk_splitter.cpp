#include "chunked/client/chunk_splitter.hpp"

#include <algorithm>
#include <fstream>
#include <limits>

namespace chunked::client {

Result<std::vector<ChunkRange>> split_into_chunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return Err<std::vector<ChunkRange>>(ErrorCode::InvalidArgument, "chunk size must be positive");
    }

    const std::uint64_t count = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::vector<ChunkRange>>(ErrorCode::InvalidArgument,
                                            "chunk size too small: " + std::to_string(count) + " chunks");
    }

    std::vector<ChunkRange> ranges;
    ranges.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        ChunkRange range;
        range.index = static_cast<std::uint32_t>(i);
        range.offset = i * chunk_size;
        range.length = std::min(chunk_size, file_size - range.offset);
        ranges.push_back(range);
    }
    return Ok(std::move(ranges));
}

Result<std::vector<std::uint8_t>> read_chunk(const std::filesystem::path& path, const ChunkRange& range) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::IoFailure, "cannot open " + path.string());
    }

    file.seekg(static_cast<std::streamoff>(range.offset));
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(range.length));
    if (!bytes.empty()) {
        file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!file || static_cast<std::uint64_t>(file.gcount()) != range.length) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::IoFailure,
            "short read of chunk " + std::to_string(range.index) + " from " + path.string());
    }
    return Ok(std::move(bytes));
}

} // namespace chunked::client
