#include "chunked/storage/staging_area.hpp"

#include "chunked/core/identifiers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace chunked::storage {
namespace fs = std::filesystem;

// ──────────────────────────────────────────────────────────
// ChunkWriter
// ──────────────────────────────────────────────────────────

ChunkWriter::ChunkWriter(fs::path temp_path, fs::path final_path, std::ofstream stream)
    : temp_path_(std::move(temp_path)),
      final_path_(std::move(final_path)),
      stream_(std::move(stream)) {
}

ChunkWriter::~ChunkWriter() {
    if (!finished_) {
        discard();
    }
}

Result<void> ChunkWriter::append(const std::uint8_t* data, std::size_t size) {
    if (finished_) {
        return Err<void>(ErrorCode::IoFailure, "chunk writer already finished");
    }
    stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!stream_) {
        return Err<void>(ErrorCode::IoFailure, "failed to write chunk data: " + temp_path_.string());
    }
    bytes_written_ += size;
    return Ok();
}

Result<void> ChunkWriter::commit() {
    if (finished_) {
        return Err<void>(ErrorCode::IoFailure, "chunk writer already finished");
    }

    stream_.flush();
    stream_.close();
    if (stream_.fail()) {
        discard();
        return Err<void>(ErrorCode::IoFailure, "failed to flush chunk: " + temp_path_.string());
    }

    std::error_code ec;
    fs::rename(temp_path_, final_path_, ec);
    if (ec) {
        discard();
        return Err<void>(ErrorCode::IoFailure,
                         "failed to publish chunk " + final_path_.string() + ": " + ec.message());
    }

    finished_ = true;
    return Ok();
}

void ChunkWriter::discard() noexcept {
    finished_ = true;
    if (stream_.is_open()) {
        stream_.close();
    }
    std::error_code ec;
    fs::remove(temp_path_, ec);
    if (ec) {
        spdlog::error("Failed to delete partial chunk {}: {}", temp_path_.string(), ec.message());
    }
}

// ──────────────────────────────────────────────────────────
// StagingArea
// ──────────────────────────────────────────────────────────

StagingArea::StagingArea(fs::path root)
    : root_(std::move(root)) {
}

Result<void> StagingArea::initialize() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::is_directory(root_)) {
        return Err<void>(ErrorCode::IoFailure, "failed to create staging root " + root_.string() + ": " + ec.message());
    }
    return Ok();
}

fs::path StagingArea::chunk_set_path(const std::string& fingerprint) const {
    return root_ / fingerprint;
}

fs::path StagingArea::chunk_path(const std::string& fingerprint, std::uint32_t index) const {
    return chunk_set_path(fingerprint) / std::to_string(index);
}

bool StagingArea::has_chunk_set(const std::string& fingerprint) const {
    std::error_code ec;
    return fs::is_directory(chunk_set_path(fingerprint), ec);
}

Result<void> StagingArea::ensure_chunk_set(const std::string& fingerprint) {
    const auto dir = chunk_set_path(fingerprint);
    std::error_code ec;
    fs::create_directories(dir, ec);
    // A concurrent first arrival may have created it between our check and create
    if (ec && !fs::is_directory(dir)) {
        return Err<void>(ErrorCode::IoFailure, "failed to create chunk set " + dir.string() + ": " + ec.message());
    }
    return Ok();
}

Result<std::vector<std::uint32_t>> StagingArea::list_indices(const std::string& fingerprint) const {
    std::vector<std::uint32_t> indices;
    const auto dir = chunk_set_path(fingerprint);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Ok(std::move(indices));
    }

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Err<std::vector<std::uint32_t>>(ErrorCode::IoFailure,
                                              "failed to list chunk set " + dir.string() + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Err<std::vector<std::uint32_t>>(ErrorCode::IoFailure,
                                                  "failed to list chunk set " + dir.string() + ": " + ec.message());
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        // Temp files ("3.part.17") do not parse as an index and are skipped
        auto index = parse_chunk_index(it->path().filename().string());
        if (index.is_ok()) {
            indices.push_back(index.value());
        }
    }

    std::sort(indices.begin(), indices.end());
    return Ok(std::move(indices));
}

Result<std::unique_ptr<ChunkWriter>> StagingArea::open_writer(const std::string& fingerprint, std::uint32_t index) {
    if (auto res = ensure_chunk_set(fingerprint); res.is_error()) {
        return Err<std::unique_ptr<ChunkWriter>>(res.error());
    }

    const auto final_path = chunk_path(fingerprint, index);
    auto temp_path = final_path;
    temp_path += ".part." + std::to_string(temp_counter_.fetch_add(1));

    std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return Err<std::unique_ptr<ChunkWriter>>(ErrorCode::IoFailure,
                                                "failed to create chunk file: " + temp_path.string());
    }

    return Ok(std::make_unique<ChunkWriter>(std::move(temp_path), final_path, std::move(stream)));
}

Result<bool> StagingArea::remove_chunk(const std::string& fingerprint, std::uint32_t index) {
    const auto path = chunk_path(fingerprint, index);
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        return Err<bool>(ErrorCode::IoFailure, "failed to delete chunk " + path.string() + ": " + ec.message());
    }
    return Ok(removed);
}

Result<std::size_t> StagingArea::remove_chunk_set(const std::string& fingerprint) {
    auto indices = list_indices(fingerprint);
    if (indices.is_error()) {
        return Err<std::size_t>(indices.error());
    }

    const auto dir = chunk_set_path(fingerprint);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return Err<std::size_t>(ErrorCode::IoFailure, "failed to delete chunk set " + dir.string() + ": " + ec.message());
    }
    return Ok(indices.value().size());
}

Result<void> StagingArea::remove_chunk_set_if_empty(const std::string& fingerprint) {
    const auto dir = chunk_set_path(fingerprint);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Ok();
    }
    if (fs::is_empty(dir, ec) && !ec) {
        // Fails harmlessly if a writer dropped a file in meanwhile
        fs::remove(dir, ec);
    }
    return Ok();
}

Result<std::vector<ChunkSetInfo>> StagingArea::list_chunk_sets() const {
    std::vector<ChunkSetInfo> sets;

    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        return Err<std::vector<ChunkSetInfo>>(ErrorCode::IoFailure,
                                             "failed to list staging root " + root_.string() + ": " + ec.message());
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return Err<std::vector<ChunkSetInfo>>(ErrorCode::IoFailure,
                                                 "failed to list staging root: " + ec.message());
        }
        if (!it->is_directory(ec)) {
            continue;
        }

        ChunkSetInfo info;
        info.fingerprint = it->path().filename().string();
        info.last_activity = fs::last_write_time(it->path(), ec);

        std::error_code inner_ec;
        fs::directory_iterator entry(it->path(), inner_ec);
        for (; !inner_ec && entry != fs::directory_iterator(); entry.increment(inner_ec)) {
            std::error_code time_ec;
            const auto written = entry->last_write_time(time_ec);
            if (!time_ec && written > info.last_activity) {
                info.last_activity = written;
            }
            if (parse_chunk_index(entry->path().filename().string()).is_ok()) {
                ++info.chunk_count;
            }
        }
        sets.push_back(std::move(info));
    }

    return Ok(std::move(sets));
}

} // namespace chunked::storage
