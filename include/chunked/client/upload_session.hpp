#pragma once

#include "chunked/client/chunk_splitter.hpp"
#include "chunked/core/cancellation.hpp"
#include "chunked/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace chunked::client {

enum class UploadState {
    Waiting,
    Checking,
    FastSuccess,
    Uploading,
    Merging,
    Success,
    Error,
    Cancelled
};

const char* upload_state_name(UploadState state);

/// FastSuccess, Success, Error and Cancelled admit no further transition
bool is_terminal(UploadState state);

/**
 * @brief One file's transfer: identity, chunk plan, confirmed chunks, state
 *
 * Owned by the orchestrator thread. Worker threads never touch a session
 * directly; they report back and the orchestrator records the outcome.
 */
class UploadSession {
public:
    UploadSession(std::filesystem::path file, std::string artifact_name);

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }
    [[nodiscard]] const std::string& artifact_name() const noexcept { return artifact_name_; }
    [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] UploadState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::string& location() const noexcept { return location_; }
    [[nodiscard]] const std::vector<ChunkRange>& chunks() const noexcept { return chunks_; }
    [[nodiscard]] std::uint64_t file_size() const noexcept { return file_size_; }

    [[nodiscard]] CancellationToken& token() noexcept { return token_; }

    void set_fingerprint(std::string fingerprint) { fingerprint_ = std::move(fingerprint); }
    void set_plan(std::uint64_t file_size, std::vector<ChunkRange> chunks);
    void set_location(std::string location) { location_ = std::move(location); }

    void mark_stored(std::uint32_t index) { stored_.insert(index); }
    void clear_stored() { stored_.clear(); }
    [[nodiscard]] bool is_stored(std::uint32_t index) const { return stored_.count(index) != 0; }
    [[nodiscard]] std::size_t stored_count() const noexcept { return stored_.size(); }

    /// Chunks of the plan not yet confirmed stored, in index order
    [[nodiscard]] std::vector<ChunkRange> missing_chunks() const;

    Result<void> transition_to(UploadState next_state);
    Result<void> mark_failed(std::string error_message);

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(UploadState target) const noexcept;

    std::filesystem::path file_;
    std::string artifact_name_;
    std::string fingerprint_;
    std::uint64_t file_size_ = 0;
    std::vector<ChunkRange> chunks_;
    std::set<std::uint32_t> stored_;
    std::string location_;
    std::string last_error_;
    UploadState state_ = UploadState::Waiting;
    CancellationToken token_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace chunked::client
