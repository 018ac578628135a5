#pragma once

#include "chunked/client/chunk_splitter.hpp"
#include "chunked/client/transport.hpp"
#include "chunked/client/upload_session.hpp"
#include "chunked/core/config.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunked::client {

struct OrchestratorOptions {
    std::uint64_t chunk_size = kDefaultChunkSize;
    std::size_t max_concurrent_uploads = 3;
    /// Attempts per chunk, first one included
    std::size_t max_chunk_attempts = 3;
    /// Wait before retry n is n * retry_backoff
    std::chrono::milliseconds retry_backoff{250};
};

OrchestratorOptions orchestrator_options(const ClientConfig& config);

/**
 * @brief Snapshot handed to the progress callback
 */
struct FileProgress {
    std::size_t file_index = 0;
    std::string file;
    UploadState state = UploadState::Waiting;
    double percent = 0.0;
    std::uint32_t chunks_done = 0;
    std::uint32_t chunks_total = 0;
};

using ProgressCallback = std::function<void(const FileProgress&)>;

/**
 * @brief Final result of one file
 */
struct UploadOutcome {
    std::string file;
    std::string artifact_name;
    std::string fingerprint;
    UploadState state = UploadState::Waiting;
    std::string location;
    std::optional<Error> error;
    /// Chunks actually sent in this run (resumed ones excluded)
    std::uint32_t chunks_uploaded = 0;
    std::uint32_t chunks_total = 0;

    [[nodiscard]] bool succeeded() const {
        return state == UploadState::Success || state == UploadState::FastSuccess;
    }
};

/**
 * @brief Drives files through check -> upload -> merge
 *
 * PER FILE:
 *   1. fingerprint the content, plan the chunks
 *   2. ask the server what it already has; an existing artifact ends the
 *      file in fast_success without sending a byte
 *   3. send the missing chunks on at most `max_concurrent_uploads` workers,
 *      retrying retryable failures
 *   4. merge; on a count mismatch re-query, fill the gaps, merge once more
 *
 * CANCELLATION: cancel() trips the running file's token, which aborts every
 * in-flight chunk. Each interrupted index gets a cleanup request, no merge is
 * sent afterwards, and the file ends in `cancelled`. Files of a batch that
 * have not started yet are reported cancelled without being contacted.
 *
 * THREAD SAFETY: cancel() may be called from any thread (a signal watcher,
 * a UI). upload_file()/upload_batch() must not run concurrently on the same
 * orchestrator. The progress callback is invoked from worker threads, one
 * call at a time.
 */
class UploadOrchestrator {
public:
    explicit UploadOrchestrator(UploadTransport& transport, OrchestratorOptions options = {});

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * @brief Upload one file; `artifact_name` defaults to the file name
     */
    UploadOutcome upload_file(const std::filesystem::path& file, const std::string& artifact_name = {});

    /// Files are processed one after another, in order
    std::vector<UploadOutcome> upload_batch(const std::vector<std::filesystem::path>& files);

    void cancel();

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    class ChunkRun;

    UploadOutcome run_file(const std::filesystem::path& file, const std::string& artifact_name,
                           std::size_t file_index);
    void drive(UploadSession& session, std::size_t file_index, UploadOutcome& outcome);

    /**
     * @brief Send every missing chunk
     *
     * RETURNS: the first fatal error, Cancelled included. Indices whose
     *          transfer was cut short are appended to `interrupted`.
     */
    Result<void> upload_missing(UploadSession& session, std::size_t file_index, UploadOutcome& outcome,
                                std::vector<std::uint32_t>& interrupted);

    /// Record the server's stored indices; ones outside the plan are discarded remotely
    void apply_stored(UploadSession& session, const std::vector<std::uint32_t>& indices);

    /**
     * @brief Re-query the server and replace the session's stored set with its answer
     *
     * RETURNS: true when the content is already assembled; the session's
     *          location is then set from the status reply.
     */
    Result<bool> refresh_stored(UploadSession& session);

    void finish_cancelled(UploadSession& session, std::size_t file_index,
                          const std::vector<std::uint32_t>& interrupted, UploadOutcome& outcome);
    void finish_failed(UploadSession& session, std::size_t file_index, const Error& error,
                       UploadOutcome& outcome);

    void report(const UploadSession& session, std::size_t file_index, double percent,
                std::uint32_t chunks_done);
    void enter(UploadSession& session, std::size_t file_index, UploadState state, double percent);

    UploadTransport& transport_;
    OrchestratorOptions options_;
    ProgressCallback progress_;
    std::mutex progress_mutex_;

    std::atomic<bool> cancelled_{false};
    std::mutex active_mutex_;
    UploadSession* active_ = nullptr;
};

} // namespace chunked::client
