#include "chunked/client/orchestrator.hpp"

#include "chunked/client/fingerprint.hpp"
#include "chunked/core/work_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <thread>

namespace chunked::client {

namespace fs = std::filesystem;

namespace {

constexpr auto kCancelPoll = std::chrono::milliseconds(20);

// Sleep for `delay`; RETURNS false if the token tripped meanwhile
bool wait_unless_cancelled(const CancellationToken& token, std::chrono::milliseconds delay) {
    const auto until = std::chrono::steady_clock::now() + delay;
    while (!token.is_cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) {
            return true;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(kCancelPoll, until - now));
    }
    return false;
}

double stored_percent(const UploadSession& session) {
    const auto total = session.chunks().size();
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(session.stored_count()) * 100.0 / static_cast<double>(total);
}

} // namespace

OrchestratorOptions orchestrator_options(const ClientConfig& config) {
    OrchestratorOptions options;
    options.chunk_size = config.chunk_size;
    options.max_concurrent_uploads = config.max_concurrent_uploads;
    options.max_chunk_attempts = config.max_chunk_attempts;
    return options;
}

// ──────────────────────────────────────────────────────────
// ChunkRun: bookkeeping shared by the workers of one upload round
// ──────────────────────────────────────────────────────────

class UploadOrchestrator::ChunkRun {
public:
    ChunkRun(UploadOrchestrator& owner, UploadSession& session, std::size_t file_index)
        : owner_(owner),
          session_(session),
          file_index_(file_index),
          total_(static_cast<std::uint32_t>(session.chunks().size())),
          done_(static_cast<std::uint32_t>(session.stored_count())) {
    }

    bool should_stop() const {
        std::lock_guard lock(mutex_);
        return failure_.has_value() || session_.token().is_cancelled();
    }

    void send(const ChunkRange& range) {
        auto bytes = read_chunk(session_.file(), range);
        if (bytes.is_error()) {
            on_failed(bytes.error());
            return;
        }

        const auto& token = session_.token();
        const auto attempts = std::max<std::size_t>(1, owner_.options_.max_chunk_attempts);

        for (std::size_t attempt = 1;; ++attempt) {
            if (token.is_cancelled()) {
                return;
            }

            auto sent = owner_.transport_.upload_chunk(
                session_.fingerprint(), range.index, bytes.value(),
                [this, &range](std::uint64_t so_far, std::uint64_t length) {
                    on_progress(range.index, so_far, length);
                },
                &token);

            if (sent.is_ok()) {
                on_stored(range.index);
                return;
            }

            const auto& error = sent.error();
            if (token.is_cancelled()) {
                on_interrupted(range.index);
                return;
            }
            if (!is_retryable(error.code) || attempt >= attempts) {
                spdlog::error("Chunk {} of {} failed after {} attempt(s): {}",
                              range.index, session_.file().string(), attempt, error.message);
                on_failed(error);
                return;
            }

            spdlog::warn("Chunk {} of {} failed (attempt {}/{}): {}; retrying",
                         range.index, session_.file().string(), attempt, attempts, error.message);
            on_progress(range.index, 0, range.length);
            if (!wait_unless_cancelled(token, owner_.options_.retry_backoff * static_cast<int>(attempt))) {
                return;
            }
        }
    }

    std::vector<std::uint32_t> stored() const {
        std::lock_guard lock(mutex_);
        return stored_;
    }

    std::vector<std::uint32_t> interrupted() const {
        std::lock_guard lock(mutex_);
        return interrupted_;
    }

    std::optional<Error> failure() const {
        std::lock_guard lock(mutex_);
        return failure_;
    }

private:
    // Reports are made under the lock so they reach the callback in order
    void on_progress(std::uint32_t index, std::uint64_t sent, std::uint64_t length) {
        std::lock_guard lock(mutex_);
        partial_[index] = length == 0 ? 0.0 : static_cast<double>(sent) * 100.0 / static_cast<double>(length);
        owner_.report(session_, file_index_, percent_locked(), done_);
    }

    void on_stored(std::uint32_t index) {
        std::lock_guard lock(mutex_);
        partial_.erase(index);
        stored_.push_back(index);
        ++done_;
        spdlog::debug("Chunk {} of {} stored ({}/{})", index, session_.file().string(), done_, total_);
        owner_.report(session_, file_index_, percent_locked(), done_);
    }

    void on_interrupted(std::uint32_t index) {
        std::lock_guard lock(mutex_);
        partial_.erase(index);
        interrupted_.push_back(index);
    }

    void on_failed(const Error& error) {
        std::lock_guard lock(mutex_);
        if (!failure_) {
            failure_ = error;
        }
    }

    // Weighted by chunk count; never reported lower than before
    double percent_locked() {
        if (total_ == 0) {
            return 100.0;
        }
        double sum = static_cast<double>(done_) * 100.0;
        for (const auto& [index, partial] : partial_) {
            sum += partial;
        }
        high_water_ = std::max(high_water_, std::min(100.0, sum / total_));
        return high_water_;
    }

    UploadOrchestrator& owner_;
    UploadSession& session_;
    std::size_t file_index_;
    std::uint32_t total_;

    mutable std::mutex mutex_;
    std::uint32_t done_;
    std::map<std::uint32_t, double> partial_;
    std::vector<std::uint32_t> stored_;
    std::vector<std::uint32_t> interrupted_;
    std::optional<Error> failure_;
    double high_water_ = 0.0;
};

// ──────────────────────────────────────────────────────────
// UploadOrchestrator
// ──────────────────────────────────────────────────────────

UploadOrchestrator::UploadOrchestrator(UploadTransport& transport, OrchestratorOptions options)
    : transport_(transport),
      options_(options) {
}

UploadOutcome UploadOrchestrator::upload_file(const fs::path& file, const std::string& artifact_name) {
    cancelled_ = false;
    return run_file(file, artifact_name, 0);
}

std::vector<UploadOutcome> UploadOrchestrator::upload_batch(const std::vector<fs::path>& files) {
    cancelled_ = false;

    std::vector<UploadOutcome> outcomes;
    outcomes.reserve(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (cancelled_) {
            UploadOutcome skipped;
            skipped.file = files[i].string();
            skipped.artifact_name = files[i].filename().string();
            skipped.state = UploadState::Cancelled;
            skipped.error = Error(ErrorCode::Cancelled, "batch cancelled before this file started");
            outcomes.push_back(std::move(skipped));
            continue;
        }
        outcomes.push_back(run_file(files[i], {}, i));
    }
    return outcomes;
}

void UploadOrchestrator::cancel() {
    cancelled_ = true;

    std::lock_guard lock(active_mutex_);
    if (active_) {
        spdlog::info("Cancelling upload of {}", active_->file().string());
        active_->token().cancel();
    }
}

UploadOutcome UploadOrchestrator::run_file(const fs::path& file, const std::string& artifact_name,
                                           std::size_t file_index) {
    UploadSession session(file, artifact_name.empty() ? file.filename().string() : artifact_name);

    UploadOutcome outcome;
    outcome.file = file.string();
    outcome.artifact_name = session.artifact_name();

    {
        std::lock_guard lock(active_mutex_);
        active_ = &session;
        if (cancelled_) {
            session.token().cancel();
        }
    }

    drive(session, file_index, outcome);

    {
        std::lock_guard lock(active_mutex_);
        active_ = nullptr;
    }

    outcome.state = session.state();
    outcome.location = session.location();
    outcome.chunks_total = static_cast<std::uint32_t>(session.chunks().size());
    return outcome;
}

void UploadOrchestrator::drive(UploadSession& session, std::size_t file_index, UploadOutcome& outcome) {
    enter(session, file_index, UploadState::Checking, 0.0);
    auto& token = session.token();

    std::error_code ec;
    const auto file_size = fs::file_size(session.file(), ec);
    if (ec) {
        finish_failed(session, file_index,
                      Error(ErrorCode::IoFailure, "cannot stat " + session.file().string() + ": " + ec.message()),
                      outcome);
        return;
    }

    auto fingerprint = fingerprint_file(session.file(), &token);
    if (fingerprint.is_error()) {
        if (token.is_cancelled()) {
            finish_cancelled(session, file_index, {}, outcome);
        } else {
            finish_failed(session, file_index, fingerprint.error(), outcome);
        }
        return;
    }
    session.set_fingerprint(fingerprint.value());
    outcome.fingerprint = fingerprint.value();

    auto plan = split_into_chunks(file_size, options_.chunk_size);
    if (plan.is_error()) {
        finish_failed(session, file_index, plan.error(), outcome);
        return;
    }
    session.set_plan(file_size, std::move(plan.value()));

    auto status = transport_.check_status(session.fingerprint(), session.artifact_name(), &token);
    if (status.is_error()) {
        if (token.is_cancelled()) {
            finish_cancelled(session, file_index, {}, outcome);
        } else {
            finish_failed(session, file_index, status.error(), outcome);
        }
        return;
    }

    if (status.value().exists) {
        session.set_location(status.value().location);
        spdlog::info("{} already on the server at {}", session.file().string(), session.location());
        enter(session, file_index, UploadState::FastSuccess, 100.0);
        return;
    }

    apply_stored(session, status.value().stored_indices);
    if (session.stored_count() > 0) {
        spdlog::info("Resuming {}: {}/{} chunks already stored",
                     session.file().string(), session.stored_count(), session.chunks().size());
    }

    enter(session, file_index, UploadState::Uploading, stored_percent(session));

    std::vector<std::uint32_t> interrupted;
    if (auto sent = upload_missing(session, file_index, outcome, interrupted); sent.is_error()) {
        if (token.is_cancelled()) {
            finish_cancelled(session, file_index, interrupted, outcome);
        } else {
            finish_failed(session, file_index, sent.error(), outcome);
        }
        return;
    }

    enter(session, file_index, UploadState::Merging, 100.0);

    bool recovered = false;
    std::size_t busy_attempts = 0;
    const auto max_busy = std::max<std::size_t>(1, options_.max_chunk_attempts);
    for (;;) {
        if (token.is_cancelled()) {
            finish_cancelled(session, file_index, {}, outcome);
            return;
        }

        auto merged = transport_.merge(session.fingerprint(), session.artifact_name(),
                                       static_cast<std::uint32_t>(session.chunks().size()),
                                       session.file_size(), &token);
        if (merged.is_ok()) {
            session.set_location(merged.value());
            spdlog::info("Uploaded {} -> {}", session.file().string(), session.location());
            enter(session, file_index, UploadState::Success, 100.0);
            return;
        }

        const auto& error = merged.error();
        if (token.is_cancelled()) {
            finish_cancelled(session, file_index, {}, outcome);
            return;
        }
        // Another upload or merge of the same content holds the fingerprint
        if (error.code == ErrorCode::MergeInProgress && ++busy_attempts < max_busy) {
            spdlog::warn("Merge of {} refused while the content is busy (attempt {}/{}); retrying",
                         session.file().string(), busy_attempts, max_busy);
            if (!wait_unless_cancelled(token, options_.retry_backoff * static_cast<int>(busy_attempts))) {
                finish_cancelled(session, file_index, {}, outcome);
                return;
            }
            continue;
        }
        if (error.code != ErrorCode::ChunkCountMismatch || recovered) {
            finish_failed(session, file_index, error, outcome);
            return;
        }

        recovered = true;
        spdlog::warn("Merge of {} saw {} of {} chunks; re-sending the missing ones",
                     session.file().string(), error.actual, error.expected);

        auto refreshed = refresh_stored(session);
        if (refreshed.is_error()) {
            if (token.is_cancelled()) {
                finish_cancelled(session, file_index, {}, outcome);
            } else {
                finish_failed(session, file_index, refreshed.error(), outcome);
            }
            return;
        }
        if (refreshed.value()) {
            spdlog::info("{} was assembled meanwhile at {}", session.file().string(), session.location());
            enter(session, file_index, UploadState::Success, 100.0);
            return;
        }

        interrupted.clear();
        if (auto sent = upload_missing(session, file_index, outcome, interrupted); sent.is_error()) {
            if (token.is_cancelled()) {
                finish_cancelled(session, file_index, interrupted, outcome);
            } else {
                finish_failed(session, file_index, sent.error(), outcome);
            }
            return;
        }
    }
}

Result<void> UploadOrchestrator::upload_missing(UploadSession& session, std::size_t file_index,
                                                UploadOutcome& outcome,
                                                std::vector<std::uint32_t>& interrupted) {
    const auto missing = session.missing_chunks();
    if (missing.empty()) {
        return Ok();
    }

    ChunkRun run(*this, session, file_index);

    WorkQueue<ChunkRange> queue;
    for (const auto& range : missing) {
        queue.push(range);
    }
    queue.close();

    const auto worker_count = std::min(std::max<std::size_t>(1, options_.max_concurrent_uploads), missing.size());
    spdlog::debug("Sending {} chunk(s) of {} on {} worker(s)", missing.size(), session.file().string(), worker_count);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([&run, &queue]() {
            while (auto range = queue.pop()) {
                if (run.should_stop()) {
                    continue;
                }
                run.send(*range);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (auto index : run.stored()) {
        session.mark_stored(index);
        ++outcome.chunks_uploaded;
    }
    const auto cut = run.interrupted();
    interrupted.insert(interrupted.end(), cut.begin(), cut.end());

    if (session.token().is_cancelled()) {
        return Err<void>(ErrorCode::Cancelled, "upload cancelled");
    }
    if (auto failure = run.failure()) {
        return Err<void>(*failure);
    }
    return Ok();
}

void UploadOrchestrator::apply_stored(UploadSession& session, const std::vector<std::uint32_t>& indices) {
    const auto planned = session.chunks().size();
    for (auto index : indices) {
        if (index < planned) {
            session.mark_stored(index);
            continue;
        }
        spdlog::warn("Server holds chunk {} of {} beyond the {}-chunk plan; discarding it",
                     index, session.fingerprint(), planned);
        auto discarded = transport_.cleanup_chunk(session.fingerprint(), index);
        if (discarded.is_error()) {
            spdlog::warn("Could not discard chunk {}: {}", index, discarded.error().message);
        }
    }
}

Result<bool> UploadOrchestrator::refresh_stored(UploadSession& session) {
    auto status = transport_.check_status(session.fingerprint(), session.artifact_name(), &session.token());
    if (status.is_error()) {
        return Err<bool>(status.error());
    }
    if (status.value().exists) {
        session.set_location(status.value().location);
        return Ok(true);
    }
    session.clear_stored();
    apply_stored(session, status.value().stored_indices);
    return Ok(false);
}

void UploadOrchestrator::finish_cancelled(UploadSession& session, std::size_t file_index,
                                          const std::vector<std::uint32_t>& interrupted,
                                          UploadOutcome& outcome) {
    for (auto index : interrupted) {
        auto discarded = transport_.cleanup_chunk(session.fingerprint(), index);
        if (discarded.is_error()) {
            spdlog::warn("Cleanup of interrupted chunk {} of {} failed: {}",
                         index, session.fingerprint(), discarded.error().message);
        }
    }

    outcome.error = Error(ErrorCode::Cancelled, "upload cancelled");
    spdlog::info("Upload of {} cancelled ({} interrupted chunk(s) cleaned up)",
                 session.file().string(), interrupted.size());
    enter(session, file_index, UploadState::Cancelled, stored_percent(session));
}

void UploadOrchestrator::finish_failed(UploadSession& session, std::size_t file_index, const Error& error,
                                       UploadOutcome& outcome) {
    outcome.error = error;
    spdlog::error("Upload of {} failed: [{}] {}", session.file().string(), error_code_name(error.code), error.message);

    if (auto res = session.mark_failed(error.message); res.is_error()) {
        spdlog::error("{}", res.error().message);
    }
    report(session, file_index, stored_percent(session), static_cast<std::uint32_t>(session.stored_count()));
}

void UploadOrchestrator::enter(UploadSession& session, std::size_t file_index, UploadState state, double percent) {
    if (auto res = session.transition_to(state); res.is_error()) {
        spdlog::error("{}", res.error().message);
        return;
    }
    report(session, file_index, percent, static_cast<std::uint32_t>(session.stored_count()));
}

void UploadOrchestrator::report(const UploadSession& session, std::size_t file_index, double percent,
                                std::uint32_t chunks_done) {
    std::lock_guard lock(progress_mutex_);
    if (!progress_) {
        return;
    }

    FileProgress progress;
    progress.file_index = file_index;
    progress.file = session.file().string();
    progress.state = session.state();
    progress.percent = percent;
    progress.chunks_done = chunks_done;
    progress.chunks_total = static_cast<std::uint32_t>(session.chunks().size());
    progress_(progress);
}

} // namespace chunked::client
