#include "chunked/client/orchestrator.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <map>
#include <mutex>

using namespace chunked;
using chunked::client::FileProgress;
using chunked::client::OrchestratorOptions;
using chunked::client::RemoteStatus;
using chunked::client::UploadOrchestrator;
using chunked::client::UploadState;
using chunked::test_support::TempDir;

namespace {

/**
 * In-memory server double: keeps chunks in a map and answers from it
 */
class ScriptedTransport : public client::UploadTransport {
public:
    RemoteStatus status;
    std::optional<Error> status_error;
    std::optional<Error> merge_error;
    std::vector<Error> merge_failures;  // consumed before merge_error
    std::function<void()> on_merge;     // runs under the transport lock
    std::map<std::uint32_t, std::vector<ErrorCode>> chunk_errors;  // consumed front to back

    Result<RemoteStatus> check_status(const std::string&, const std::string&,
                                      const CancellationToken*) override {
        std::lock_guard lock(mutex);
        ++status_calls;
        if (status_error) {
            return Err<RemoteStatus>(*status_error);
        }
        return Ok(status);
    }

    Result<void> upload_chunk(const std::string&, std::uint32_t index,
                              const std::vector<std::uint8_t>& bytes,
                              const client::ChunkProgressFn& on_progress,
                              const CancellationToken*) override {
        {
            std::lock_guard lock(mutex);
            ++attempts[index];
            auto it = chunk_errors.find(index);
            if (it != chunk_errors.end() && !it->second.empty()) {
                const auto code = it->second.front();
                it->second.erase(it->second.begin());
                return Err<void>(code, "scripted failure");
            }
        }
        if (on_progress) {
            on_progress(bytes.size() / 2, bytes.size());
            on_progress(bytes.size(), bytes.size());
        }
        std::lock_guard lock(mutex);
        received[index] = bytes;
        return Ok();
    }

    Result<std::string> merge(const std::string&, const std::string& artifact_name,
                              std::uint32_t total_chunks, std::uint64_t,
                              const CancellationToken*) override {
        std::lock_guard lock(mutex);
        ++merge_calls;
        merged_total = total_chunks;
        if (on_merge) {
            on_merge();
        }
        if (!merge_failures.empty()) {
            auto failure = merge_failures.front();
            merge_failures.erase(merge_failures.begin());
            return Err<std::string>(std::move(failure));
        }
        if (merge_error) {
            return Err<std::string>(*merge_error);
        }
        return Ok("/uploads/" + artifact_name);
    }

    Result<bool> cleanup_chunk(const std::string&, std::uint32_t index) override {
        std::lock_guard lock(mutex);
        cleaned.push_back(index);
        return Ok(true);
    }

    Result<std::size_t> abandon(const std::string&) override {
        return Ok(std::size_t{0});
    }

    std::vector<std::uint8_t> reassembled() const {
        std::vector<std::uint8_t> out;
        for (const auto& [index, bytes] : received) {
            out.insert(out.end(), bytes.begin(), bytes.end());
        }
        return out;
    }

    std::mutex mutex;
    int status_calls = 0;
    int merge_calls = 0;
    std::uint32_t merged_total = 0;
    std::map<std::uint32_t, int> attempts;
    std::map<std::uint32_t, std::vector<std::uint8_t>> received;
    std::vector<std::uint32_t> cleaned;
};

OrchestratorOptions small_chunks() {
    OrchestratorOptions options;
    options.chunk_size = 1000;
    options.max_concurrent_uploads = 3;
    options.max_chunk_attempts = 3;
    options.retry_backoff = std::chrono::milliseconds(1);
    return options;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        payload = test_support::make_payload(4500);
        test_support::write_file(file, payload);
    }

    TempDir dir;
    std::filesystem::path file = dir / "report.pdf";
    std::vector<std::uint8_t> payload;
    ScriptedTransport transport;
};

TEST_F(OrchestratorTest, UploadsEveryChunkThenMerges) {
    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    ASSERT_TRUE(outcome.succeeded()) << outcome.error->message;
    EXPECT_EQ(outcome.state, UploadState::Success);
    EXPECT_EQ(outcome.artifact_name, "report.pdf");
    EXPECT_EQ(outcome.location, "/uploads/report.pdf");
    EXPECT_EQ(outcome.fingerprint.size(), 64u);
    EXPECT_EQ(outcome.chunks_total, 5u);
    EXPECT_EQ(outcome.chunks_uploaded, 5u);
    EXPECT_EQ(transport.merge_calls, 1);
    EXPECT_EQ(transport.merged_total, 5u);
    EXPECT_EQ(transport.reassembled(), payload);
}

TEST_F(OrchestratorTest, ExplicitArtifactNameWins) {
    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file, "renamed.pdf");
    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.location, "/uploads/renamed.pdf");
}

TEST_F(OrchestratorTest, FastPathSendsNothing) {
    transport.status.exists = true;
    transport.status.location = "/uploads/elsewhere.pdf";

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    EXPECT_EQ(outcome.state, UploadState::FastSuccess);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.location, "/uploads/elsewhere.pdf");
    EXPECT_TRUE(transport.attempts.empty());
    EXPECT_EQ(transport.merge_calls, 0);
}

TEST_F(OrchestratorTest, ResumeSkipsStoredChunks) {
    transport.status.stored_indices = {0, 2, 4};

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.chunks_uploaded, 2u);
    EXPECT_EQ(transport.attempts.size(), 2u);
    EXPECT_EQ(transport.attempts.count(1), 1u);
    EXPECT_EQ(transport.attempts.count(3), 1u);
}

TEST_F(OrchestratorTest, StoredIndicesBeyondPlanAreDiscarded) {
    transport.status.stored_indices = {0, 9};

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(transport.cleaned, std::vector<std::uint32_t>{9});
    EXPECT_EQ(outcome.chunks_uploaded, 4u);
}

TEST_F(OrchestratorTest, TransientFailuresAreRetried) {
    transport.chunk_errors[2] = {ErrorCode::Transport, ErrorCode::Timeout};

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(transport.attempts[2], 3);
    EXPECT_EQ(transport.reassembled(), payload);
}

TEST_F(OrchestratorTest, GivesUpAfterMaxAttempts) {
    transport.chunk_errors[1] = {ErrorCode::Transport, ErrorCode::Transport, ErrorCode::Transport};

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    EXPECT_EQ(outcome.state, UploadState::Error);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::Transport);
    EXPECT_EQ(transport.attempts[1], 3);
    EXPECT_EQ(transport.merge_calls, 0);
}

TEST_F(OrchestratorTest, PermanentFailureIsNotRetried) {
    transport.chunk_errors[0] = {ErrorCode::ChunkTooLarge};

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    EXPECT_EQ(outcome.state, UploadState::Error);
    EXPECT_EQ(outcome.error->code, ErrorCode::ChunkTooLarge);
    EXPECT_EQ(transport.attempts[0], 1);
    EXPECT_EQ(transport.merge_calls, 0);
}

TEST_F(OrchestratorTest, StatusFailureStopsBeforeUploading) {
    transport.status_error = Error(ErrorCode::Transport, "connection refused");

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    EXPECT_EQ(outcome.state, UploadState::Error);
    EXPECT_TRUE(transport.attempts.empty());
}

TEST_F(OrchestratorTest, MergeFailureIsReported) {
    transport.merge_error = Error(ErrorCode::Timeout, "merge took too long");

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    EXPECT_EQ(outcome.state, UploadState::Error);
    EXPECT_EQ(outcome.error->code, ErrorCode::Timeout);
    EXPECT_EQ(transport.merge_calls, 1);
}

TEST_F(OrchestratorTest, BusyMergeIsRetried) {
    const Error busy(ErrorCode::MergeInProgress, "fingerprint is busy");
    transport.merge_failures = {busy, busy};

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    ASSERT_TRUE(outcome.succeeded()) << outcome.error->message;
    EXPECT_EQ(outcome.location, "/uploads/report.pdf");
    EXPECT_EQ(transport.merge_calls, 3);
    EXPECT_EQ(outcome.chunks_uploaded, 5u);
}

TEST_F(OrchestratorTest, GivesUpWhenMergeStaysBusy) {
    transport.merge_error = Error(ErrorCode::MergeInProgress, "fingerprint is busy");

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    EXPECT_EQ(outcome.state, UploadState::Error);
    EXPECT_EQ(outcome.error->code, ErrorCode::MergeInProgress);
    EXPECT_EQ(transport.merge_calls, 3);
}

TEST_F(OrchestratorTest, RecoveryFinishesWhenContentWasAssembledMeanwhile) {
    transport.merge_failures = {Error::count_mismatch(5, 3)};
    transport.on_merge = [this]() {
        transport.status.exists = true;
        transport.status.location = "/uploads/elsewhere.pdf";
    };

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(file);

    ASSERT_TRUE(outcome.succeeded()) << outcome.error->message;
    EXPECT_EQ(outcome.state, UploadState::Success);
    EXPECT_EQ(outcome.location, "/uploads/elsewhere.pdf");
    EXPECT_EQ(transport.merge_calls, 1);
    EXPECT_EQ(outcome.chunks_uploaded, 5u);
    for (const auto& [index, count] : transport.attempts) {
        EXPECT_EQ(count, 1) << "chunk " << index;
    }
}

TEST_F(OrchestratorTest, MissingFileFailsWithoutContactingServer) {
    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(dir / "absent.bin");

    EXPECT_EQ(outcome.state, UploadState::Error);
    EXPECT_EQ(outcome.error->code, ErrorCode::IoFailure);
    EXPECT_EQ(transport.status_calls, 0);
}

TEST_F(OrchestratorTest, EmptyFileMergesZeroChunks) {
    const auto empty = dir / "empty.txt";
    test_support::write_file(empty, std::vector<std::uint8_t>{});

    UploadOrchestrator orchestrator(transport, small_chunks());
    auto outcome = orchestrator.upload_file(empty);

    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.chunks_total, 0u);
    EXPECT_EQ(transport.merged_total, 0u);
}

TEST_F(OrchestratorTest, ProgressNeverGoesBackwards) {
    transport.chunk_errors[3] = {ErrorCode::Transport};

    std::vector<FileProgress> seen;
    UploadOrchestrator orchestrator(transport, small_chunks());
    orchestrator.set_progress_callback([&seen](const FileProgress& p) { seen.push_back(p); });

    auto outcome = orchestrator.upload_file(file);
    ASSERT_TRUE(outcome.succeeded());
    ASSERT_FALSE(seen.empty());

    for (std::size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i].percent, seen[i - 1].percent) << "report " << i;
    }
    EXPECT_EQ(seen.front().state, UploadState::Checking);
    EXPECT_EQ(seen.back().state, UploadState::Success);
    EXPECT_DOUBLE_EQ(seen.back().percent, 100.0);
    EXPECT_EQ(seen.back().chunks_total, 5u);
}

TEST_F(OrchestratorTest, OptionsFollowClientConfig) {
    ClientConfig config;
    config.chunk_size = 1234;
    config.max_concurrent_uploads = 7;
    config.max_chunk_attempts = 2;

    const auto options = client::orchestrator_options(config);
    EXPECT_EQ(options.chunk_size, 1234u);
    EXPECT_EQ(options.max_concurrent_uploads, 7u);
    EXPECT_EQ(options.max_chunk_attempts, 2u);
}
