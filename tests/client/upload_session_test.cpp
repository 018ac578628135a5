#include "chunked/client/upload_session.hpp"

#include <gtest/gtest.h>

using chunked::client::ChunkRange;
using chunked::client::UploadSession;
using chunked::client::UploadState;

namespace {

std::vector<ChunkRange> three_chunks() {
    return chunked::client::split_into_chunks(25, 10).value();
}

} // namespace

TEST(UploadSessionTest, StartsWaiting) {
    UploadSession session{"/tmp/a.bin", "a.bin"};
    EXPECT_EQ(session.state(), UploadState::Waiting);
    EXPECT_EQ(session.artifact_name(), "a.bin");
    EXPECT_FALSE(session.token().is_cancelled());
}

TEST(UploadSessionTest, FullPathToSuccess) {
    UploadSession session{"/tmp/a.bin", "a.bin"};
    EXPECT_TRUE(session.transition_to(UploadState::Checking).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Uploading).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Merging).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Success).is_ok());

    EXPECT_TRUE(session.transition_to(UploadState::Uploading).is_error());
    EXPECT_TRUE(session.transition_to(UploadState::Cancelled).is_error());
}

TEST(UploadSessionTest, FastPathSkipsUploading) {
    UploadSession session{"/tmp/a.bin", "a.bin"};
    ASSERT_TRUE(session.transition_to(UploadState::Checking).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::FastSuccess).is_ok());
    EXPECT_TRUE(chunked::client::is_terminal(session.state()));
    EXPECT_TRUE(session.transition_to(UploadState::Merging).is_error());
}

TEST(UploadSessionTest, RejectsSkippingStates) {
    UploadSession session{"/tmp/a.bin", "a.bin"};
    EXPECT_TRUE(session.transition_to(UploadState::Uploading).is_error());
    EXPECT_TRUE(session.transition_to(UploadState::Error).is_error());

    ASSERT_TRUE(session.transition_to(UploadState::Checking).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Merging).is_error());
    EXPECT_TRUE(session.transition_to(UploadState::Success).is_error());
}

TEST(UploadSessionTest, CancelFromActiveStates) {
    for (auto active : {UploadState::Checking, UploadState::Uploading, UploadState::Merging}) {
        UploadSession session{"/tmp/a.bin", "a.bin"};
        ASSERT_TRUE(session.transition_to(UploadState::Checking).is_ok());
        if (active != UploadState::Checking) {
            ASSERT_TRUE(session.transition_to(UploadState::Uploading).is_ok());
        }
        if (active == UploadState::Merging) {
            ASSERT_TRUE(session.transition_to(UploadState::Merging).is_ok());
        }
        EXPECT_TRUE(session.transition_to(UploadState::Cancelled).is_ok()) << upload_state_name(active);
        EXPECT_TRUE(session.transition_to(UploadState::Error).is_error());
    }
}

TEST(UploadSessionTest, MarkFailedKeepsMessage) {
    UploadSession session{"/tmp/a.bin", "a.bin"};
    ASSERT_TRUE(session.transition_to(UploadState::Checking).is_ok());
    ASSERT_TRUE(session.transition_to(UploadState::Uploading).is_ok());

    ASSERT_TRUE(session.mark_failed("connection reset").is_ok());
    EXPECT_EQ(session.state(), UploadState::Error);
    EXPECT_EQ(session.last_error(), "connection reset");

    // Re-entering the same state is harmless
    EXPECT_TRUE(session.transition_to(UploadState::Error).is_ok());
    EXPECT_TRUE(session.transition_to(UploadState::Merging).is_error());
}

TEST(UploadSessionTest, TracksStoredChunks) {
    UploadSession session{"/tmp/a.bin", "a.bin"};
    session.set_plan(25, three_chunks());
    EXPECT_EQ(session.missing_chunks().size(), 3u);

    session.mark_stored(1);
    session.mark_stored(1);
    EXPECT_EQ(session.stored_count(), 1u);
    const auto missing = session.missing_chunks();
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0].index, 0u);
    EXPECT_EQ(missing[1].index, 2u);
    EXPECT_EQ(missing[1].length, 5u);

    // A new plan forgets what was stored under the old one
    session.set_plan(25, three_chunks());
    EXPECT_EQ(session.stored_count(), 0u);
}
