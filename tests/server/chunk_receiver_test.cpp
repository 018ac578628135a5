#include "chunked/server/chunk_receiver.hpp"
#include "chunked/events/events.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace chunked;
using chunked::server::ChunkReceiver;
using chunked::test_support::TempDir;

class ChunkReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(staging.initialize().is_ok());
    }

    TempDir dir;
    storage::StagingArea staging{dir.path()};
    storage::FingerprintGate gate;
    events::EventBus bus;
    ChunkReceiver receiver{staging, gate, bus, 1024};
};

TEST_F(ChunkReceiverTest, StoresChunkAndEmitsEvent) {
    std::vector<events::ChunkStoredEvent> stored;
    bus.subscribe<events::ChunkStoredEvent>([&](const events::ChunkStoredEvent& e) { stored.push_back(e); });

    const auto payload = test_support::make_payload(700);
    auto receipt = receiver.receive("abc123", "4", payload);
    ASSERT_TRUE(receipt.is_ok()) << receipt.error().message;
    EXPECT_EQ(receipt.value().index, 4u);
    EXPECT_EQ(receipt.value().bytes, 700u);

    EXPECT_EQ(test_support::read_file(staging.chunk_path("abc123", 4)), payload);
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].fingerprint, "abc123");
    EXPECT_FALSE(gate.is_held("abc123"));
}

TEST_F(ChunkReceiverTest, RejectsBadMetadataBeforeTouchingDisk) {
    const std::vector<std::uint8_t> body(10, 0x1);

    auto missing = receiver.receive("", "0", body);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::MissingIdentifier);

    auto bad_index = receiver.receive("abc", "-1", body);
    ASSERT_TRUE(bad_index.is_error());
    EXPECT_EQ(bad_index.error().code, ErrorCode::InvalidArgument);

    auto traversal = receiver.receive("../etc", "0", body);
    ASSERT_TRUE(traversal.is_error());
    EXPECT_EQ(traversal.error().code, ErrorCode::InvalidArgument);

    EXPECT_FALSE(staging.has_chunk_set("abc"));
}

TEST_F(ChunkReceiverTest, RejectsOversizedChunk) {
    auto upload = receiver.begin("abc", "0", 1025);
    ASSERT_TRUE(upload.is_error());
    EXPECT_EQ(upload.error().code, ErrorCode::ChunkTooLarge);
}

TEST_F(ChunkReceiverTest, BodyShorterThanDeclaredIsNotStored) {
    auto upload = receiver.begin("abc", "0", 100);
    ASSERT_TRUE(upload.is_ok());
    const auto half = test_support::make_payload(50);
    ASSERT_TRUE(upload.value()->write(half.data(), half.size()).is_ok());

    auto receipt = upload.value()->commit();
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(staging.list_indices("abc").value().empty());
}

TEST_F(ChunkReceiverTest, BodyLongerThanDeclaredIsRefused) {
    auto upload = receiver.begin("abc", "0", 10);
    ASSERT_TRUE(upload.is_ok());
    const auto body = test_support::make_payload(11);
    EXPECT_TRUE(upload.value()->write(body.data(), body.size()).is_error());
}

TEST_F(ChunkReceiverTest, AbortDiscardsPartialDataAndKeepsOtherChunks) {
    ASSERT_TRUE(receiver.receive("abc", "0", test_support::make_payload(10)).is_ok());

    std::vector<events::ChunkCancelledEvent> cancelled;
    bus.subscribe<events::ChunkCancelledEvent>([&](const events::ChunkCancelledEvent& e) { cancelled.push_back(e); });

    {
        auto upload = receiver.begin("abc", "1", 100);
        ASSERT_TRUE(upload.is_ok());
        const auto part = test_support::make_payload(30);
        ASSERT_TRUE(upload.value()->write(part.data(), part.size()).is_ok());
        EXPECT_TRUE(gate.is_held("abc"));
        upload.value()->abort("peer closed");
    }

    EXPECT_EQ(staging.list_indices("abc").value(), std::vector<std::uint32_t>{0});
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].index, 1u);
    EXPECT_EQ(cancelled[0].bytes_discarded, 30u);
    EXPECT_EQ(cancelled[0].reason, "peer closed");
    EXPECT_FALSE(gate.is_held("abc"));
}

TEST_F(ChunkReceiverTest, DestroyingUnfinishedUploadAborts) {
    int cancelled = 0;
    bus.subscribe<events::ChunkCancelledEvent>([&](const events::ChunkCancelledEvent&) { ++cancelled; });

    {
        auto upload = receiver.begin("abc", "2", 10);
        ASSERT_TRUE(upload.is_ok());
    }
    EXPECT_EQ(cancelled, 1);
    EXPECT_TRUE(staging.list_indices("abc").value().empty());
}

TEST_F(ChunkReceiverTest, RefusedWhileFingerprintIsMerging) {
    auto merging = gate.try_exclusive("abc");
    ASSERT_TRUE(merging.has_value());

    auto upload = receiver.begin("abc", "0", 10);
    ASSERT_TRUE(upload.is_error());
    EXPECT_EQ(upload.error().code, ErrorCode::MergeInProgress);

    EXPECT_TRUE(receiver.begin("other", "0", 10).is_ok());
}

TEST_F(ChunkReceiverTest, ConcurrentFirstArrivalsForOneFingerprint) {
    std::atomic<int> stored_events{0};
    bus.subscribe<events::ChunkStoredEvent>([&](const events::ChunkStoredEvent&) { ++stored_events; });

    constexpr std::uint32_t kSenders = 8;
    std::atomic<int> failures{0};
    std::vector<std::thread> senders;
    for (std::uint32_t i = 0; i < kSenders; ++i) {
        senders.emplace_back([this, &failures, i]() {
            if (receiver.receive("shared", std::to_string(i), test_support::make_payload(512, i + 1)).is_error()) {
                ++failures;
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(stored_events.load(), static_cast<int>(kSenders));
    auto indices = staging.list_indices("shared");
    ASSERT_TRUE(indices.is_ok());
    EXPECT_EQ(indices.value().size(), kSenders);
    for (std::uint32_t i = 0; i < kSenders; ++i) {
        EXPECT_EQ(test_support::read_file(staging.chunk_path("shared", i)), test_support::make_payload(512, i + 1));
    }
    EXPECT_FALSE(gate.is_held("shared"));
}
