#include "chunked/client/chunk_splitter.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using namespace chunked;
using chunked::client::ChunkRange;
using chunked::test_support::TempDir;

namespace {

ChunkRange range(std::uint32_t index, std::uint64_t offset, std::uint64_t length) {
    ChunkRange r;
    r.index = index;
    r.offset = offset;
    r.length = length;
    return r;
}

constexpr std::uint64_t MiB = 1024 * 1024;

} // namespace

TEST(ChunkSplitterTest, TwelveMegabytesInFiveMegabyteChunks) {
    auto plan = client::split_into_chunks(12 * MiB, 5 * MiB);
    ASSERT_TRUE(plan.is_ok());
    const std::vector<ChunkRange> expected = {
        range(0, 0, 5 * MiB),
        range(1, 5 * MiB, 5 * MiB),
        range(2, 10 * MiB, 2 * MiB),
    };
    EXPECT_EQ(plan.value(), expected);
}

TEST(ChunkSplitterTest, ExactMultipleHasNoShortTail) {
    auto plan = client::split_into_chunks(10 * MiB, 5 * MiB);
    ASSERT_TRUE(plan.is_ok());
    ASSERT_EQ(plan.value().size(), 2u);
    EXPECT_EQ(plan.value().back().length, 5 * MiB);
}

TEST(ChunkSplitterTest, SmallAndEmptyFiles) {
    auto small = client::split_into_chunks(1, client::kDefaultChunkSize);
    ASSERT_TRUE(small.is_ok());
    EXPECT_EQ(small.value(), std::vector<ChunkRange>{range(0, 0, 1)});

    auto empty = client::split_into_chunks(0, client::kDefaultChunkSize);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST(ChunkSplitterTest, RejectsUnusableChunkSizes) {
    EXPECT_EQ(client::split_into_chunks(100, 0).error().code, ErrorCode::InvalidArgument);
    // 2^33 one-byte chunks would overflow the index
    EXPECT_EQ(client::split_into_chunks(1ULL << 33, 1).error().code, ErrorCode::InvalidArgument);
}

TEST(ChunkSplitterTest, ReadChunkReturnsExactRange) {
    TempDir dir;
    const auto payload = test_support::make_payload(10000);
    const auto file = dir / "data.bin";
    test_support::write_file(file, payload);

    auto plan = client::split_into_chunks(payload.size(), 4096);
    ASSERT_TRUE(plan.is_ok());

    std::vector<std::uint8_t> joined;
    for (const auto& r : plan.value()) {
        auto bytes = client::read_chunk(file, r);
        ASSERT_TRUE(bytes.is_ok()) << bytes.error().message;
        EXPECT_EQ(bytes.value().size(), r.length);
        joined.insert(joined.end(), bytes.value().begin(), bytes.value().end());
    }
    EXPECT_EQ(joined, payload);
}

TEST(ChunkSplitterTest, ReadPastEndIsShortRead) {
    TempDir dir;
    const auto file = dir / "data.bin";
    test_support::write_file(file, test_support::make_payload(100));

    auto bytes = client::read_chunk(file, range(1, 50, 100));
    ASSERT_TRUE(bytes.is_error());
    EXPECT_EQ(bytes.error().code, ErrorCode::IoFailure);
}
