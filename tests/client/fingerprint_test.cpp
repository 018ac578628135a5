#include "chunked/client/fingerprint.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

using namespace chunked;
using chunked::client::Sha256Accumulator;
using chunked::test_support::TempDir;

TEST(FingerprintTest, KnownDigests) {
    auto abc = client::fingerprint_bytes("abc", 3);
    ASSERT_TRUE(abc.is_ok());
    EXPECT_EQ(abc.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = client::fingerprint_bytes("", 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(empty.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(FingerprintTest, FileDigestDoesNotDependOnBufferSize) {
    TempDir dir;
    const auto payload = test_support::make_payload(3 * 1024 * 1024 + 123);
    const auto file = dir / "payload.bin";
    test_support::write_file(file, payload);

    auto whole = client::fingerprint_bytes(payload.data(), payload.size());
    auto small = client::fingerprint_file(file, nullptr, 4096);
    auto large = client::fingerprint_file(file);
    ASSERT_TRUE(whole.is_ok());
    ASSERT_TRUE(small.is_ok());
    ASSERT_TRUE(large.is_ok());
    EXPECT_EQ(small.value(), whole.value());
    EXPECT_EQ(large.value(), whole.value());
    EXPECT_EQ(whole.value().size(), 64u);
}

TEST(FingerprintTest, DifferentContentDifferentFingerprint) {
    const auto a = test_support::make_payload(1000, 1);
    const auto b = test_support::make_payload(1000, 2);
    EXPECT_NE(client::fingerprint_bytes(a.data(), a.size()).value(),
              client::fingerprint_bytes(b.data(), b.size()).value());
}

TEST(FingerprintTest, MissingFileIsIoFailure) {
    TempDir dir;
    auto result = client::fingerprint_file(dir / "absent.bin");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::IoFailure);
}

TEST(FingerprintTest, CancelledBeforeReading) {
    TempDir dir;
    const auto file = dir / "payload.bin";
    test_support::write_file(file, test_support::make_payload(10000));

    CancellationToken cancel;
    cancel.cancel();
    auto result = client::fingerprint_file(file, &cancel, 1024);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
}

TEST(FingerprintTest, AccumulatorFinalizesOnce) {
    Sha256Accumulator sha;
    ASSERT_TRUE(sha.update("a", 1).is_ok());
    ASSERT_TRUE(sha.update("bc", 2).is_ok());
    auto digest = sha.finalize();
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(digest.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    EXPECT_TRUE(sha.finalize().is_error());
    EXPECT_TRUE(sha.update("x", 1).is_error());
}
