#include "chunked/storage/fingerprint_gate.hpp"

#include <gtest/gtest.h>

using chunked::storage::FingerprintGate;

TEST(FingerprintGateTest, SharedLeasesCoexist) {
    FingerprintGate gate;
    auto a = gate.try_shared("fp");
    auto b = gate.try_shared("fp");
    EXPECT_TRUE(a.has_value());
    EXPECT_TRUE(b.has_value());
    EXPECT_TRUE(gate.is_held("fp"));
    EXPECT_FALSE(gate.is_exclusive("fp"));
}

TEST(FingerprintGateTest, ExclusiveWaitsForNobody) {
    FingerprintGate gate;
    auto shared = gate.try_shared("fp");
    ASSERT_TRUE(shared.has_value());

    EXPECT_FALSE(gate.try_exclusive("fp").has_value());

    shared.reset();
    auto exclusive = gate.try_exclusive("fp");
    ASSERT_TRUE(exclusive.has_value());
    EXPECT_TRUE(gate.is_exclusive("fp"));
    EXPECT_FALSE(gate.try_shared("fp").has_value());
    EXPECT_FALSE(gate.try_exclusive("fp").has_value());
}

TEST(FingerprintGateTest, DifferentFingerprintsAreIndependent) {
    FingerprintGate gate;
    auto merging = gate.try_exclusive("a");
    ASSERT_TRUE(merging.has_value());

    EXPECT_TRUE(gate.try_shared("b").has_value());
    EXPECT_TRUE(gate.try_exclusive("c").has_value());
}

TEST(FingerprintGateTest, LeaseReleasesOnceAfterMove) {
    FingerprintGate gate;
    {
        auto lease = gate.try_exclusive("fp");
        ASSERT_TRUE(lease.has_value());
        FingerprintGate::Lease moved = std::move(*lease);
        EXPECT_TRUE(gate.is_exclusive("fp"));
    }
    EXPECT_FALSE(gate.is_held("fp"));
    EXPECT_TRUE(gate.try_exclusive("fp").has_value());
}
