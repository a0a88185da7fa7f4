/*
 * test_connection_pool.cpp - Tests for per-device connection slots
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "device/device_connection_pool.hpp"

using namespace helium::device;

class ConnectionPoolTest : public ::testing::Test {
protected:
    ConnectionPool pool_{2};
};

TEST_F(ConnectionPoolTest, Acquire_GrantsUpToLimit) {
    auto first = pool_.acquire("device-1");
    auto second = pool_.acquire("device-1");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->connectionId(), second->connectionId());
    EXPECT_EQ(pool_.activeConnections("device-1"), 2u);

    auto third = pool_.acquire("device-1");
    EXPECT_FALSE(third.has_value());
    EXPECT_EQ(pool_.statistics().leaseMisses, 1u);
}

TEST_F(ConnectionPoolTest, Lease_ReleasesOnDestruction) {
    {
        auto lease = pool_.acquire("device-1");
        ASSERT_TRUE(lease.has_value());
        EXPECT_EQ(pool_.activeConnections("device-1"), 1u);
    }
    EXPECT_EQ(pool_.activeConnections("device-1"), 0u);

    // The idle slot is reused rather than a new one created
    auto again = pool_.acquire("device-1");
    ASSERT_TRUE(again.has_value());
    auto stats = pool_.statistics();
    EXPECT_EQ(stats.connectionsCreated, 1u);
    EXPECT_EQ(stats.leasesGranted, 2u);
    EXPECT_EQ(stats.totalConnections, 1u);
}

TEST_F(ConnectionPoolTest, Lease_MoveTransfersOwnership) {
    auto lease = pool_.acquire("device-1");
    ASSERT_TRUE(lease.has_value());
    ConnectionLease moved = std::move(*lease);
    lease.reset();
    EXPECT_EQ(pool_.activeConnections("device-1"), 1u);
    EXPECT_EQ(moved.serial(), "device-1");
}

TEST_F(ConnectionPoolTest, DevicesAreIndependent) {
    auto a1 = pool_.acquire("a");
    auto a2 = pool_.acquire("a");
    auto b1 = pool_.acquire("b");
    EXPECT_TRUE(a1 && a2 && b1);
    EXPECT_EQ(pool_.statistics().devices, 2u);
    EXPECT_EQ(pool_.statistics().activeConnections, 3u);
}

TEST_F(ConnectionPoolTest, ReleaseDevice_ForgetsSlots) {
    auto lease = pool_.acquire("device-1");
    ASSERT_TRUE(lease.has_value());
    pool_.releaseDevice("device-1");
    EXPECT_EQ(pool_.activeConnections("device-1"), 0u);
    EXPECT_EQ(pool_.statistics().devicesReleased, 1u);

    // Releasing a lease of a forgotten device is harmless
    lease.reset();
    EXPECT_EQ(pool_.statistics().devices, 0u);
}

TEST_F(ConnectionPoolTest, Lease_OutlivingPoolIsSafe) {
    std::optional<ConnectionLease> lease;
    {
        ConnectionPool shortLived(1);
        lease = shortLived.acquire("device-1");
        ASSERT_TRUE(lease.has_value());
    }
    lease.reset();
    SUCCEED();
}

TEST_F(ConnectionPoolTest, MaxPerDevice_IsAtLeastOne) {
    ConnectionPool pool(0);
    EXPECT_EQ(pool.maxPerDevice(), 1u);
}
