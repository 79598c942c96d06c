/**
 * @file peer_table_test.cpp
 * @brief Unit tests for PeerTable upsert, restart eviction and staleness
 */

#include "securexfer/PeerTable.h"
#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace SecureXfer;

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief PeerTable driven by a manually advanced clock
 */
class PeerTableTest : public ::testing::Test {
protected:
    std::shared_ptr<std::chrono::steady_clock::time_point> clockNow =
        std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

    PeerTable table{PEER_STALE_MS, [this]() { return *clockNow; }};

    const std::string fpA = std::string(64, 'A');
    const std::string fpB = std::string(64, 'B');

    void advance(uint32_t ms) { *clockNow += std::chrono::milliseconds(ms); }
};

//=============================================================================
// Upsert Tests
//=============================================================================

TEST_F(PeerTableTest, UpsertAddsThenUpdates) {
    EXPECT_EQ(table.upsert("peer-1", "alpha", "192.168.1.10", 4000, fpA), UpsertResult::Added);
    EXPECT_EQ(table.upsert("peer-1", "alpha2", "192.168.1.10", 4001, fpA), UpsertResult::Updated);

    PeerRecord record;
    ASSERT_TRUE(table.find("peer-1", record));
    EXPECT_EQ(record.displayName, "alpha2");
    EXPECT_EQ(record.port, 4001);
    EXPECT_EQ(table.size(), 1u);
}

TEST_F(PeerTableTest, NewIdOnSameIpReplacesOldRecord) {
    table.upsert("old-id", "host", "192.168.1.20", 4000, fpA);
    EXPECT_EQ(table.upsert("new-id", "host", "192.168.1.20", 4100, fpB), UpsertResult::Replaced);

    const auto peers = table.sweepAndSnapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].peerId, "new-id");
    EXPECT_EQ(peers[0].certificateFingerprint, fpB);
    EXPECT_FALSE(table.contains("old-id"));
}

TEST_F(PeerTableTest, DifferentIpsCoexist) {
    table.upsert("a", "host-a", "10.0.0.1", 4000, fpA);
    table.upsert("b", "host-b", "10.0.0.2", 4000, fpB);
    EXPECT_EQ(table.sweepAndSnapshot().size(), 2u);
    EXPECT_TRUE(table.containsIp("10.0.0.2"));
}

//=============================================================================
// Staleness Tests
//=============================================================================

TEST_F(PeerTableTest, EntryAtExactlyThresholdIsKept) {
    table.upsert("peer-1", "alpha", "10.0.0.1", 4000, fpA);
    advance(PEER_STALE_MS);
    EXPECT_EQ(table.sweepAndSnapshot().size(), 1u);
}

TEST_F(PeerTableTest, StaleEntryIsExcludedAndRemoved) {
    table.upsert("peer-1", "alpha", "10.0.0.1", 4000, fpA);
    advance(PEER_STALE_MS + 1);

    EXPECT_TRUE(table.sweepAndSnapshot().empty());
    EXPECT_EQ(table.size(), 0u);
}

TEST_F(PeerTableTest, RefreshResetsAge) {
    table.upsert("peer-1", "alpha", "10.0.0.1", 4000, fpA);
    advance(20000);
    table.upsert("peer-1", "alpha", "10.0.0.1", 4000, fpA);
    advance(20000);

    EXPECT_EQ(table.sweepAndSnapshot().size(), 1u);
}

TEST_F(PeerTableTest, FindIgnoresStaleEntries) {
    table.upsert("peer-1", "alpha", "10.0.0.1", 4000, fpA);
    advance(PEER_STALE_MS + 500);

    PeerRecord record;
    EXPECT_FALSE(table.find("peer-1", record));
}
