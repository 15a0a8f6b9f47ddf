#include <gtest/gtest.h>

#include "transport/peer_table.hpp"

using transport::PeerTable;

TEST(PeerTable, MergesUpdatesForSameDevice)
{
    PeerTable t;
    t.note("aa:bb:cc:dd:ee:01", "sender", std::nullopt, false, 1000);
    t.note("AA:BB:CC:DD:EE:01", "", std::int16_t(-60), true, 2000);

    const auto peers = t.list(2000);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].addr, "AA:BB:CC:DD:EE:01");
    EXPECT_EQ(peers[0].name, "sender");  // empty name keeps the known one
    EXPECT_TRUE(peers[0].have_rssi);
    EXPECT_EQ(peers[0].rssi, -60);
    EXPECT_TRUE(peers[0].svc_hit);
}

TEST(PeerTable, OrdersServiceThenSignal)
{
    PeerTable t;
    t.note("00:00:00:00:00:01", "", std::int16_t(-40), false, 0);
    t.note("00:00:00:00:00:02", "", std::int16_t(-70), true, 0);
    t.note("00:00:00:00:00:03", "", std::int16_t(-50), true, 0);
    t.note("00:00:00:00:00:04", "", std::nullopt, true, 0);

    const auto peers = t.list(0);
    ASSERT_EQ(peers.size(), 4u);
    EXPECT_EQ(peers[0].addr, "00:00:00:00:00:03");
    EXPECT_EQ(peers[1].addr, "00:00:00:00:00:02");
    EXPECT_EQ(peers[2].addr, "00:00:00:00:00:04");
    EXPECT_EQ(peers[3].addr, "00:00:00:00:00:01");
}

TEST(PeerTable, ExpiresStaleEntriesAndRejectsBadAddresses)
{
    PeerTable t(1000);
    t.note("00:00:00:00:00:01", "old", std::nullopt, false, 0);
    t.note("00:00:00:00:00:02", "new", std::nullopt, false, 1500);
    t.note("not-a-mac", "x", std::nullopt, true, 1500);

    const auto peers = t.list(1800);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].name, "new");

    t.clear();
    EXPECT_TRUE(t.list(1800).empty());
}
