#include <gtest/gtest.h>
#include "Core/OrderBook.hpp"

class OrderBookTest : public ::testing::Test {
protected:
    OrderBook book_{"BTCUSDT"};

    void SetUp() override {
        book_.initialize(100, {
            {25000.0, 1.0, true},
            {24999.0, 2.0, true},
            {24998.0, 3.0, true},
            {25001.0, 1.5, false},
            {25002.0, 2.5, false},
        });
    }
};

TEST_F(OrderBookTest, SnapshotOrdersBestLevelsFirst) {
    const auto snap = book_.snapshot(10);

    EXPECT_EQ(snap.symbol, "BTCUSDT");
    EXPECT_EQ(snap.last_update_id, 100u);
    ASSERT_EQ(snap.bids.size(), 3u);
    ASSERT_EQ(snap.asks.size(), 2u);
    EXPECT_DOUBLE_EQ(snap.bids[0].price, 25000.0);
    EXPECT_DOUBLE_EQ(snap.bids[2].price, 24998.0);
    EXPECT_DOUBLE_EQ(snap.asks[0].price, 25001.0);
    EXPECT_DOUBLE_EQ(snap.asks[1].quantity, 2.5);
}

TEST_F(OrderBookTest, SnapshotRespectsDepth) {
    const auto snap = book_.snapshot(1);
    EXPECT_EQ(snap.bids.size(), 1u);
    EXPECT_EQ(snap.asks.size(), 1u);
}

TEST_F(OrderBookTest, BestBidAndAsk) {
    const auto [bid, ask] = book_.get_bbo();
    EXPECT_DOUBLE_EQ(bid, 25000.0);
    EXPECT_DOUBLE_EQ(ask, 25001.0);
}

TEST_F(OrderBookTest, ContiguousUpdateIsApplied) {
    const auto result = book_.update(101, 103, {
        {25000.5, 0.7, true},   // new best bid
        {25000.0, 0.0, true},   // removed
        {25001.0, 4.0, false},  // replaced quantity
    });

    EXPECT_EQ(result, OrderBook::UpdateResult::Applied);
    EXPECT_EQ(book_.last_update_id(), 103u);

    const auto snap = book_.snapshot(10);
    ASSERT_EQ(snap.bids.size(), 3u);
    EXPECT_DOUBLE_EQ(snap.bids[0].price, 25000.5);
    EXPECT_DOUBLE_EQ(snap.bids[1].price, 24999.0);
    EXPECT_DOUBLE_EQ(snap.asks[0].quantity, 4.0);
}

TEST_F(OrderBookTest, OverlappingUpdateIsApplied) {
    // The first event after a snapshot usually straddles lastUpdateId.
    EXPECT_EQ(book_.update(95, 105, {{24997.0, 1.0, true}}), OrderBook::UpdateResult::Applied);
    EXPECT_EQ(book_.last_update_id(), 105u);
}

TEST_F(OrderBookTest, OldUpdateIsStale) {
    EXPECT_EQ(book_.update(90, 100, {{25000.0, 0.0, true}}), OrderBook::UpdateResult::Stale);

    const auto [bid, ask] = book_.get_bbo();
    EXPECT_DOUBLE_EQ(bid, 25000.0);
    EXPECT_EQ(book_.last_update_id(), 100u);
}

TEST_F(OrderBookTest, MissingEventsAreReportedAsGap) {
    EXPECT_EQ(book_.update(105, 110, {{25000.0, 0.0, true}}), OrderBook::UpdateResult::Gap);
    EXPECT_EQ(book_.last_update_id(), 100u);
    EXPECT_DOUBLE_EQ(book_.get_bbo().first, 25000.0);
}

TEST_F(OrderBookTest, ReinitializeReplacesBothSides) {
    book_.initialize(500, {{30000.0, 1.0, true}, {30001.0, 1.0, false}});

    const auto snap = book_.snapshot(10);
    EXPECT_EQ(snap.bids.size(), 1u);
    EXPECT_EQ(snap.asks.size(), 1u);
    EXPECT_EQ(book_.last_update_id(), 500u);
}

TEST(OrderBookUninitializedTest, UpdateBeforeSnapshotIsGap) {
    OrderBook book("ETHBTC");
    EXPECT_FALSE(book.initialized());
    EXPECT_EQ(book.update(1, 2, {{0.05, 1.0, true}}), OrderBook::UpdateResult::Gap);
    EXPECT_TRUE(book.snapshot(5).bids.empty());
}

TEST(OrderBookSnapshotTest, TruncatedAndTop) {
    OrderBookSnapshot snap;
    snap.symbol = "BTCUSDT";
    snap.bids = {{100.0, 1.0}, {99.0, 1.0}, {98.0, 1.0}};
    snap.asks = {{101.0, 2.0}, {102.0, 2.0}};

    const auto cut = snap.truncated(2);
    EXPECT_EQ(cut.bids.size(), 2u);
    EXPECT_EQ(cut.asks.size(), 2u);

    const auto top = snap.top();
    ASSERT_TRUE(top.has_value());
    EXPECT_DOUBLE_EQ(top->mid_price(), 100.5);
    EXPECT_DOUBLE_EQ(top->spread(), 1.0);

    snap.asks.clear();
    EXPECT_FALSE(snap.top().has_value());
}
