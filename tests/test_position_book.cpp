#include "test_support.hpp"

TEST(PositionMath, WeightedAverage) {
  // 10 @ 0.40 + 30 @ 0.60 -> 40 @ 0.55
  EXPECT_EQ(PositionBook::weighted_average(100000, 4000, 300000, 6000), 5500);
  EXPECT_EQ(PositionBook::weighted_average(0, 0, 50000, 3300), 3300);
}

TEST(PositionMath, RealizedPnl) {
  // 20 shares sold at 0.70 bought at 0.55 -> +3.00
  EXPECT_EQ(PositionBook::realized_pnl(200000, 7000, 5500), 30000);
  EXPECT_EQ(PositionBook::realized_pnl(200000, 4000, 5500), -30000);
}

TEST(PositionMath, SharesForNotional) {
  EXPECT_EQ(PositionBook::shares_for_notional(200000, 5000), 400000);
  EXPECT_THROW(PositionBook::shares_for_notional(200000, 0), MarketError);
}

struct PositionFixture : EngineFixture {
  std::string alice;
  Market m;
  std::string out;

  void SetUp() override {
    EngineFixture::SetUp();
    alice = user("alice");
    m = market(2);
    out = outcomes(m)[0].outcome_id;
  }
};

TEST_F(PositionFixture, AcquireCreatesYesHolding) {
  auto h = e->positions.acquire(alice, out, 100000, 4000);
  EXPECT_EQ(h.quantity, 100000);
  EXPECT_EQ(h.avg_price, 4000);
  EXPECT_EQ(h.position_side, pm::YES);

  auto stored = e->db.find_holding(alice, out);
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->holding_id, h.holding_id);
  EXPECT_EQ(stored->position_side, pm::YES);
}

TEST_F(PositionFixture, AcquireFoldsIntoAverage) {
  e->positions.acquire(alice, out, 100000, 4000);
  auto h = e->positions.acquire(alice, out, 300000, 6000);
  EXPECT_EQ(h.quantity, 400000);
  EXPECT_EQ(h.avg_price, 5500);
}

TEST_F(PositionFixture, PartialDisposeKeepsAverage) {
  e->positions.acquire(alice, out, 400000, 5500);
  const AmountQ4 pnl = e->positions.dispose(alice, out, 100000, 6000);
  EXPECT_EQ(pnl, 5000);   // 10 * (0.60 - 0.55)

  auto h = e->db.find_holding(alice, out);
  ASSERT_TRUE(h);
  EXPECT_EQ(h->quantity, 300000);
  EXPECT_EQ(h->avg_price, 5500);
}

TEST_F(PositionFixture, FullDisposeDeletesHolding) {
  e->positions.acquire(alice, out, 100000, 5000);
  e->positions.dispose(alice, out, 100000, 5000);
  EXPECT_FALSE(e->db.find_holding(alice, out));
}

TEST_F(PositionFixture, DisposeMoreThanHeldFails) {
  e->positions.acquire(alice, out, 100000, 5000);
  EXPECT_MARKET_ERROR(e->positions.dispose(alice, out, 100001, 5000), pm::INSUFFICIENT_SHARES);
  EXPECT_MARKET_ERROR(e->positions.dispose(user("bob"), out, 1, 5000), pm::INSUFFICIENT_SHARES);
  EXPECT_EQ(quantity(alice, out), 100000);
}

TEST_F(PositionFixture, OpenLimitSellsReduceAvailable) {
  seed_shares(alice, m, out, 400000);
  EXPECT_EQ(e->positions.available(alice, out), 400000);

  e->matching.place(limit(alice, m, out, pm::SELL, 150000, 7000));
  EXPECT_EQ(e->positions.reserved(alice, out), 150000);
  EXPECT_EQ(e->positions.available(alice, out), 250000);

  // a second sell cannot double-spend the reserved shares
  EXPECT_MARKET_ERROR(e->matching.place(limit(alice, m, out, pm::SELL, 250001, 7000)),
                      pm::INSUFFICIENT_SHARES);
  e->matching.place(limit(alice, m, out, pm::SELL, 250000, 7000));
  EXPECT_EQ(e->positions.available(alice, out), 0);
}

TEST_F(PositionFixture, CloseOutZeroesButKeepsRow) {
  auto h = e->positions.acquire(alice, out, 100000, 5000);
  e->positions.close_out(h);
  auto stored = e->db.find_holding(alice, out);
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->quantity, 0);
  EXPECT_TRUE(e->db.holdings_for_user(alice).empty());
}
