#include <gtest/gtest.h>
#include "domain/price.hpp"
#include "domain/order.hpp"

TEST(PriceScale, NormalizeExamples) {
  // raw=10050
  EXPECT_EQ(normalize_to_q4(10050, 9), 0);        // 10050 / 10^5 -> 0 (trunc)
  EXPECT_EQ(normalize_to_q4(10050, 8), 1);        // 10050 / 10^4 -> 1
  EXPECT_EQ(normalize_to_q4(10050, 6), 100);      // 10050 / 10^2 -> 100
  EXPECT_EQ(normalize_to_q4(10050, 4), 10050);    // already Q4
  EXPECT_EQ(normalize_to_q4(10050, 2), 1005000);  // *10^(4-2)
  EXPECT_EQ(normalize_to_q4(10050, 0), 100500000);// *10^4
}

TEST(PriceScale, RejectsBadScaleAndOverflow) {
  EXPECT_THROW(normalize_to_q4(1, -1), std::invalid_argument);
  EXPECT_THROW(normalize_to_q4(1, 19), std::invalid_argument);
  EXPECT_THROW(normalize_to_q4(std::numeric_limits<int64_t>::max() / 10, 0), std::overflow_error);
}

TEST(FixedPoint, RoundsHalfAwayFromZero) {
  EXPECT_EQ(round_div(5, 10), 1);
  EXPECT_EQ(round_div(4, 10), 0);
  EXPECT_EQ(round_div(-5, 10), -1);
  EXPECT_EQ(round_div(-4, 10), 0);
  EXPECT_EQ(round_div(15, -10), -2);
  EXPECT_THROW(round_div(1, 0), std::domain_error);
}

TEST(FixedPoint, MulAndDivQ4) {
  EXPECT_EQ(mul_q4(400000, 5000), 200000);   // 40 shares * 0.50 = 20.00
  EXPECT_EQ(mul_q4(3, 5000), 2);             // 0.0003 * 0.5 = 0.00015 -> 0.0002
  EXPECT_EQ(div_q4(200000, 5000), 400000);   // 20.00 / 0.50 = 40 shares
  EXPECT_EQ(div_q4(10000, 30000), 3333);     // 1 / 3
  EXPECT_THROW(checked_mul(std::numeric_limits<int64_t>::max(), 2), std::overflow_error);
  EXPECT_THROW(checked_add(std::numeric_limits<int64_t>::max(), 1), std::overflow_error);
}

TEST(FixedPoint, RendersQ4) {
  EXPECT_EQ(q4_to_string(0), "0.0000");
  EXPECT_EQ(q4_to_string(2550), "0.2550");
  EXPECT_EQ(q4_to_string(123400), "12.3400");
  EXPECT_EQ(q4_to_string(-5), "-0.0005");
}

TEST(OrderFactory, FromRawNormalizes) {
  auto o = Order::FromRaw("USR-1", "MKT-1", "OUT-1", pm::BUY, pm::LIMIT, 100, 0, 45, 2);
  EXPECT_EQ(o.amount, 1000000);   // 100 shares
  EXPECT_EQ(o.price_q4, 4500);    // 0.45
  EXPECT_EQ(o.remaining(), o.amount);
  EXPECT_TRUE(o.holds_reservation());
}

TEST(OrderFactory, MarketOrdersIgnoreWirePrice) {
  auto o = Order::FromRaw("USR-1", "MKT-1", "OUT-1", pm::SELL, pm::MARKET, 25, 0, 99, 2);
  EXPECT_EQ(o.price_q4, 0);
  EXPECT_FALSE(o.holds_reservation());
}
