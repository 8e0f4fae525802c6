#include "test_support.hpp"

#include <limits>

namespace {
constexpr AmountQ4 kShare = kOneQ4;
}

struct RegistryFixture : EngineFixture {
  NewMarket valid_market(std::size_t outcomes = 2) const {
    NewMarket spec;
    spec.title       = "Who wins the final?";
    spec.description = "Resolves on the official result.";
    spec.category    = "sports";
    spec.end_date_ms = now_epoch_ms() + 3600000;
    for (std::size_t i = 0; i < outcomes; ++i) {
      spec.outcomes.push_back(OutcomeSpec{"Team " + std::to_string(i + 1), ""});
    }
    return spec;
  }
};

// -------------------- users --------------------

TEST_F(RegistryFixture, RegisterStartsWithThousand) {
  auto u = e->registry.register_user("  Alice ", " alice@example.com ");
  EXPECT_EQ(u.user_id.rfind("USR-", 0), 0u);
  EXPECT_EQ(u.name, "Alice");
  EXPECT_EQ(u.email, "alice@example.com");
  EXPECT_EQ(u.balance, 1000 * kShare);
  EXPECT_FALSE(u.is_admin);
  EXPECT_EQ(balance(u.user_id), 1000 * kShare);
}

TEST_F(RegistryFixture, RegisterRejectsBadOrDuplicateEmail) {
  e->registry.register_user("Alice", "alice@example.com");
  EXPECT_MARKET_ERROR(e->registry.register_user("Alias", "alice@example.com"), pm::VALIDATION_ERROR);
  EXPECT_MARKET_ERROR(e->registry.register_user("Nobody", "not-an-email"), pm::VALIDATION_ERROR);
  EXPECT_MARKET_ERROR(e->registry.register_user("Nobody", "   "), pm::VALIDATION_ERROR);
}

TEST_F(RegistryFixture, EnsureAdminPromotesExistingAccount) {
  auto u = e->registry.register_user("Ops", "ops@example.com");
  auto promoted = e->registry.ensure_admin("ignored", "ops@example.com");
  EXPECT_EQ(promoted.user_id, u.user_id);
  EXPECT_TRUE(promoted.is_admin);
  EXPECT_TRUE(e->db.find_user(u.user_id)->is_admin);

  // idempotent
  EXPECT_EQ(e->registry.ensure_admin("Admin", "admin@example.com").user_id, admin_id);
}

TEST_F(RegistryFixture, GrantAdminNeedsAdminCaller) {
  auto alice = user("alice");
  auto bob   = user("bob");
  EXPECT_MARKET_ERROR(e->registry.grant_admin(alice, bob), pm::FORBIDDEN);
  EXPECT_MARKET_ERROR(e->registry.grant_admin(admin_id, "USR-404"), pm::NOT_FOUND);

  auto granted = e->registry.grant_admin(admin_id, bob);
  EXPECT_TRUE(granted.is_admin);
  EXPECT_NO_THROW(e->registry.grant_admin(bob, alice));
}

// -------------------- deposits --------------------

TEST_F(RegistryFixture, DepositWithinBounds) {
  auto alice = user("alice");
  EXPECT_EQ(e->registry.deposit(alice, 10 * kShare), 1010 * kShare);
  EXPECT_EQ(e->registry.deposit(alice, 10000 * kShare), 11010 * kShare);
  EXPECT_EQ(last_txn(alice).type, "DEPOSIT");

  EXPECT_MARKET_ERROR(e->registry.deposit(alice, 10 * kShare - 1), pm::VALIDATION_ERROR);
  EXPECT_MARKET_ERROR(e->registry.deposit(alice, 10000 * kShare + 1), pm::VALIDATION_ERROR);
  EXPECT_MARKET_ERROR(e->registry.deposit("USR-404", 50 * kShare), pm::NOT_FOUND);
  EXPECT_EQ(balance(alice), 11010 * kShare);
}

// -------------------- markets --------------------

TEST_F(RegistryFixture, CreateMarketSplitsEvenly) {
  auto created = e->registry.create_market(admin_id, valid_market(3));
  EXPECT_EQ(created.market_id.rfind("MKT-", 0), 0u);
  EXPECT_EQ(created.creator_id, admin_id);
  EXPECT_EQ(created.volume, 0);
  EXPECT_FALSE(created.is_resolved);

  auto os = outcomes(created);
  ASSERT_EQ(os.size(), 3u);
  EXPECT_EQ(os[0].probability, 3334);
  EXPECT_EQ(os[1].probability, 3333);
  EXPECT_EQ(os[2].probability, 3333);
  EXPECT_EQ(os[0].title, "Team 1");
  EXPECT_EQ(probability_sum(created), kOneQ4);
}

TEST_F(RegistryFixture, CreateMarketValidation) {
  auto alice = user("alice");
  EXPECT_MARKET_ERROR(e->registry.create_market(alice, valid_market()), pm::FORBIDDEN);

  auto spec = valid_market();
  spec.title = "Who";
  EXPECT_MARKET_ERROR(e->registry.create_market(admin_id, spec), pm::VALIDATION_ERROR);

  spec = valid_market();
  spec.description = "short";
  EXPECT_MARKET_ERROR(e->registry.create_market(admin_id, spec), pm::VALIDATION_ERROR);

  spec = valid_market();
  spec.end_date_ms = now_epoch_ms() - 1;
  EXPECT_MARKET_ERROR(e->registry.create_market(admin_id, spec), pm::VALIDATION_ERROR);

  EXPECT_MARKET_ERROR(e->registry.create_market(admin_id, valid_market(1)), pm::VALIDATION_ERROR);

  spec = valid_market();
  spec.outcomes[1].title = " ";
  EXPECT_MARKET_ERROR(e->registry.create_market(admin_id, spec), pm::VALIDATION_ERROR);
}

TEST_F(RegistryFixture, CreateMarketCapsOutcomesAtFloorCapacity) {
  EXPECT_MARKET_ERROR(e->registry.create_market(admin_id, valid_market(kMaxOutcomes + 1)),
                      pm::VALIDATION_ERROR);

  auto created = e->registry.create_market(admin_id, valid_market(kMaxOutcomes));
  auto os = outcomes(created);
  ASSERT_EQ(os.size(), kMaxOutcomes);
  for (const auto& o : os) EXPECT_EQ(o.probability, kMinProbQ4);
  EXPECT_EQ(probability_sum(created), kOneQ4);
}

// -------------------- queries --------------------

TEST_F(RegistryFixture, MarketViewKeepsTenMostRecentTrades) {
  auto m = market(2);
  auto os = outcomes(m);
  auto alice = user("alice");
  for (int i = 0; i < 12; ++i) {
    e->matching.execute_trade(alice, m.market_id, os[i % 2].outcome_id, kShare, pm::BUY, false);
  }
  auto v = e->queries.market(m.market_id);
  EXPECT_EQ(v.outcomes.size(), 2u);
  ASSERT_EQ(v.recent_trades.size(), static_cast<std::size_t>(kRecentTradeCount));
  EXPECT_GT(v.recent_trades.front().trade_id, v.recent_trades.back().trade_id);
  EXPECT_EQ(v.market.volume, 12 * kShare);

  EXPECT_MARKET_ERROR(e->queries.market("MKT-404"), pm::NOT_FOUND);
}

TEST_F(RegistryFixture, OrderBookAggregatesLevels) {
  auto m = market(2);
  auto yes = outcomes(m)[0].outcome_id;
  auto alice = user("alice");
  auto bob   = user("bob");
  seed_shares(alice, m, yes, 30 * kShare);

  e->matching.place(limit(bob, m, yes, pm::BUY, 5 * kShare, 4000));
  e->matching.place(limit(bob, m, yes, pm::BUY, 3 * kShare, 4000));
  e->matching.place(limit(bob, m, yes, pm::BUY, 2 * kShare, 4500));
  e->matching.place(limit(alice, m, yes, pm::SELL, 4 * kShare, 7000));
  e->matching.place(limit(alice, m, yes, pm::SELL, 6 * kShare, 6500));

  auto book = e->queries.order_book(m.market_id, yes);
  ASSERT_EQ(book.bids.size(), 2u);
  EXPECT_EQ(book.bids[0].price, 4500);
  EXPECT_EQ(book.bids[0].volume, 2 * kShare);
  EXPECT_EQ(book.bids[1].price, 4000);
  EXPECT_EQ(book.bids[1].volume, 8 * kShare);
  ASSERT_EQ(book.asks.size(), 2u);
  EXPECT_EQ(book.asks[0].price, 6500);
  EXPECT_EQ(book.asks[1].price, 7000);
}

TEST_F(RegistryFixture, HoldingsReportUnrealizedPnl) {
  auto m = market(2);
  auto os = outcomes(m);
  auto alice = user("alice");
  set_probability(m, os[0].outcome_id, 4000);
  e->matching.execute_trade(alice, m.market_id, os[0].outcome_id, 10 * kShare, pm::BUY, true);
  set_probability(m, os[0].outcome_id, 5000);

  auto p = e->queries.holdings(alice);
  ASSERT_EQ(p.markets.size(), 1u);
  ASSERT_EQ(p.markets[0].holdings.size(), 1u);
  const auto& h = p.markets[0].holdings[0];
  EXPECT_EQ(h.current_price, 5000);
  EXPECT_EQ(h.current_value, 5 * kShare);
  EXPECT_EQ(h.cost_basis, 4 * kShare);
  EXPECT_EQ(h.unrealized_pnl, 1 * kShare);
  EXPECT_EQ(h.percent_change, 25 * kShare);   // +25%
  EXPECT_EQ(h.holding.position_side, pm::YES);
  EXPECT_EQ(p.total_value, 5 * kShare);
  EXPECT_EQ(p.total_pnl, 1 * kShare);
}

TEST_F(RegistryFixture, TransactionsArePaged) {
  auto alice = user("alice");
  for (int i = 0; i < 5; ++i) e->registry.deposit(alice, (10 + i) * kShare);

  auto first = e->queries.transactions(alice, 1, 2);
  EXPECT_EQ(first.total, 5);
  ASSERT_EQ(first.rows.size(), 2u);
  EXPECT_EQ(first.rows[0].amount, 14 * kShare);   // newest first
  EXPECT_TRUE(first.has_next_page);

  auto last = e->queries.transactions(alice, 3, 2);
  ASSERT_EQ(last.rows.size(), 1u);
  EXPECT_EQ(last.rows[0].amount, 10 * kShare);
  EXPECT_FALSE(last.has_next_page);

  auto beyond = e->queries.transactions(alice, std::numeric_limits<int>::max(), kMaxPageSize);
  EXPECT_EQ(beyond.total, 5);
  EXPECT_TRUE(beyond.rows.empty());
  EXPECT_FALSE(beyond.has_next_page);

  EXPECT_MARKET_ERROR(e->queries.transactions(alice, 0, 2), pm::VALIDATION_ERROR);
  EXPECT_MARKET_ERROR(e->queries.transactions(alice, 1, kMaxPageSize + 1), pm::VALIDATION_ERROR);
  EXPECT_MARKET_ERROR(e->queries.transactions("USR-404", 1, 10), pm::NOT_FOUND);
}
