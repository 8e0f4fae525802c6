#pragma once

#include "domain/errors.hpp"
#include "domain/holding.hpp"
#include "domain/market.hpp"
#include "domain/order.hpp"
#include "domain/records.hpp"

#include <SQLiteCpp/SQLiteCpp.h>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

// Persistence layer backed by SQLite (via SQLiteCpp).
// Notes:
//  - Call init() once after construction to set pragmas and create tables.
//  - Methods throw SQLite::Exception on failure so an enclosing atomically()
//    rolls every statement of the operation back.
//  - One connection; callers serialize access at the app level.
class Storage {
public:
  // Opens (or creates) the database file.
  explicit Storage(const std::string& db_path);

  // PRAGMAs + schema creation + id sequence seeding.
  void init();

  // Number of attempts atomically() makes when an operation hits CONFLICT.
  void set_max_attempts(int n) { max_attempts_ = n < 1 ? 1 : n; }
  int  max_attempts() const { return max_attempts_; }

  // Runs fn inside one SQLite transaction: commit on return, rollback on throw.
  // A MarketError with code CONFLICT re-runs the whole operation.
  template <typename Fn>
  auto atomically(Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
      try {
        SQLite::Transaction txn(db_);
        if constexpr (std::is_void_v<decltype(fn())>) {
          fn();
          txn.commit();
          return;
        } else {
          auto result = fn();
          txn.commit();
          return result;
        }
      } catch (const MarketError& e) {
        if (e.code() != pm::CONFLICT || attempt >= max_attempts_) throw;
        std::cerr << "[STORAGE] conflict attempt=" << attempt
                  << " reason=\"" << e.what() << "\" retrying\n";
      }
    }
  }

  // Thread-safe monotonic id generators seeded from existing rows.
  std::string gen_user_id()    { return "USR-" + std::to_string(next_user_.fetch_add(1)); }
  std::string gen_market_id()  { return "MKT-" + std::to_string(next_market_.fetch_add(1)); }
  std::string gen_outcome_id() { return "OUT-" + std::to_string(next_outcome_.fetch_add(1)); }
  std::string gen_order_id()   { return "OID-" + std::to_string(next_order_.fetch_add(1)); }
  std::string gen_holding_id() { return "HLD-" + std::to_string(next_holding_.fetch_add(1)); }

  // -------------------- users --------------------
  void insert_user(const User& u);
  std::optional<User> find_user(const std::string& user_id) const;
  std::optional<User> find_user_by_email(const std::string& email) const;
  void set_admin(const std::string& user_id, bool is_admin);
  // balance += delta; throws if the user row is missing or CHECK(balance >= 0) fails.
  void adjust_balance(const std::string& user_id, AmountQ4 delta);

  // -------------------- transactions (ledger rows) --------------------
  int64_t insert_transaction(const TransactionRow& t);
  std::vector<TransactionRow> list_transactions(const std::string& user_id,
                                                int limit, int64_t offset) const;
  int64_t count_transactions(const std::string& user_id) const;

  // -------------------- markets / outcomes --------------------
  void insert_market(const Market& m);
  std::optional<Market> find_market(const std::string& market_id) const;
  void add_market_volume(const std::string& market_id, AmountQ4 delta);
  void mark_market_resolved(const std::string& market_id, const std::string& outcome_id);

  void insert_outcome(const Outcome& o);
  std::optional<Outcome> find_outcome(const std::string& outcome_id) const;
  std::vector<Outcome> outcomes_for_market(const std::string& market_id) const; // creation order
  // UPDATE ... WHERE probability = expected; false when another writer got there first.
  bool compare_and_set_probability(const std::string& outcome_id,
                                   PriceQ4 expected, PriceQ4 desired);
  void mark_outcome_resolved(const std::string& outcome_id);

  // -------------------- orders --------------------
  void insert_order(const Order& o);
  std::optional<Order> find_order(const std::string& order_id) const;
  void update_order_fill(const std::string& order_id, AmountQ4 filled,
                         OrderStatus status, int64_t now_ms);
  void update_order_status(const std::string& order_id, OrderStatus status, int64_t now_ms);

  // OPEN LIMIT orders on one side of (market, outcome) with remaining > 0,
  // best price first (ascending for asks, descending for bids), then FIFO.
  std::vector<Order> resting_orders(const std::string& market_id,
                                    const std::string& outcome_id,
                                    Side side) const;
  std::vector<Order> open_orders_in_market(const std::string& market_id) const;
  // Sum of unfilled OPEN LIMIT SELL amounts the user has on the outcome.
  AmountQ4 reserved_sell_quantity(const std::string& user_id,
                                  const std::string& outcome_id) const;

  // -------------------- trades --------------------
  int64_t insert_trade(const TradeRow& t);
  std::vector<TradeRow> recent_trades(const std::string& market_id, int limit) const;

  // -------------------- holdings --------------------
  std::optional<Holding> find_holding(const std::string& user_id,
                                      const std::string& outcome_id) const;
  void insert_holding(const Holding& h);
  void update_holding(const std::string& holding_id, AmountQ4 quantity,
                      PriceQ4 avg_price, int64_t now_ms);
  void delete_holding(const std::string& holding_id);
  std::vector<Holding> holdings_in_market(const std::string& market_id) const; // quantity > 0
  std::vector<Holding> holdings_for_user(const std::string& user_id) const;    // quantity > 0

private:
  void create_schema_();
  uint64_t load_next_seq_(const char* table, const char* id_column, const char* prefix) const;

private:
  SQLite::Database db_;
  int max_attempts_ = 3;

  std::atomic<uint64_t> next_user_{1};
  std::atomic<uint64_t> next_market_{1};
  std::atomic<uint64_t> next_outcome_{1};
  std::atomic<uint64_t> next_order_{1};
  std::atomic<uint64_t> next_holding_{1};
};
