#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "domain/holding.hpp"
#include "domain/market.hpp"
#include "domain/records.hpp"

class Storage;

struct MarketView {
  Market               market;
  std::vector<Outcome> outcomes;
  std::vector<TradeRow> recent_trades;
};

struct BookLevel {
  PriceQ4  price  = 0;
  AmountQ4 volume = 0;   // remaining shares at this price
};

struct OrderBookView {
  std::vector<BookLevel> bids;  // high to low
  std::vector<BookLevel> asks;  // low to high
};

struct HoldingMetrics {
  Holding     holding;
  std::string outcome_title;
  PriceQ4     current_price  = 0;
  AmountQ4    current_value  = 0;
  AmountQ4    cost_basis     = 0;
  AmountQ4    unrealized_pnl = 0;
  int64_t     percent_change = 0;   // Q4 percent, 12.5% == 125000
  bool        is_winner      = false;
};

struct MarketPositions {
  Market                      market;
  std::vector<HoldingMetrics> holdings;
  AmountQ4                    total_value = 0;
  AmountQ4                    total_pnl   = 0;
};

struct Portfolio {
  std::vector<MarketPositions> markets;
  AmountQ4 total_value = 0;
  AmountQ4 total_pnl   = 0;
};

struct TransactionPage {
  std::vector<TransactionRow> rows;
  int64_t total = 0;
  bool    has_next_page = false;
};

inline constexpr int kRecentTradeCount = 10;
inline constexpr int kMaxPageSize      = 50;

// Read-only views; no transaction needed.
class MarketQueries {
public:
  explicit MarketQueries(const Storage& db) : db_(db) {}

  MarketView market(const std::string& market_id) const;
  OrderBookView order_book(const std::string& market_id, const std::string& outcome_id) const;
  Portfolio holdings(const std::string& user_id) const;
  TransactionPage transactions(const std::string& user_id, int page, int limit) const;

  static HoldingMetrics metrics_for(const Holding& h, const Outcome& outcome, const Market& market);

private:
  const Storage& db_;
};
