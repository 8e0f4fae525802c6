#pragma once
#include <string>
#include "domain/holding.hpp"
#include "domain/price.hpp"

class Storage;

// Sole owner of the holdings table: one row per (user, outcome).
class PositionBook {
public:
  explicit PositionBook(Storage& db) : db_(db) {}

  // Buy: creates the holding or folds the fill into a weighted-average cost.
  Holding acquire(const std::string& user_id, const std::string& outcome_id,
                  AmountQ4 quantity, PriceQ4 price);

  // Sell: reduces the holding (avg unchanged) or deletes it on an exact full
  // sell. Returns realized P&L = quantity * (price - avg_price).
  // Throws MarketError(INSUFFICIENT_SHARES) when the holding is too small.
  AmountQ4 dispose(const std::string& user_id, const std::string& outcome_id,
                   AmountQ4 quantity, PriceQ4 price);

  // Shares locked behind the user's open LIMIT SELL orders on the outcome.
  AmountQ4 reserved(const std::string& user_id, const std::string& outcome_id) const;
  // quantity - reserved, never negative.
  AmountQ4 available(const std::string& user_id, const std::string& outcome_id) const;

  // Resolution: quantity -> 0, row kept for history.
  void close_out(const Holding& h);

  static PriceQ4 weighted_average(AmountQ4 old_qty, PriceQ4 old_avg,
                                  AmountQ4 qty, PriceQ4 price);
  static AmountQ4 realized_pnl(AmountQ4 qty, PriceQ4 price, PriceQ4 avg_price);
  // notional / price; price must be positive.
  static AmountQ4 shares_for_notional(AmountQ4 notional, PriceQ4 price);

private:
  Storage& db_;
};
