#pragma once
#include <string>
#include <vector>
#include "domain/market.hpp"
#include "domain/order.hpp"
#include "domain/records.hpp"
#include "engine/pricing_engine.hpp"

class Storage;
class Ledger;
class PositionBook;

struct PlaceResult {
  Order order;
  std::vector<std::string> matched_order_ids;
  bool fully_filled = false;
};

struct TradeResult {
  TradeRow     trade;
  AmountQ4     notional = 0;
  ImpactResult impact;
};

// Owns the order lifecycle (OPEN -> FILLED | CANCELLED) and orchestrates the
// ledger, position book and pricing engine. Every public call is one
// atomic SQLite transaction; nothing is kept in memory between calls.
//
// Only LIMIT orders rest. A MARKET order walks the opposite side of the book
// (best price, then oldest first) filling at the maker's price; whatever is
// left is abandoned and the order stays OPEN with its partial fill.
class MatchingEngine {
public:
  MatchingEngine(Storage& db, Ledger& ledger, PositionBook& positions, PricingEngine& pricing)
    : db_(db), ledger_(ledger), positions_(positions), pricing_(pricing) {}

  MatchingEngine(const MatchingEngine&) = delete;
  MatchingEngine& operator=(const MatchingEngine&) = delete;

  // incoming carries user/market/outcome/side/kind/amount (+ price for LIMIT).
  PlaceResult place(const Order& incoming);

  // Owner or admin; OPEN orders on unresolved markets only.
  Order cancel(const std::string& caller_id, const std::string& order_id);

  // Immediate execution against the outcome probability (no counterparty).
  // shares_mode: amount is a share count rather than a notional.
  TradeResult execute_trade(const std::string& user_id,
                            const std::string& market_id,
                            const std::string& outcome_id,
                            AmountQ4 amount,
                            Side side,
                            bool shares_mode);

private:
  struct Context {
    User    user;
    Market  market;
    Outcome outcome;
  };

  // NOT_FOUND / MARKET_RESOLVED / INVALID_OUTCOME checks shared by both paths.
  Context load_tradeable_(const std::string& user_id,
                          const std::string& market_id,
                          const std::string& outcome_id) const;

  void match_(Order& taker, Market& market, std::vector<std::string>& matched);
  void fill_(Order& taker, Order& maker, AmountQ4 qty, Market& market);

  Storage&       db_;
  Ledger&        ledger_;
  PositionBook&  positions_;
  PricingEngine& pricing_;
};
