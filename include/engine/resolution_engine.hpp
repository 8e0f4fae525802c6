#pragma once
#include <string>
#include "domain/price.hpp"

class Storage;
class Ledger;
class PositionBook;

struct ResolutionSummary {
  int      holders_paid     = 0;
  AmountQ4 total_payout     = 0;
  int      positions_closed = 0;
  int      orders_cancelled = 0;
  AmountQ4 total_refunded   = 0;
};

// Terminal transition of a market: winners get 1.00 per share, every holding
// in the market is zeroed, every OPEN order is cancelled (LIMIT BUY remainders
// refunded). One atomic unit; there is no un-resolve.
class ResolutionEngine {
public:
  ResolutionEngine(Storage& db, Ledger& ledger, PositionBook& positions)
    : db_(db), ledger_(ledger), positions_(positions) {}

  ResolutionSummary resolve(const std::string& admin_id,
                            const std::string& market_id,
                            const std::string& winning_outcome_id);

private:
  Storage&      db_;
  Ledger&       ledger_;
  PositionBook& positions_;
};
