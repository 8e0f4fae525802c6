#pragma once
#include <cstdint>
#include <string>
#include "domain/price.hpp"
#include "domain/side.hpp"

// Row used when recording one side of an execution
struct TradeRow {
  int64_t     trade_id = 0;   // assigned by storage
  std::string user_id;
  std::string market_id;
  std::string outcome_id;
  AmountQ4    amount = 0;     // shares
  PriceQ4     price  = 0;
  Side        side   = pm::BUY;
  int64_t     created_ts = 0;
};

// Append-only audit row for a balance change
struct TransactionRow {
  int64_t     transaction_id = 0;
  std::string user_id;
  AmountQ4    amount = 0;     // signed
  std::string type;
  std::string metadata;       // JSON, may be empty
  int64_t     created_ts = 0;
};
