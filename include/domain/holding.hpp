#pragma once
#include <cstdint>
#include <string>
#include "domain/price.hpp"
#include "domain/side.hpp"

// One row per (user, outcome). Deleted on a full sell, zeroed on resolution.
struct Holding {
  std::string  holding_id;
  std::string  user_id;
  std::string  outcome_id;
  AmountQ4     quantity  = 0;
  PriceQ4      avg_price = 0;   // cost basis per share
  PositionSide position_side = pm::YES;
  int64_t      updated_ts = 0;
};
