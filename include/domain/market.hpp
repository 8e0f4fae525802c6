#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "domain/price.hpp"

inline constexpr AmountQ4 kStartingBalanceQ4 = 1000 * kOneQ4;

struct User {
  std::string user_id;
  std::string name;
  std::string email;
  AmountQ4    balance = kStartingBalanceQ4;
  bool        is_admin = false;
  int64_t     created_ts = 0;
};

struct Market {
  std::string market_id;
  std::string title;
  std::string description;
  std::string category;
  std::string creator_id;
  int64_t     end_date_ms = 0;
  AmountQ4    volume = 0;     // cumulative traded notional
  bool        is_resolved = false;
  std::optional<std::string> resolved_outcome_id;
  int64_t     created_ts = 0;
};

struct Outcome {
  std::string outcome_id;
  std::string market_id;
  std::string title;
  std::string description;
  PriceQ4     probability = 0;
  bool        is_resolved = false;
};
