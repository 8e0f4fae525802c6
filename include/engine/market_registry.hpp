#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "domain/market.hpp"

class Storage;
class Ledger;

inline constexpr AmountQ4 kMinDepositQ4 = 10 * kOneQ4;
inline constexpr AmountQ4 kMaxDepositQ4 = 10000 * kOneQ4;
// every outcome must be able to sit at the 0.01 floor
inline constexpr std::size_t kMaxOutcomes = static_cast<std::size_t>(kOneQ4 / kMinProbQ4);

struct OutcomeSpec {
  std::string title;
  std::string description;
};

struct NewMarket {
  std::string title;
  std::string description;
  std::string category;
  int64_t     end_date_ms = 0;
  std::vector<OutcomeSpec> outcomes;
};

// Users, deposits and market creation. Admin checks live here too.
class MarketRegistry {
public:
  MarketRegistry(Storage& db, Ledger& ledger) : db_(db), ledger_(ledger) {}

  User register_user(const std::string& name, const std::string& email);
  // Creates the account as admin, or promotes an existing one.
  User ensure_admin(const std::string& name, const std::string& email);
  User grant_admin(const std::string& caller_id, const std::string& target_user_id);

  // Amount within [10, 10000]; returns the new balance.
  AmountQ4 deposit(const std::string& user_id, AmountQ4 amount);

  // Admin only; outcomes start at an equal split summing to 1.0000.
  Market create_market(const std::string& caller_id, const NewMarket& spec);

private:
  void require_admin_(const std::string& caller_id, const char* action) const;

  Storage& db_;
  Ledger&  ledger_;
};
