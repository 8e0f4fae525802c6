#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "domain/price.hpp"

class Storage;

enum class LedgerReason {
  Deposit,
  TradeBuy,
  TradeSell,
  OrderReserve,
  OrderReserveRelease,
  OrderCancelRefund,
  OrderRefund,
  ResolutionPayout,
};

// Tag persisted in transactions.type
const char* ledger_tag(LedgerReason reason);

struct LedgerMeta {
  std::optional<AmountQ4> realized_pnl;
  std::string order_id;
  std::string outcome_id;

  bool empty() const { return !realized_pnl && order_id.empty() && outcome_id.empty(); }
};

// Sole owner of users.balance and of the transactions table.
// apply() does not re-check sufficiency: callers validate before debiting,
// and the schema CHECK(balance >= 0) aborts the enclosing transaction otherwise.
class Ledger {
public:
  explicit Ledger(Storage& db) : db_(db) {}

  // balance += delta and one transactions row. Returns the transaction id.
  int64_t apply(const std::string& user_id, AmountQ4 delta,
                LedgerReason reason, const LedgerMeta& meta = {});

  // Throws MarketError(NOT_FOUND) for an unknown user.
  AmountQ4 balance(const std::string& user_id) const;

  static std::string encode_metadata(const LedgerMeta& meta);

private:
  Storage& db_;
};
