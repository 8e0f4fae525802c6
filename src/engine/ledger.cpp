#include "engine/ledger.hpp"

#include "domain/errors.hpp"
#include "prediction_market.pb.h"
#include "storage/storage.hpp"
#include "utils/clock.hpp"
#include "utils/log.hpp"

#include <google/protobuf/util/json_util.h>
#include <iostream>

const char* ledger_tag(LedgerReason reason) {
  switch (reason) {
    case LedgerReason::Deposit:             return "DEPOSIT";
    case LedgerReason::TradeBuy:            return "TRADE_BUY";
    case LedgerReason::TradeSell:           return "TRADE_SELL";
    case LedgerReason::OrderReserve:        return "ORDER_RESERVE";
    case LedgerReason::OrderReserveRelease: return "ORDER_RESERVE_RELEASE";
    case LedgerReason::OrderCancelRefund:   return "ORDER_CANCEL_REFUND";
    case LedgerReason::OrderRefund:         return "ORDER_REFUND";
    case LedgerReason::ResolutionPayout:    return "MARKET_RESOLUTION_PAYOUT";
  }
  return "UNKNOWN";
}

std::string Ledger::encode_metadata(const LedgerMeta& meta) {
  if (meta.empty()) return {};

  pm::TransactionMetadata msg;
  if (meta.realized_pnl) {
    msg.mutable_realized_pnl()->set_raw(*meta.realized_pnl);
    msg.mutable_realized_pnl()->set_scale(kTargetScale);
  }
  msg.set_order_id(meta.order_id);
  msg.set_outcome_id(meta.outcome_id);

  google::protobuf::util::JsonPrintOptions opts;
  opts.preserve_proto_field_names = true;

  std::string json;
  const auto status = google::protobuf::util::MessageToJsonString(msg, &json, opts);
  if (!status.ok()) {
    throw MarketError(pm::INTERNAL, "metadata encoding failed");
  }
  return json;
}

int64_t Ledger::apply(const std::string& user_id, AmountQ4 delta,
                      LedgerReason reason, const LedgerMeta& meta) {
  db_.adjust_balance(user_id, delta);

  TransactionRow row;
  row.user_id    = user_id;
  row.amount     = delta;
  row.type       = ledger_tag(reason);
  row.metadata   = encode_metadata(meta);
  row.created_ts = now_epoch_ms();
  const int64_t id = db_.insert_transaction(row);

  if (engine_log_enabled()) {
    std::cout << "[ENGINE] [Ledger] txn=" << id
              << " user=" << user_id
              << " delta=" << q4_to_string(delta)
              << " type=" << row.type << "\n";
  }
  return id;
}

AmountQ4 Ledger::balance(const std::string& user_id) const {
  auto user = db_.find_user(user_id);
  if (!user) fail(pm::NOT_FOUND, "user not found: " + user_id);
  return user->balance;
}
