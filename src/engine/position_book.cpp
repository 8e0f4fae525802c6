#include "engine/position_book.hpp"

#include "domain/errors.hpp"
#include "storage/storage.hpp"
#include "utils/clock.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <iostream>

PriceQ4 PositionBook::weighted_average(AmountQ4 old_qty, PriceQ4 old_avg,
                                       AmountQ4 qty, PriceQ4 price) {
  const AmountQ4 total = checked_add(old_qty, qty);
  if (total <= 0) return price;
  // Q4*Q4 = Q8 cost basis, divided by a Q4 quantity gives Q4 again
  const int64_t cost = checked_add(checked_mul(old_qty, old_avg), checked_mul(qty, price));
  return round_div(cost, total);
}

AmountQ4 PositionBook::realized_pnl(AmountQ4 qty, PriceQ4 price, PriceQ4 avg_price) {
  return mul_q4(qty, price - avg_price);
}

AmountQ4 PositionBook::shares_for_notional(AmountQ4 notional, PriceQ4 price) {
  // Probabilities are floored at 0.01, so this only trips on corrupt rows.
  if (price <= 0) fail(pm::INTERNAL, "non-positive trade price");
  return div_q4(notional, price);
}

Holding PositionBook::acquire(const std::string& user_id, const std::string& outcome_id,
                              AmountQ4 quantity, PriceQ4 price) {
  if (quantity <= 0) fail(pm::VALIDATION_ERROR, "share quantity must be > 0");
  const int64_t now_ms = now_epoch_ms();

  auto existing = db_.find_holding(user_id, outcome_id);
  Holding h;
  if (existing) {
    h = *existing;
    h.avg_price  = weighted_average(h.quantity, h.avg_price, quantity, price);
    h.quantity   = checked_add(h.quantity, quantity);
    h.updated_ts = now_ms;
    db_.update_holding(h.holding_id, h.quantity, h.avg_price, now_ms);
  } else {
    h.holding_id    = db_.gen_holding_id();
    h.user_id       = user_id;
    h.outcome_id    = outcome_id;
    h.quantity      = quantity;
    h.avg_price     = price;
    h.position_side = pm::YES;
    h.updated_ts    = now_ms;
    db_.insert_holding(h);
  }

  if (engine_log_enabled()) {
    std::cout << "[ENGINE] [Positions] acquire user=" << user_id
              << " outcome=" << outcome_id
              << " qty=" << q4_to_string(quantity)
              << " px=" << q4_to_string(price)
              << " -> qty=" << q4_to_string(h.quantity)
              << " avg=" << q4_to_string(h.avg_price) << "\n";
  }
  return h;
}

AmountQ4 PositionBook::dispose(const std::string& user_id, const std::string& outcome_id,
                               AmountQ4 quantity, PriceQ4 price) {
  if (quantity <= 0) fail(pm::VALIDATION_ERROR, "share quantity must be > 0");

  auto h = db_.find_holding(user_id, outcome_id);
  if (!h || h->quantity < quantity) {
    fail(pm::INSUFFICIENT_SHARES, "insufficient shares to sell");
  }

  const AmountQ4 pnl = realized_pnl(quantity, price, h->avg_price);
  if (h->quantity == quantity) {
    db_.delete_holding(h->holding_id);
  } else {
    db_.update_holding(h->holding_id, h->quantity - quantity, h->avg_price, now_epoch_ms());
  }

  if (engine_log_enabled()) {
    std::cout << "[ENGINE] [Positions] dispose user=" << user_id
              << " outcome=" << outcome_id
              << " qty=" << q4_to_string(quantity)
              << " px=" << q4_to_string(price)
              << " pnl=" << q4_to_string(pnl) << "\n";
  }
  return pnl;
}

AmountQ4 PositionBook::reserved(const std::string& user_id, const std::string& outcome_id) const {
  return db_.reserved_sell_quantity(user_id, outcome_id);
}

AmountQ4 PositionBook::available(const std::string& user_id, const std::string& outcome_id) const {
  auto h = db_.find_holding(user_id, outcome_id);
  if (!h) return 0;
  return std::max<AmountQ4>(0, h->quantity - reserved(user_id, outcome_id));
}

void PositionBook::close_out(const Holding& h) {
  db_.update_holding(h.holding_id, 0, h.avg_price, now_epoch_ms());
}
