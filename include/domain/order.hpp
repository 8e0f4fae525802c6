#pragma once
#include <cstdint>
#include <string>
#include "domain/price.hpp"
#include "domain/side.hpp"

// amount and filled are share quantities (Q4).
struct Order {
  std::string order_id;
  std::string user_id;
  std::string market_id;
  std::string outcome_id;
  Side        side   = pm::BUY;
  OrderKind   kind   = pm::LIMIT;
  AmountQ4    amount = 0;
  PriceQ4     price_q4 = 0;   // LIMIT: caller price, MARKET: probability snapshot
  AmountQ4    filled = 0;
  OrderStatus status = pm::OPEN;
  int64_t     created_ts = 0;  // epoch ms
  int64_t     updated_ts = 0;

  AmountQ4 remaining() const { return amount - filled; }
  bool is_open() const { return status == pm::OPEN; }

  // LIMIT BUY orders hold a balance reservation of `amount` until filled,
  // cancelled or resolved. MARKET remainders never carry one.
  bool holds_reservation() const { return kind == pm::LIMIT && side == pm::BUY; }

  // Factory that enforces normalization of wire decimals
  static Order FromRaw(std::string user_id,
                       std::string market_id,
                       std::string outcome_id,
                       Side side,
                       OrderKind kind,
                       int64_t raw_amount, int amount_scale,
                       int64_t raw_price, int price_scale) {
    Order o;
    o.user_id    = std::move(user_id);
    o.market_id  = std::move(market_id);
    o.outcome_id = std::move(outcome_id);
    o.side       = side;
    o.kind       = kind;
    o.amount     = normalize_to_q4(raw_amount, amount_scale);
    o.price_q4   = kind == pm::LIMIT ? normalize_to_q4(raw_price, price_scale) : 0;
    return o;
  }
};
