#include "engine/matching_engine.hpp"

#include "domain/errors.hpp"
#include "engine/ledger.hpp"
#include "engine/position_book.hpp"
#include "storage/storage.hpp"
#include "utils/clock.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <iostream>

namespace {

bool valid_side(Side s) { return s == pm::BUY || s == pm::SELL; }
bool valid_kind(OrderKind k) { return k == pm::LIMIT || k == pm::MARKET; }

} // namespace

// -------------------- shared checks --------------------

MatchingEngine::Context MatchingEngine::load_tradeable_(const std::string& user_id,
                                                        const std::string& market_id,
                                                        const std::string& outcome_id) const {
  auto user = db_.find_user(user_id);
  if (!user) fail(pm::NOT_FOUND, "user not found: " + user_id);

  auto market = db_.find_market(market_id);
  if (!market) fail(pm::NOT_FOUND, "market not found: " + market_id);
  if (market->is_resolved) fail(pm::MARKET_RESOLVED, "market " + market_id + " is resolved");

  auto outcome = db_.find_outcome(outcome_id);
  if (!outcome || outcome->market_id != market_id) {
    fail(pm::INVALID_OUTCOME, "outcome " + outcome_id + " is not part of market " + market_id);
  }
  return Context{*user, *market, *outcome};
}

// -------------------- place --------------------

PlaceResult MatchingEngine::place(const Order& incoming) {
  // --- validation (no state touched yet) ----------------------------------
  if (incoming.user_id.empty() || incoming.market_id.empty() || incoming.outcome_id.empty()) {
    fail(pm::VALIDATION_ERROR, "user_id, market_id and outcome_id are required");
  }
  if (!valid_side(incoming.side)) fail(pm::VALIDATION_ERROR, "side must be BUY or SELL");
  if (!valid_kind(incoming.kind)) fail(pm::VALIDATION_ERROR, "order kind must be LIMIT or MARKET");
  if (incoming.amount <= 0) fail(pm::VALIDATION_ERROR, "amount must be > 0");
  if (incoming.kind == pm::LIMIT &&
      (incoming.price_q4 < kMinProbQ4 || incoming.price_q4 > kMaxProbQ4)) {
    fail(pm::VALIDATION_ERROR, "limit price must be within [0.01, 0.99]");
  }

  return db_.atomically([&]() {
    Context ctx = load_tradeable_(incoming.user_id, incoming.market_id, incoming.outcome_id);

    if (incoming.side == pm::BUY) {
      // amount shares never cost more than amount at a price <= 1
      if (ctx.user.balance < incoming.amount) {
        fail(pm::INSUFFICIENT_BALANCE, "insufficient balance");
      }
    } else if (positions_.available(incoming.user_id, incoming.outcome_id) < incoming.amount) {
      fail(pm::INSUFFICIENT_SHARES, "insufficient shares to sell");
    }

    const int64_t now_ms = now_epoch_ms();
    PlaceResult result;
    Order& o = result.order;
    o = incoming;
    o.order_id   = db_.gen_order_id();
    o.price_q4   = incoming.kind == pm::LIMIT ? incoming.price_q4 : ctx.outcome.probability;
    o.filled     = 0;
    o.status     = pm::OPEN;
    o.created_ts = now_ms;
    o.updated_ts = now_ms;
    db_.insert_order(o);

    if (engine_log_enabled()) {
      std::cout << "[ENGINE] [Matching] new oid=" << o.order_id
                << " user=" << o.user_id
                << " outcome=" << o.outcome_id
                << " " << side_str(o.side) << " " << kind_str(o.kind)
                << " amount=" << q4_to_string(o.amount)
                << " px=" << q4_to_string(o.price_q4) << "\n";
    }

    if (o.kind == pm::MARKET) {
      match_(o, ctx.market, result.matched_order_ids);
      result.fully_filled = o.filled == o.amount;
      return result;
    }

    // LIMIT rests without matching; BUY reserves its worst-case cost now,
    // SELL is covered by the reserved-quantity check at placement.
    if (o.side == pm::BUY) {
      LedgerMeta meta;
      meta.order_id   = o.order_id;
      meta.outcome_id = o.outcome_id;
      ledger_.apply(o.user_id, -o.amount, LedgerReason::OrderReserve, meta);
    }
    return result;
  });
}

void MatchingEngine::match_(Order& taker, Market& market, std::vector<std::string>& matched) {
  // Snapshot of the opposite side; maker rows are updated as we go.
  auto book = db_.resting_orders(taker.market_id, taker.outcome_id, opposite(taker.side));

  for (auto& maker : book) {
    if (taker.remaining() <= 0) break;
    if (maker.user_id == taker.user_id) continue; // no self-trades
    const AmountQ4 qty = std::min(taker.remaining(), maker.remaining());
    if (qty <= 0) continue;
    if (mul_q4(qty, maker.price_q4) <= 0) continue; // dust: would move shares for nothing

    fill_(taker, maker, qty, market);
    matched.push_back(maker.order_id);
  }

  if (taker.filled > 0) {
    taker.status     = taker.filled == taker.amount ? pm::FILLED : pm::OPEN;
    taker.updated_ts = now_epoch_ms();
    db_.update_order_fill(taker.order_id, taker.filled, taker.status, taker.updated_ts);
  }

  if (engine_log_enabled()) {
    std::cout << "[ENGINE] [Matching] oid=" << taker.order_id
              << " filled=" << q4_to_string(taker.filled)
              << "/" << q4_to_string(taker.amount)
              << " makers=" << matched.size()
              << " status=" << status_str(taker.status) << "\n";
  }
}

void MatchingEngine::fill_(Order& taker, Order& maker, AmountQ4 qty, Market& market) {
  const PriceQ4  price    = maker.price_q4;     // maker sets the price
  const AmountQ4 notional = mul_q4(qty, price);
  const int64_t  now_ms   = now_epoch_ms();

  maker.filled    += qty;
  maker.status     = maker.filled == maker.amount ? pm::FILLED : pm::OPEN;
  maker.updated_ts = now_ms;
  db_.update_order_fill(maker.order_id, maker.filled, maker.status, now_ms);
  taker.filled += qty;

  // one trade row per counterparty
  for (const Order* side_order : {&taker, &maker}) {
    TradeRow t;
    t.user_id    = side_order->user_id;
    t.market_id  = side_order->market_id;
    t.outcome_id = side_order->outcome_id;
    t.amount     = qty;
    t.price      = price;
    t.side       = side_order->side;
    t.created_ts = now_ms;
    db_.insert_trade(t);
  }

  const Order& buy  = taker.side == pm::BUY ? taker : maker;
  const Order& sell = taker.side == pm::BUY ? maker : taker;

  positions_.acquire(buy.user_id, buy.outcome_id, qty, price);
  const AmountQ4 pnl = positions_.dispose(sell.user_id, sell.outcome_id, qty, price);

  LedgerMeta buy_meta;
  buy_meta.order_id   = buy.order_id;
  buy_meta.outcome_id = buy.outcome_id;
  if (buy.holds_reservation()) {
    // qty of the reservation is consumed; hand back what the fill didn't cost
    const AmountQ4 release = qty - notional;
    if (release > 0) ledger_.apply(buy.user_id, release, LedgerReason::OrderReserveRelease, buy_meta);
  } else {
    ledger_.apply(buy.user_id, -notional, LedgerReason::TradeBuy, buy_meta);
  }

  LedgerMeta sell_meta;
  sell_meta.order_id     = sell.order_id;
  sell_meta.outcome_id   = sell.outcome_id;
  sell_meta.realized_pnl = pnl;
  ledger_.apply(sell.user_id, notional, LedgerReason::TradeSell, sell_meta);

  // volume first, then price impact against the updated volume
  db_.add_market_volume(market.market_id, notional);
  market.volume = checked_add(market.volume, notional);
  pricing_.apply_trade_impact(market.market_id, taker.outcome_id, notional, taker.side, market.volume);

  if (engine_log_enabled()) {
    std::cout << "[ENGINE] [Matching] fill taker=" << taker.order_id
              << " maker=" << maker.order_id
              << " qty=" << q4_to_string(qty)
              << " px=" << q4_to_string(price)
              << " notional=" << q4_to_string(notional) << "\n";
  }
}

// -------------------- cancel --------------------

Order MatchingEngine::cancel(const std::string& caller_id, const std::string& order_id) {
  if (order_id.empty()) fail(pm::VALIDATION_ERROR, "order_id is required");

  return db_.atomically([&]() {
    auto order = db_.find_order(order_id);
    if (!order) fail(pm::NOT_FOUND, "order not found: " + order_id);

    auto caller = db_.find_user(caller_id);
    if (!caller) fail(pm::NOT_FOUND, "user not found: " + caller_id);
    if (order->user_id != caller_id && !caller->is_admin) {
      fail(pm::FORBIDDEN, "only the owner or an administrator may cancel " + order_id);
    }
    if (!order->is_open()) {
      fail(pm::ALREADY_CLOSED, "order " + order_id + " is " + status_str(order->status));
    }
    auto market = db_.find_market(order->market_id);
    if (!market) fail(pm::NOT_FOUND, "market not found: " + order->market_id);
    if (market->is_resolved) fail(pm::MARKET_RESOLVED, "market " + market->market_id + " is resolved");

    const int64_t now_ms = now_epoch_ms();
    db_.update_order_status(order_id, pm::CANCELLED, now_ms);
    order->status     = pm::CANCELLED;
    order->updated_ts = now_ms;

    // refund goes to the owner even when an admin cancels
    const AmountQ4 refund = order->remaining();
    if (order->holds_reservation() && refund > 0) {
      LedgerMeta meta;
      meta.order_id   = order->order_id;
      meta.outcome_id = order->outcome_id;
      ledger_.apply(order->user_id, refund, LedgerReason::OrderCancelRefund, meta);
    }

    if (engine_log_enabled()) {
      std::cout << "[ENGINE] [Matching] cancel oid=" << order_id
                << " by=" << caller_id
                << " refund=" << q4_to_string(order->holds_reservation() ? refund : 0) << "\n";
    }
    return *order;
  });
}

// -------------------- immediate trade --------------------

TradeResult MatchingEngine::execute_trade(const std::string& user_id,
                                          const std::string& market_id,
                                          const std::string& outcome_id,
                                          AmountQ4 amount,
                                          Side side,
                                          bool shares_mode) {
  if (user_id.empty() || market_id.empty() || outcome_id.empty()) {
    fail(pm::VALIDATION_ERROR, "user_id, market_id and outcome_id are required");
  }
  if (!valid_side(side)) fail(pm::VALIDATION_ERROR, "side must be BUY or SELL");
  if (amount <= 0) fail(pm::VALIDATION_ERROR, "amount must be > 0");

  return db_.atomically([&]() {
    Context ctx = load_tradeable_(user_id, market_id, outcome_id);
    const PriceQ4 price = ctx.outcome.probability;

    const AmountQ4 shares   = shares_mode ? amount : PositionBook::shares_for_notional(amount, price);
    const AmountQ4 notional = shares_mode ? mul_q4(amount, price) : amount;
    if (shares <= 0 || notional <= 0) fail(pm::VALIDATION_ERROR, "amount too small to trade");

    TradeResult result;
    result.notional = notional;

    if (side == pm::BUY) {
      if (ctx.user.balance < notional) fail(pm::INSUFFICIENT_BALANCE, "insufficient balance");
      positions_.acquire(user_id, outcome_id, shares, price);

      LedgerMeta meta;
      meta.outcome_id = outcome_id;
      ledger_.apply(user_id, -notional, LedgerReason::TradeBuy, meta);
    } else {
      if (positions_.available(user_id, outcome_id) < shares) {
        fail(pm::INSUFFICIENT_SHARES, "insufficient shares to sell");
      }
      LedgerMeta meta;
      meta.outcome_id   = outcome_id;
      meta.realized_pnl = positions_.dispose(user_id, outcome_id, shares, price);
      ledger_.apply(user_id, notional, LedgerReason::TradeSell, meta);
    }

    TradeRow& t = result.trade;
    t.user_id    = user_id;
    t.market_id  = market_id;
    t.outcome_id = outcome_id;
    t.amount     = shares;
    t.price      = price;
    t.side       = side;
    t.created_ts = now_epoch_ms();
    t.trade_id   = db_.insert_trade(t);

    // impact is measured against the volume before this trade
    const AmountQ4 basis = ctx.market.volume;
    db_.add_market_volume(market_id, notional);
    result.impact = pricing_.apply_trade_impact(market_id, outcome_id, notional, side, basis);

    if (engine_log_enabled()) {
      std::cout << "[ENGINE] [Matching] trade id=" << t.trade_id
                << " user=" << user_id
                << " " << side_str(side)
                << " shares=" << q4_to_string(shares)
                << " px=" << q4_to_string(price)
                << " notional=" << q4_to_string(notional) << "\n";
    }
    return result;
  });
}
