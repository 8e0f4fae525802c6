#include "engine/market_queries.hpp"

#include "domain/errors.hpp"
#include "storage/storage.hpp"

#include <algorithm>
#include <iterator>

namespace {

std::vector<BookLevel> aggregate(const std::vector<Order>& side) {
  // input is already sorted best price first
  std::vector<BookLevel> levels;
  for (const auto& o : side) {
    if (!levels.empty() && levels.back().price == o.price_q4) {
      levels.back().volume += o.remaining();
    } else {
      levels.push_back(BookLevel{o.price_q4, o.remaining()});
    }
  }
  return levels;
}

} // namespace

MarketView MarketQueries::market(const std::string& market_id) const {
  auto m = db_.find_market(market_id);
  if (!m) fail(pm::NOT_FOUND, "market not found: " + market_id);

  MarketView v;
  v.market        = *m;
  v.outcomes      = db_.outcomes_for_market(market_id);
  v.recent_trades = db_.recent_trades(market_id, kRecentTradeCount);
  return v;
}

OrderBookView MarketQueries::order_book(const std::string& market_id,
                                        const std::string& outcome_id) const {
  if (!db_.find_market(market_id)) fail(pm::NOT_FOUND, "market not found: " + market_id);
  auto outcome = db_.find_outcome(outcome_id);
  if (!outcome || outcome->market_id != market_id) {
    fail(pm::INVALID_OUTCOME, "outcome " + outcome_id + " is not part of market " + market_id);
  }

  OrderBookView book;
  book.bids = aggregate(db_.resting_orders(market_id, outcome_id, pm::BUY));
  book.asks = aggregate(db_.resting_orders(market_id, outcome_id, pm::SELL));
  return book;
}

HoldingMetrics MarketQueries::metrics_for(const Holding& h, const Outcome& outcome, const Market& market) {
  HoldingMetrics m;
  m.holding        = h;
  m.outcome_title  = outcome.title;
  m.current_price  = outcome.probability;
  m.current_value  = mul_q4(h.quantity, outcome.probability);
  m.cost_basis     = mul_q4(h.quantity, h.avg_price);
  m.unrealized_pnl = m.current_value - m.cost_basis;
  m.percent_change = h.avg_price > 0
                       ? checked_mul(div_q4(outcome.probability - h.avg_price, h.avg_price), 100)
                       : 0;
  m.is_winner      = market.resolved_outcome_id.has_value() &&
                     *market.resolved_outcome_id == h.outcome_id;
  return m;
}

Portfolio MarketQueries::holdings(const std::string& user_id) const {
  if (!db_.find_user(user_id)) fail(pm::NOT_FOUND, "user not found: " + user_id);

  Portfolio p;
  for (const auto& h : db_.holdings_for_user(user_id)) {
    auto outcome = db_.find_outcome(h.outcome_id);
    if (!outcome) continue; // FK keeps this from happening
    auto market = db_.find_market(outcome->market_id);
    if (!market) continue;

    auto it = std::find_if(p.markets.begin(), p.markets.end(),
                           [&](const MarketPositions& mp) { return mp.market.market_id == market->market_id; });
    if (it == p.markets.end()) {
      p.markets.push_back(MarketPositions{*market, {}, 0, 0});
      it = std::prev(p.markets.end());
    }

    HoldingMetrics m = metrics_for(h, *outcome, *market);
    it->total_value += m.current_value;
    it->total_pnl   += m.unrealized_pnl;
    p.total_value   += m.current_value;
    p.total_pnl     += m.unrealized_pnl;
    it->holdings.push_back(std::move(m));
  }
  return p;
}

TransactionPage MarketQueries::transactions(const std::string& user_id, int page, int limit) const {
  if (page < 1) fail(pm::VALIDATION_ERROR, "invalid page parameter");
  if (limit < 1 || limit > kMaxPageSize) fail(pm::VALIDATION_ERROR, "invalid limit parameter");
  if (!db_.find_user(user_id)) fail(pm::NOT_FOUND, "user not found: " + user_id);

  TransactionPage out;
  out.total = db_.count_transactions(user_id);
  out.rows  = db_.list_transactions(user_id, limit, static_cast<int64_t>(page - 1) * limit);
  out.has_next_page = static_cast<int64_t>(page) * limit < out.total;
  return out;
}
