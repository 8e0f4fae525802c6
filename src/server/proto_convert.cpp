#include "server/proto_convert.hpp"

int64_t from_decimal(const pm::Decimal& d) {
  return normalize_to_q4(d.raw(), d.scale());
}

void to_decimal(int64_t q4, pm::Decimal* out) {
  out->set_raw(q4);
  out->set_scale(kTargetScale);
}

void to_proto(const User& u, pm::User* out) {
  out->set_user_id(u.user_id);
  out->set_name(u.name);
  out->set_email(u.email);
  to_decimal(u.balance, out->mutable_balance());
  out->set_is_admin(u.is_admin);
}

void to_proto(const Outcome& o, pm::Outcome* out) {
  out->set_outcome_id(o.outcome_id);
  out->set_market_id(o.market_id);
  out->set_title(o.title);
  out->set_description(o.description);
  to_decimal(o.probability, out->mutable_probability());
  out->set_is_resolved(o.is_resolved);
}

void to_proto(const Market& m, const std::vector<Outcome>& outcomes, pm::Market* out) {
  out->set_market_id(m.market_id);
  out->set_title(m.title);
  out->set_description(m.description);
  out->set_category(m.category);
  out->set_end_date_ms(m.end_date_ms);
  to_decimal(m.volume, out->mutable_volume());
  out->set_is_resolved(m.is_resolved);
  if (m.resolved_outcome_id) out->set_resolved_outcome_id(*m.resolved_outcome_id);
  out->set_creator_id(m.creator_id);
  for (const auto& o : outcomes) to_proto(o, out->add_outcomes());
}

void to_proto(const Order& o, pm::Order* out) {
  out->set_order_id(o.order_id);
  out->set_user_id(o.user_id);
  out->set_market_id(o.market_id);
  out->set_outcome_id(o.outcome_id);
  out->set_side(o.side);
  out->set_kind(o.kind);
  to_decimal(o.amount, out->mutable_amount());
  to_decimal(o.price_q4, out->mutable_price());
  to_decimal(o.filled, out->mutable_filled());
  out->set_status(o.status);
  out->set_created_ms(o.created_ts);
}

void to_proto(const TradeRow& t, pm::Trade* out) {
  out->set_trade_id(t.trade_id);
  out->set_user_id(t.user_id);
  out->set_market_id(t.market_id);
  out->set_outcome_id(t.outcome_id);
  to_decimal(t.amount, out->mutable_amount());
  to_decimal(t.price, out->mutable_price());
  out->set_side(t.side);
  out->set_created_ms(t.created_ts);
}

void to_proto(const TransactionRow& t, pm::Transaction* out) {
  out->set_transaction_id(t.transaction_id);
  out->set_user_id(t.user_id);
  to_decimal(t.amount, out->mutable_amount());
  out->set_type(t.type);
  out->set_metadata(t.metadata);
  out->set_created_ms(t.created_ts);
}

void to_proto(const HoldingMetrics& h, pm::HoldingView* out) {
  out->set_holding_id(h.holding.holding_id);
  out->set_outcome_id(h.holding.outcome_id);
  out->set_outcome_title(h.outcome_title);
  to_decimal(h.holding.quantity, out->mutable_quantity());
  to_decimal(h.holding.avg_price, out->mutable_avg_price());
  to_decimal(h.current_price, out->mutable_current_price());
  to_decimal(h.current_value, out->mutable_current_value());
  to_decimal(h.unrealized_pnl, out->mutable_unrealized_pnl());
  to_decimal(h.percent_change, out->mutable_percent_change());
  out->set_is_winner(h.is_winner);
  out->set_position_side(h.holding.position_side);
}
