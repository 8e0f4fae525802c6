#include "engine/resolution_engine.hpp"

#include "domain/errors.hpp"
#include "engine/ledger.hpp"
#include "engine/position_book.hpp"
#include "storage/storage.hpp"
#include "utils/clock.hpp"
#include "utils/log.hpp"

#include <iostream>

ResolutionSummary ResolutionEngine::resolve(const std::string& admin_id,
                                            const std::string& market_id,
                                            const std::string& winning_outcome_id) {
  if (market_id.empty()) fail(pm::VALIDATION_ERROR, "market_id is required");
  if (winning_outcome_id.empty()) fail(pm::VALIDATION_ERROR, "winning outcome id is required");

  return db_.atomically([&]() {
    auto market = db_.find_market(market_id);
    if (!market) fail(pm::NOT_FOUND, "market not found: " + market_id);

    auto admin = db_.find_user(admin_id);
    if (!admin || !admin->is_admin) fail(pm::FORBIDDEN, "only administrators can resolve markets");

    if (market->is_resolved) fail(pm::ALREADY_RESOLVED, "market " + market_id + " is already resolved");

    auto winner = db_.find_outcome(winning_outcome_id);
    if (!winner || winner->market_id != market_id) {
      fail(pm::INVALID_OUTCOME, "outcome " + winning_outcome_id + " is not part of market " + market_id);
    }

    ResolutionSummary summary;

    // 1) terminal flags
    db_.mark_market_resolved(market_id, winning_outcome_id);
    db_.mark_outcome_resolved(winning_outcome_id);

    // 2) settle every positive holding
    for (const auto& h : db_.holdings_in_market(market_id)) {
      if (h.outcome_id == winning_outcome_id) {
        LedgerMeta meta;
        meta.outcome_id = h.outcome_id;
        ledger_.apply(h.user_id, h.quantity, LedgerReason::ResolutionPayout, meta); // 1.00 per share
        summary.total_payout = checked_add(summary.total_payout, h.quantity);
        ++summary.holders_paid;
      }
      positions_.close_out(h);
      ++summary.positions_closed;
    }

    // 3) close the book
    const int64_t now_ms = now_epoch_ms();
    for (const auto& o : db_.open_orders_in_market(market_id)) {
      const AmountQ4 refund = o.remaining();
      if (o.holds_reservation() && refund > 0) {
        LedgerMeta meta;
        meta.order_id   = o.order_id;
        meta.outcome_id = o.outcome_id;
        ledger_.apply(o.user_id, refund, LedgerReason::OrderRefund, meta);
        summary.total_refunded = checked_add(summary.total_refunded, refund);
      }
      db_.update_order_status(o.order_id, pm::CANCELLED, now_ms);
      ++summary.orders_cancelled;
    }

    if (engine_log_enabled()) {
      std::cout << "[ENGINE] [Resolution] market=" << market_id
                << " winner=" << winning_outcome_id
                << " paid=" << summary.holders_paid
                << " payout=" << q4_to_string(summary.total_payout)
                << " closed=" << summary.positions_closed
                << " cancelled=" << summary.orders_cancelled
                << " refunded=" << q4_to_string(summary.total_refunded) << "\n";
    }
    return summary;
  });
}
