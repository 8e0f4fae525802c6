#include "engine/pricing_engine.hpp"

#include "domain/errors.hpp"
#include "storage/storage.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <iostream>

PriceQ4 PricingEngine::ceiling_for(std::size_t outcome_count) {
  if (outcome_count <= 1) return kMaxProbQ4;
  const int64_t siblings_floor = kMinProbQ4 * static_cast<int64_t>(outcome_count - 1);
  return std::max<PriceQ4>(kMinProbQ4, std::min<PriceQ4>(kMaxProbQ4, kOneQ4 - siblings_floor));
}

PriceQ4 PricingEngine::impacted_probability(PriceQ4 current, AmountQ4 notional,
                                            AmountQ4 volume_basis, Side side,
                                            PriceQ4 ceiling) {
  const AmountQ4 volume = std::max<AmountQ4>(volume_basis, kOneQ4); // treat < 1 as 1
  PriceQ4 next = current;

  if (notional > 0) {
    // impact >= 1 once N >= 10 * V: the move saturates at the bound
    const bool saturated = notional >= checked_mul(volume, 10);
    if (side == pm::BUY) {
      next = saturated ? kOneQ4
                       : current + round_div(checked_mul(notional, kOneQ4 - current),
                                             checked_mul(volume, 10));
    } else {
      next = saturated ? 0
                       : current - round_div(checked_mul(notional, current),
                                             checked_mul(volume, 10));
    }
  }
  return std::clamp<PriceQ4>(next, kMinProbQ4, std::max(ceiling, kMinProbQ4));
}

std::vector<PriceQ4> PricingEngine::redistribute(const std::vector<PriceQ4>& previous,
                                                 PriceQ4 remaining) {
  const std::size_t n = previous.size();
  std::vector<PriceQ4> out(n, kMinProbQ4);
  if (n == 0) return out;

  std::vector<bool> pinned(n, false);
  int64_t free_total = 0;   // remaining minus what the pinned entries hold
  int64_t weight     = 0;   // sum of previous over unpinned entries

  for (;;) {
    std::size_t pinned_count = 0;
    weight = 0;
    for (std::size_t i = 0; i < n; ++i) {
      if (pinned[i]) ++pinned_count;
      else weight = checked_add(weight, std::max<PriceQ4>(previous[i], 0));
    }
    free_total = remaining - kMinProbQ4 * static_cast<int64_t>(pinned_count);
    if (pinned_count == n || weight <= 0) break;

    bool pinned_more = false;
    for (std::size_t i = 0; i < n; ++i) {
      if (pinned[i]) continue;
      // share < 0.01  <=>  previous * free_total < 0.01 * weight
      if (checked_mul(previous[i], free_total) < checked_mul(kMinProbQ4, weight)) {
        pinned[i] = true;
        pinned_more = true;
      }
    }
    if (!pinned_more) break;
  }

  if (weight <= 0) {
    // Degenerate previous row: split evenly among the unpinned entries.
    std::size_t free_count = 0;
    for (std::size_t i = 0; i < n; ++i) if (!pinned[i]) ++free_count;
    for (std::size_t i = 0; i < n && free_count > 0; ++i) {
      if (!pinned[i]) out[i] = free_total / static_cast<int64_t>(free_count);
    }
  } else {
    for (std::size_t i = 0; i < n; ++i) {
      if (!pinned[i]) out[i] = round_div(checked_mul(previous[i], free_total), weight);
    }
  }

  int64_t sum = 0;
  for (auto p : out) sum += p;
  const int64_t residue = remaining - sum;
  if (residue != 0) {
    auto largest = std::max_element(out.begin(), out.end());
    *largest += residue;
  }
  return out;
}

std::vector<PriceQ4> PricingEngine::initial_split(std::size_t outcome_count) {
  std::vector<PriceQ4> out;
  if (outcome_count == 0) return out;
  const int64_t n = static_cast<int64_t>(outcome_count);
  out.assign(outcome_count, kOneQ4 / n);
  out.front() += kOneQ4 - (kOneQ4 / n) * n;
  return out;
}

ImpactResult PricingEngine::apply_trade_impact(const std::string& market_id,
                                               const std::string& outcome_id,
                                               AmountQ4 notional,
                                               Side side,
                                               AmountQ4 volume_basis) {
  const auto outcomes = db_.outcomes_for_market(market_id);
  auto traded = std::find_if(outcomes.begin(), outcomes.end(),
                             [&](const Outcome& o) { return o.outcome_id == outcome_id; });
  if (traded == outcomes.end()) {
    fail(pm::INVALID_OUTCOME, "outcome " + outcome_id + " is not part of market " + market_id);
  }

  ImpactResult r;
  r.old_probability = traded->probability;
  r.new_probability = impacted_probability(traded->probability, notional, volume_basis,
                                           side, ceiling_for(outcomes.size()));

  if (!db_.compare_and_set_probability(outcome_id, r.old_probability, r.new_probability)) {
    fail(pm::CONFLICT, "probability of " + outcome_id + " changed concurrently");
  }

  if (outcomes.size() > 1) {
    std::vector<PriceQ4> previous;
    for (const auto& o : outcomes) {
      if (o.outcome_id != outcome_id) previous.push_back(o.probability);
    }
    const auto next = redistribute(previous, kOneQ4 - r.new_probability);

    std::size_t k = 0;
    for (const auto& o : outcomes) {
      if (o.outcome_id == outcome_id) continue;
      if (!db_.compare_and_set_probability(o.outcome_id, o.probability, next[k])) {
        fail(pm::CONFLICT, "probability of " + o.outcome_id + " changed concurrently");
      }
      ++k;
    }
  }

  if (engine_log_enabled()) {
    std::cout << "[ENGINE] [Pricing] market=" << market_id
              << " outcome=" << outcome_id
              << " side=" << side_str(side)
              << " notional=" << q4_to_string(notional)
              << " basis=" << q4_to_string(volume_basis)
              << " prob " << q4_to_string(r.old_probability)
              << " -> " << q4_to_string(r.new_probability) << "\n";
  }
  return r;
}
