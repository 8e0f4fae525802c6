#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "domain/price.hpp"
#include "domain/side.hpp"

class Storage;

struct ImpactResult {
  PriceQ4 old_probability = 0;
  PriceQ4 new_probability = 0;
};

// Sole writer of outcomes.probability.
//
// A trade of notional N against a volume basis V moves the traded outcome by
//   impact = 0.1 * N / max(V, 1)
//   BUY:  p' = p + impact * (1 - p)
//   SELL: p' = p - impact * p
// clamped to [0.01, ceiling]. The siblings share 1 - p' in proportion to their
// previous probabilities, so the market always sums to exactly 1.0000.
// Every write is a compare-and-set against the value read; a lost race raises
// MarketError(CONFLICT) and the caller's transaction is retried.
class PricingEngine {
public:
  explicit PricingEngine(Storage& db) : db_(db) {}

  ImpactResult apply_trade_impact(const std::string& market_id,
                                  const std::string& outcome_id,
                                  AmountQ4 notional,
                                  Side side,
                                  AmountQ4 volume_basis);

  static PriceQ4 impacted_probability(PriceQ4 current, AmountQ4 notional,
                                      AmountQ4 volume_basis, Side side,
                                      PriceQ4 ceiling = kMaxProbQ4);

  // Highest probability one outcome may take so every sibling keeps 0.01.
  static PriceQ4 ceiling_for(std::size_t outcome_count);

  // Scales `previous` to sum to `remaining`, pinning anything that would fall
  // under 0.01. Rounding residue lands on the largest entry.
  static std::vector<PriceQ4> redistribute(const std::vector<PriceQ4>& previous,
                                           PriceQ4 remaining);

  // 1/N each; the residue goes to the first outcome.
  static std::vector<PriceQ4> initial_split(std::size_t outcome_count);

private:
  Storage& db_;
};
