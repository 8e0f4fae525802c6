#include "engine/market_registry.hpp"

#include "domain/errors.hpp"
#include "engine/ledger.hpp"
#include "engine/pricing_engine.hpp"
#include "storage/storage.hpp"
#include "utils/clock.hpp"
#include "utils/log.hpp"
#include "utils/strings.hpp"

#include <iostream>

void MarketRegistry::require_admin_(const std::string& caller_id, const char* action) const {
  auto caller = db_.find_user(caller_id);
  if (!caller) fail(pm::NOT_FOUND, "user not found: " + caller_id);
  if (!caller->is_admin) fail(pm::FORBIDDEN, std::string("only administrators can ") + action);
}

User MarketRegistry::register_user(const std::string& name, const std::string& email) {
  const std::string clean_email = trim_ascii(email);
  if (clean_email.empty() || clean_email.find('@') == std::string::npos) {
    fail(pm::VALIDATION_ERROR, "a valid email is required");
  }

  return db_.atomically([&]() {
    if (db_.find_user_by_email(clean_email)) {
      fail(pm::VALIDATION_ERROR, "email already registered: " + clean_email);
    }
    User u;
    u.user_id    = db_.gen_user_id();
    u.name       = trim_ascii(name);
    u.email      = clean_email;
    u.balance    = kStartingBalanceQ4;
    u.is_admin   = false;
    u.created_ts = now_epoch_ms();
    db_.insert_user(u);

    if (engine_log_enabled()) {
      std::cout << "[ENGINE] [Registry] user=" << u.user_id << " email=" << u.email << " registered\n";
    }
    return u;
  });
}

User MarketRegistry::ensure_admin(const std::string& name, const std::string& email) {
  const std::string clean_email = trim_ascii(email);
  if (clean_email.empty()) fail(pm::VALIDATION_ERROR, "admin email is required");

  return db_.atomically([&]() {
    auto existing = db_.find_user_by_email(clean_email);
    if (existing) {
      if (!existing->is_admin) db_.set_admin(existing->user_id, true);
      existing->is_admin = true;
      return *existing;
    }
    User u;
    u.user_id    = db_.gen_user_id();
    u.name       = name.empty() ? std::string("admin") : name;
    u.email      = clean_email;
    u.is_admin   = true;
    u.created_ts = now_epoch_ms();
    db_.insert_user(u);
    return u;
  });
}

User MarketRegistry::grant_admin(const std::string& caller_id, const std::string& target_user_id) {
  return db_.atomically([&]() {
    require_admin_(caller_id, "grant admin rights");
    auto target = db_.find_user(target_user_id);
    if (!target) fail(pm::NOT_FOUND, "user not found: " + target_user_id);
    if (!target->is_admin) db_.set_admin(target_user_id, true);
    target->is_admin = true;
    return *target;
  });
}

AmountQ4 MarketRegistry::deposit(const std::string& user_id, AmountQ4 amount) {
  if (amount < kMinDepositQ4) fail(pm::VALIDATION_ERROR, "minimum deposit amount is 10");
  if (amount > kMaxDepositQ4) fail(pm::VALIDATION_ERROR, "maximum deposit amount is 10000");

  return db_.atomically([&]() {
    if (!db_.find_user(user_id)) fail(pm::NOT_FOUND, "user not found: " + user_id);
    ledger_.apply(user_id, amount, LedgerReason::Deposit);
    return ledger_.balance(user_id);
  });
}

Market MarketRegistry::create_market(const std::string& caller_id, const NewMarket& spec) {
  // --- validation ---------------------------------------------------------
  if (trim_ascii(spec.title).size() < 5) fail(pm::VALIDATION_ERROR, "title must be at least 5 characters");
  if (trim_ascii(spec.description).size() < 10) {
    fail(pm::VALIDATION_ERROR, "description must be at least 10 characters");
  }
  if (trim_ascii(spec.category).empty()) fail(pm::VALIDATION_ERROR, "category is required");
  if (spec.end_date_ms <= now_epoch_ms()) fail(pm::VALIDATION_ERROR, "end date must be in the future");
  if (spec.outcomes.size() < 2) fail(pm::VALIDATION_ERROR, "at least 2 outcomes are required");
  if (spec.outcomes.size() > kMaxOutcomes) {
    fail(pm::VALIDATION_ERROR, "at most " + std::to_string(kMaxOutcomes) + " outcomes are allowed");
  }
  for (const auto& o : spec.outcomes) {
    if (trim_ascii(o.title).empty()) fail(pm::VALIDATION_ERROR, "outcome title is required");
  }

  return db_.atomically([&]() {
    require_admin_(caller_id, "create markets");

    Market m;
    m.market_id   = db_.gen_market_id();
    m.title       = trim_ascii(spec.title);
    m.description = trim_ascii(spec.description);
    m.category    = trim_ascii(spec.category);
    m.creator_id  = caller_id;
    m.end_date_ms = spec.end_date_ms;
    m.created_ts  = now_epoch_ms();
    db_.insert_market(m);

    const auto split = PricingEngine::initial_split(spec.outcomes.size());
    for (std::size_t i = 0; i < spec.outcomes.size(); ++i) {
      Outcome o;
      o.outcome_id  = db_.gen_outcome_id();
      o.market_id   = m.market_id;
      o.title       = trim_ascii(spec.outcomes[i].title);
      o.description = spec.outcomes[i].description;
      o.probability = split[i];
      db_.insert_outcome(o);
    }

    if (engine_log_enabled()) {
      std::cout << "[ENGINE] [Registry] market=" << m.market_id
                << " outcomes=" << spec.outcomes.size()
                << " title=\"" << m.title << "\" created\n";
    }
    return m;
  });
}
