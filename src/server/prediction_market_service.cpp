#include "server/prediction_market_service.hpp"
#include "server/proto_convert.hpp"

#include "domain/errors.hpp"
#include "domain/order.hpp"
#include "engine/ledger.hpp"
#include "engine/market_queries.hpp"
#include "engine/market_registry.hpp"
#include "engine/matching_engine.hpp"
#include "engine/position_book.hpp"
#include "engine/pricing_engine.hpp"
#include "engine/resolution_engine.hpp"
#include "storage/storage.hpp"
#include "utils/strings.hpp"

#include <SQLiteCpp/SQLiteCpp.h>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>

struct PredictionMarketServiceImpl::Impl {
  Impl(const std::string& db_path, int max_attempts)
    : db(db_path),
      ledger(db),
      positions(db),
      pricing(db),
      matching(db, ledger, positions, pricing),
      resolution(db, ledger, positions),
      registry(db, ledger),
      queries(db) {
    db.init();
    db.set_max_attempts(max_attempts);
  }

  Storage          db;
  Ledger           ledger;
  PositionBook     positions;
  PricingEngine    pricing;
  MatchingEngine   matching;
  ResolutionEngine resolution;
  MarketRegistry   registry;
  MarketQueries    queries;
  std::mutex       write_mu;   // one SQLite connection: every RPC runs under this
};

namespace {

template <typename Resp>
void reject(const char* rpc, Resp* resp, ErrorCode code, const std::string& msg) {
  resp->set_success(false);
  resp->set_error_code(code);
  resp->set_error_message(msg);
  std::cerr << "[SERVER] [" << rpc << (code == pm::INTERNAL ? "][error]" : "][reject]")
            << " code=" << error_code_str(code) << " reason=" << msg << "\n";
}

// Runs one RPC body under the connection mutex and maps every failure onto
// the response envelope. Transport status is always OK.
template <typename Resp, typename Fn>
grpc::Status run_rpc(const char* rpc, std::mutex& mu, Resp* resp, Fn&& body) {
  const auto t0 = std::chrono::steady_clock::now();
  try {
    std::lock_guard<std::mutex> lk(mu);
    body();
    resp->set_success(true);
    resp->set_error_code(pm::OK);
    std::cout << "[SERVER] [" << rpc << "][ok]";
  } catch (const MarketError& e) {
    reject(rpc, resp, e.code(), e.what());
  } catch (const SQLite::Exception& e) {
    reject(rpc, resp, pm::INTERNAL, std::string("storage error: ") + e.what());
  } catch (const std::overflow_error& e) {
    reject(rpc, resp, pm::VALIDATION_ERROR, std::string("amount out of range: ") + e.what());
  } catch (const std::invalid_argument& e) {
    // bad decimal scale
    reject(rpc, resp, pm::VALIDATION_ERROR, e.what());
  } catch (const std::domain_error& e) {
    reject(rpc, resp, pm::VALIDATION_ERROR, e.what());
  } catch (const std::exception& e) {
    reject(rpc, resp, pm::INTERNAL, e.what());
  }
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - t0).count();
  std::cout << " [" << rpc << "] took " << us << " us\n";
  return grpc::Status::OK;
}

void fill_market_response(const MarketView& v, pm::MarketResponse* resp) {
  to_proto(v.market, v.outcomes, resp->mutable_market());
  for (const auto& t : v.recent_trades) to_proto(t, resp->add_recent_trades());
}

void fill_levels(const std::vector<BookLevel>& levels,
                 google::protobuf::RepeatedPtrField<pm::PriceLevel>* out) {
  for (const auto& l : levels) {
    auto* pl = out->Add();
    to_decimal(l.price, pl->mutable_price());
    to_decimal(l.volume, pl->mutable_volume());
  }
}

} // namespace

PredictionMarketServiceImpl::PredictionMarketServiceImpl(std::string db_path, int max_attempts)
  : d_(std::make_unique<Impl>(db_path, max_attempts)) {}

PredictionMarketServiceImpl::~PredictionMarketServiceImpl() = default;

std::string PredictionMarketServiceImpl::bootstrap_admin(const std::string& name,
                                                         const std::string& email) {
  std::lock_guard<std::mutex> lk(d_->write_mu);
  const User admin = d_->registry.ensure_admin(name, email);
  std::cout << "[SERVER] admin ready user=" << admin.user_id << " email=" << admin.email << "\n";
  return admin.user_id;
}

// -------------------- trading --------------------

grpc::Status PredictionMarketServiceImpl::PlaceOrder(grpc::ServerContext*,
                                                     const pm::PlaceOrderRequest* req,
                                                     pm::PlaceOrderResponse* resp) {
  std::cout << "[SERVER] [PlaceOrder] ========== New Order\n"
            << "  user=" << req->user_id()
            << " market=" << req->market_id()
            << " outcome=" << req->outcome_id()
            << " side=" << pm::Side_Name(req->side())
            << " kind=" << pm::OrderKind_Name(req->kind())
            << " amount=" << req->amount().raw() << "e-" << req->amount().scale()
            << " price=" << req->price().raw() << "e-" << req->price().scale() << "\n";

  return run_rpc("PlaceOrder", d_->write_mu, resp, [&] {
    if (req->side() != pm::BUY && req->side() != pm::SELL) {
      fail(pm::VALIDATION_ERROR, "side must be BUY or SELL");
    }
    if (req->kind() != pm::LIMIT && req->kind() != pm::MARKET) {
      fail(pm::VALIDATION_ERROR, "kind must be LIMIT or MARKET");
    }
    if (req->kind() == pm::LIMIT && !req->has_price()) {
      fail(pm::VALIDATION_ERROR, "price is required for LIMIT orders");
    }

    const Order incoming = Order::FromRaw(req->user_id(), req->market_id(), req->outcome_id(),
                                          req->side(), req->kind(),
                                          req->amount().raw(), req->amount().scale(),
                                          req->price().raw(), req->price().scale());
    const PlaceResult r = d_->matching.place(incoming);

    to_proto(r.order, resp->mutable_order());
    for (const auto& id : r.matched_order_ids) resp->add_matched_order_ids(id);
    resp->set_fully_filled(r.fully_filled);
    std::cout << "[SERVER] [PlaceOrder] order_id=" << r.order.order_id
              << " status=" << status_str(r.order.status)
              << " filled=" << q4_to_string(r.order.filled)
              << " matches=" << r.matched_order_ids.size() << "\n";
  });
}

grpc::Status PredictionMarketServiceImpl::CancelOrder(grpc::ServerContext*,
                                                      const pm::CancelOrderRequest* req,
                                                      pm::CancelOrderResponse* resp) {
  std::cout << "[SERVER] [CancelOrder] user=" << req->user_id()
            << " order=" << req->order_id() << "\n";
  return run_rpc("CancelOrder", d_->write_mu, resp, [&] {
    const Order o = d_->matching.cancel(req->user_id(), req->order_id());
    to_proto(o, resp->mutable_order());
  });
}

grpc::Status PredictionMarketServiceImpl::ExecuteTrade(grpc::ServerContext*,
                                                       const pm::ExecuteTradeRequest* req,
                                                       pm::ExecuteTradeResponse* resp) {
  std::cout << "[SERVER] [ExecuteTrade] user=" << req->user_id()
            << " market=" << req->market_id()
            << " outcome=" << req->outcome_id()
            << " side=" << pm::Side_Name(req->side())
            << " amount=" << req->amount().raw() << "e-" << req->amount().scale()
            << (req->shares_mode() ? " (shares)" : " (notional)") << "\n";

  return run_rpc("ExecuteTrade", d_->write_mu, resp, [&] {
    if (req->side() != pm::BUY && req->side() != pm::SELL) {
      fail(pm::VALIDATION_ERROR, "side must be BUY or SELL");
    }
    const TradeResult r = d_->matching.execute_trade(req->user_id(), req->market_id(),
                                                     req->outcome_id(),
                                                     from_decimal(req->amount()),
                                                     req->side(), req->shares_mode());
    to_proto(r.trade, resp->mutable_trade());
    to_decimal(r.notional, resp->mutable_notional());
    to_decimal(r.impact.new_probability, resp->mutable_new_probability());
  });
}

grpc::Status PredictionMarketServiceImpl::ResolveMarket(grpc::ServerContext*,
                                                        const pm::ResolveMarketRequest* req,
                                                        pm::ResolveMarketResponse* resp) {
  std::cout << "[SERVER] [ResolveMarket] admin=" << req->admin_id()
            << " market=" << req->market_id()
            << " winner=" << req->winning_outcome_id() << "\n";
  return run_rpc("ResolveMarket", d_->write_mu, resp, [&] {
    const ResolutionSummary s = d_->resolution.resolve(req->admin_id(), req->market_id(),
                                                       req->winning_outcome_id());
    resp->set_holders_paid(s.holders_paid);
    to_decimal(s.total_payout, resp->mutable_total_payout());
    resp->set_orders_cancelled(s.orders_cancelled);
    to_decimal(s.total_refunded, resp->mutable_total_refunded());
  });
}

// -------------------- registry --------------------

grpc::Status PredictionMarketServiceImpl::RegisterUser(grpc::ServerContext*,
                                                       const pm::RegisterUserRequest* req,
                                                       pm::UserResponse* resp) {
  std::cout << "[SERVER] [RegisterUser] email=" << req->email() << "\n";
  return run_rpc("RegisterUser", d_->write_mu, resp, [&] {
    const User u = d_->registry.register_user(trim_ascii(req->name()), trim_ascii(req->email()));
    to_proto(u, resp->mutable_user());
  });
}

grpc::Status PredictionMarketServiceImpl::GrantAdmin(grpc::ServerContext*,
                                                     const pm::GrantAdminRequest* req,
                                                     pm::UserResponse* resp) {
  std::cout << "[SERVER] [GrantAdmin] caller=" << req->caller_id()
            << " target=" << req->target_user_id() << "\n";
  return run_rpc("GrantAdmin", d_->write_mu, resp, [&] {
    const User u = d_->registry.grant_admin(req->caller_id(), req->target_user_id());
    to_proto(u, resp->mutable_user());
  });
}

grpc::Status PredictionMarketServiceImpl::Deposit(grpc::ServerContext*,
                                                  const pm::DepositRequest* req,
                                                  pm::DepositResponse* resp) {
  std::cout << "[SERVER] [Deposit] user=" << req->user_id()
            << " amount=" << req->amount().raw() << "e-" << req->amount().scale() << "\n";
  return run_rpc("Deposit", d_->write_mu, resp, [&] {
    const AmountQ4 balance = d_->registry.deposit(req->user_id(), from_decimal(req->amount()));
    to_decimal(balance, resp->mutable_balance());
  });
}

grpc::Status PredictionMarketServiceImpl::CreateMarket(grpc::ServerContext*,
                                                       const pm::CreateMarketRequest* req,
                                                       pm::MarketResponse* resp) {
  std::cout << "[SERVER] [CreateMarket] caller=" << req->caller_id()
            << " title=\"" << req->title() << "\""
            << " outcomes=" << req->outcomes_size() << "\n";
  return run_rpc("CreateMarket", d_->write_mu, resp, [&] {
    NewMarket spec;
    spec.title       = trim_ascii(req->title());
    spec.description = req->description();
    spec.category    = trim_ascii(req->category());
    spec.end_date_ms = req->end_date_ms();
    for (const auto& o : req->outcomes()) {
      spec.outcomes.push_back(OutcomeSpec{trim_ascii(o.title()), o.description()});
    }
    const Market m = d_->registry.create_market(req->caller_id(), spec);
    fill_market_response(d_->queries.market(m.market_id), resp);
  });
}

// -------------------- queries --------------------

grpc::Status PredictionMarketServiceImpl::GetMarket(grpc::ServerContext*,
                                                    const pm::GetMarketRequest* req,
                                                    pm::MarketResponse* resp) {
  return run_rpc("GetMarket", d_->write_mu, resp, [&] {
    fill_market_response(d_->queries.market(req->market_id()), resp);
  });
}

grpc::Status PredictionMarketServiceImpl::GetOrderBook(grpc::ServerContext*,
                                                       const pm::OrderBookRequest* req,
                                                       pm::OrderBookResponse* resp) {
  return run_rpc("GetOrderBook", d_->write_mu, resp, [&] {
    const OrderBookView book = d_->queries.order_book(req->market_id(), req->outcome_id());
    fill_levels(book.bids, resp->mutable_bids());
    fill_levels(book.asks, resp->mutable_asks());
  });
}

grpc::Status PredictionMarketServiceImpl::GetHoldings(grpc::ServerContext*,
                                                      const pm::HoldingsRequest* req,
                                                      pm::HoldingsResponse* resp) {
  return run_rpc("GetHoldings", d_->write_mu, resp, [&] {
    const Portfolio p = d_->queries.holdings(req->user_id());
    for (const auto& mp : p.markets) {
      auto* out = resp->add_markets();
      out->set_market_id(mp.market.market_id);
      out->set_market_title(mp.market.title);
      out->set_is_resolved(mp.market.is_resolved);
      for (const auto& h : mp.holdings) to_proto(h, out->add_holdings());
      to_decimal(mp.total_value, out->mutable_total_value());
      to_decimal(mp.total_pnl, out->mutable_total_pnl());
    }
    to_decimal(p.total_value, resp->mutable_portfolio_value());
    to_decimal(p.total_pnl, resp->mutable_portfolio_pnl());
  });
}

grpc::Status PredictionMarketServiceImpl::ListTransactions(grpc::ServerContext*,
                                                           const pm::TransactionsRequest* req,
                                                           pm::TransactionsResponse* resp) {
  return run_rpc("ListTransactions", d_->write_mu, resp, [&] {
    const int page  = req->page() == 0 ? 1 : req->page();
    const int limit = req->limit() == 0 ? 20 : req->limit();
    const TransactionPage tp = d_->queries.transactions(req->user_id(), page, limit);
    for (const auto& t : tp.rows) to_proto(t, resp->add_transactions());
    resp->set_total(tp.total);
    resp->set_has_next_page(tp.has_next_page);
  });
}
