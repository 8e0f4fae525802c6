#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>
#include "prediction_market.grpc.pb.h"
#include "prediction_market.pb.h"
#include "server/prediction_market_service.hpp"
#include "utils/clock.hpp"
#include "utils/log.hpp"
#include "test_support.hpp"

#include <SQLiteCpp/SQLiteCpp.h>

namespace pm = prediction_market::v1;

struct ServerFixture : ::testing::Test {
  std::unique_ptr<grpc::Server> server;
  int selected_port = 0;
  std::string db_path;
  std::unique_ptr<pm::PredictionMarket::Stub> stub;
  std::unique_ptr<PredictionMarketServiceImpl> service;
  std::string admin_id;

  void SetUp() override {
    engine_log_enabled().store(false);
    db_path = temp_db_path("server");
    remove_db_files(db_path);

    service  = std::make_unique<PredictionMarketServiceImpl>(db_path);
    admin_id = service->bootstrap_admin("Admin", "admin@example.com");

    grpc::ServerBuilder builder;
    builder.RegisterService(service.get());
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &selected_port);
    server = builder.BuildAndStart();
    ASSERT_TRUE(server);
    ASSERT_NE(selected_port, 0);

    auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(selected_port),
                                       grpc::InsecureChannelCredentials());
    stub = pm::PredictionMarket::NewStub(channel);
  }

  void TearDown() override {
    if (server) server->Shutdown();
    server.reset();
    service.reset();
    remove_db_files(db_path);
    engine_log_enabled().store(true);
  }

  static void dec(pm::Decimal* d, int64_t raw, int scale) {
    d->set_raw(raw);
    d->set_scale(scale);
  }

  std::string register_user(const std::string& name) {
    pm::RegisterUserRequest req;
    req.set_name(name);
    req.set_email(name + "@example.com");
    grpc::ClientContext ctx;
    pm::UserResponse resp;
    auto status = stub->RegisterUser(&ctx, req, &resp);
    EXPECT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(resp.success()) << resp.error_message();
    return resp.user().user_id();
  }

  pm::Market create_market() {
    pm::CreateMarketRequest req;
    req.set_caller_id(admin_id);
    req.set_title("Will the bridge open in May?");
    req.set_description("Resolves YES if traffic crosses before June 1.");
    req.set_category("infrastructure");
    req.set_end_date_ms(now_epoch_ms() + 86400000);
    req.add_outcomes()->set_title("Yes");
    req.add_outcomes()->set_title("No");
    grpc::ClientContext ctx;
    pm::MarketResponse resp;
    auto status = stub->CreateMarket(&ctx, req, &resp);
    EXPECT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(resp.success()) << resp.error_message();
    return resp.market();
  }
};

TEST_F(ServerFixture, PlaceOrder_NormalizesAndPersists) {
  auto bob = register_user("bob");
  auto m = create_market();
  ASSERT_EQ(m.outcomes_size(), 2);

  pm::PlaceOrderRequest req;
  req.set_user_id(bob);
  req.set_market_id(m.market_id());
  req.set_outcome_id(m.outcomes(0).outcome_id());
  req.set_side(pm::BUY);
  req.set_kind(pm::LIMIT);
  dec(req.mutable_amount(), 25, 0);     // 25 shares
  dec(req.mutable_price(), 45, 2);      // 0.45

  grpc::ClientContext ctx;
  pm::PlaceOrderResponse resp;
  auto status = stub->PlaceOrder(&ctx, req, &resp);
  ASSERT_TRUE(status.ok()) << status.error_message();
  ASSERT_TRUE(resp.success()) << resp.error_message();
  ASSERT_FALSE(resp.order().order_id().empty());
  EXPECT_EQ(resp.order().price().raw(), 4500);
  EXPECT_EQ(resp.order().price().scale(), 4);
  EXPECT_EQ(resp.order().status(), pm::OPEN);

  // Open DB and assert the Q4 columns
  SQLite::Database db(db_path, SQLite::OPEN_READONLY);
  SQLite::Statement stmt(db, "SELECT price, amount FROM orders WHERE order_id=?");
  stmt.bind(1, resp.order().order_id());
  ASSERT_TRUE(stmt.executeStep());
  EXPECT_EQ(stmt.getColumn(0).getInt64(), 4500);
  EXPECT_EQ(stmt.getColumn(1).getInt64(), 250000);
}

TEST_F(ServerFixture, RejectsAreReportedInResponse) {
  auto bob = register_user("bob");
  auto m = create_market();

  pm::PlaceOrderRequest req;
  req.set_user_id(bob);
  req.set_market_id(m.market_id());
  req.set_outcome_id(m.outcomes(0).outcome_id());
  req.set_side(pm::BUY);
  req.set_kind(pm::LIMIT);
  dec(req.mutable_amount(), 10, 0);   // no price

  grpc::ClientContext ctx;
  pm::PlaceOrderResponse resp;
  auto status = stub->PlaceOrder(&ctx, req, &resp);
  ASSERT_TRUE(status.ok());
  EXPECT_FALSE(resp.success());
  EXPECT_EQ(resp.error_code(), pm::VALIDATION_ERROR);
  EXPECT_FALSE(resp.error_message().empty());

  dec(req.mutable_price(), 45, 2);
  dec(req.mutable_amount(), 5000, 0);   // more than the balance
  grpc::ClientContext ctx2;
  pm::PlaceOrderResponse resp2;
  ASSERT_TRUE(stub->PlaceOrder(&ctx2, req, &resp2).ok());
  EXPECT_EQ(resp2.error_code(), pm::INSUFFICIENT_BALANCE);

  dec(req.mutable_amount(), 10, 25);    // bad scale
  grpc::ClientContext ctx3;
  pm::PlaceOrderResponse resp3;
  ASSERT_TRUE(stub->PlaceOrder(&ctx3, req, &resp3).ok());
  EXPECT_EQ(resp3.error_code(), pm::VALIDATION_ERROR);
}

TEST_F(ServerFixture, TradeResolveAndReadBack) {
  auto alice = register_user("alice");
  auto m = create_market();
  const auto yes = m.outcomes(0).outcome_id();

  pm::ExecuteTradeRequest trade;
  trade.set_user_id(alice);
  trade.set_market_id(m.market_id());
  trade.set_outcome_id(yes);
  trade.set_side(pm::BUY);
  dec(trade.mutable_amount(), 50, 0);
  grpc::ClientContext c1;
  pm::ExecuteTradeResponse tr;
  ASSERT_TRUE(stub->ExecuteTrade(&c1, trade, &tr).ok());
  ASSERT_TRUE(tr.success()) << tr.error_message();
  EXPECT_EQ(tr.new_probability().raw(), 9900);
  EXPECT_EQ(tr.trade().amount().raw(), 1000000);

  pm::GetMarketRequest gm;
  gm.set_market_id(m.market_id());
  grpc::ClientContext c2;
  pm::MarketResponse mr;
  ASSERT_TRUE(stub->GetMarket(&c2, gm, &mr).ok());
  ASSERT_TRUE(mr.success());
  EXPECT_EQ(mr.market().outcomes(1).probability().raw(), 100);
  EXPECT_EQ(mr.recent_trades_size(), 1);

  pm::ResolveMarketRequest rr;
  rr.set_admin_id(alice);
  rr.set_market_id(m.market_id());
  rr.set_winning_outcome_id(yes);
  grpc::ClientContext c3;
  pm::ResolveMarketResponse rs;
  ASSERT_TRUE(stub->ResolveMarket(&c3, rr, &rs).ok());
  EXPECT_EQ(rs.error_code(), pm::FORBIDDEN);

  rr.set_admin_id(admin_id);
  grpc::ClientContext c4;
  ASSERT_TRUE(stub->ResolveMarket(&c4, rr, &rs).ok());
  ASSERT_TRUE(rs.success()) << rs.error_message();
  EXPECT_EQ(rs.holders_paid(), 1);
  EXPECT_EQ(rs.total_payout().raw(), 1000000);

  pm::TransactionsRequest txr;
  txr.set_user_id(alice);
  grpc::ClientContext c5;
  pm::TransactionsResponse txs;
  ASSERT_TRUE(stub->ListTransactions(&c5, txr, &txs).ok());
  ASSERT_TRUE(txs.success()) << txs.error_message();
  EXPECT_EQ(txs.total(), 2);
  EXPECT_EQ(txs.transactions(0).type(), "MARKET_RESOLUTION_PAYOUT");

  pm::HoldingsRequest hr;
  hr.set_user_id(alice);
  grpc::ClientContext c6;
  pm::HoldingsResponse hs;
  ASSERT_TRUE(stub->GetHoldings(&c6, hr, &hs).ok());
  ASSERT_TRUE(hs.success());
  EXPECT_EQ(hs.markets_size(), 0);   // positions are zeroed on resolution
}

TEST_F(ServerFixture, DepositAndOrderBook) {
  auto bob = register_user("bob");
  auto m = create_market();

  pm::DepositRequest dr;
  dr.set_user_id(bob);
  dec(dr.mutable_amount(), 5, 0);
  grpc::ClientContext c1;
  pm::DepositResponse ds;
  ASSERT_TRUE(stub->Deposit(&c1, dr, &ds).ok());
  EXPECT_EQ(ds.error_code(), pm::VALIDATION_ERROR);

  dec(dr.mutable_amount(), 250, 0);
  grpc::ClientContext c2;
  ASSERT_TRUE(stub->Deposit(&c2, dr, &ds).ok());
  ASSERT_TRUE(ds.success());
  EXPECT_EQ(ds.balance().raw(), 12500000);

  pm::PlaceOrderRequest req;
  req.set_user_id(bob);
  req.set_market_id(m.market_id());
  req.set_outcome_id(m.outcomes(0).outcome_id());
  req.set_side(pm::BUY);
  req.set_kind(pm::LIMIT);
  dec(req.mutable_amount(), 10, 0);
  dec(req.mutable_price(), 3000, 4);
  grpc::ClientContext c3;
  pm::PlaceOrderResponse pr;
  ASSERT_TRUE(stub->PlaceOrder(&c3, req, &pr).ok());
  ASSERT_TRUE(pr.success());

  pm::OrderBookRequest br;
  br.set_market_id(m.market_id());
  br.set_outcome_id(m.outcomes(0).outcome_id());
  grpc::ClientContext c4;
  pm::OrderBookResponse bs;
  ASSERT_TRUE(stub->GetOrderBook(&c4, br, &bs).ok());
  ASSERT_EQ(bs.bids_size(), 1);
  EXPECT_EQ(bs.bids(0).price().raw(), 3000);
  EXPECT_EQ(bs.bids(0).volume().raw(), 100000);
  EXPECT_EQ(bs.asks_size(), 0);

  pm::CancelOrderRequest cr;
  cr.set_user_id(bob);
  cr.set_order_id(pr.order().order_id());
  grpc::ClientContext c5;
  pm::CancelOrderResponse cs;
  ASSERT_TRUE(stub->CancelOrder(&c5, cr, &cs).ok());
  ASSERT_TRUE(cs.success());
  EXPECT_EQ(cs.order().status(), pm::CANCELLED);

  grpc::ClientContext c6;
  ASSERT_TRUE(stub->CancelOrder(&c6, cr, &cs).ok());
  EXPECT_EQ(cs.error_code(), pm::ALREADY_CLOSED);
}

TEST_F(ServerFixture, GrantAdminLetsUserCreateMarkets) {
  auto carol = register_user("carol");

  pm::GrantAdminRequest gr;
  gr.set_caller_id(carol);
  gr.set_target_user_id(carol);
  grpc::ClientContext c1;
  pm::UserResponse us;
  ASSERT_TRUE(stub->GrantAdmin(&c1, gr, &us).ok());
  EXPECT_EQ(us.error_code(), pm::FORBIDDEN);

  gr.set_caller_id(admin_id);
  grpc::ClientContext c2;
  ASSERT_TRUE(stub->GrantAdmin(&c2, gr, &us).ok());
  ASSERT_TRUE(us.success());
  EXPECT_TRUE(us.user().is_admin());
}
