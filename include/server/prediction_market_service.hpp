#pragma once
#include <grpcpp/grpcpp.h>
#include "prediction_market.grpc.pb.h"
#include <memory>
#include <string>

namespace pm = prediction_market::v1;

class PredictionMarketServiceImpl final : public pm::PredictionMarket::Service {
public:
  explicit PredictionMarketServiceImpl(std::string db_path, int max_attempts = 3);
  ~PredictionMarketServiceImpl() override;                       // needed for pimpl

  PredictionMarketServiceImpl(const PredictionMarketServiceImpl&)            = delete;
  PredictionMarketServiceImpl& operator=(const PredictionMarketServiceImpl&) = delete;

  // Creates or promotes the start-up administrator; returns its user id.
  std::string bootstrap_admin(const std::string& name, const std::string& email);

  // --- trading ------------------------------------------------------------
  grpc::Status PlaceOrder(grpc::ServerContext*, const pm::PlaceOrderRequest*,
                          pm::PlaceOrderResponse*) override;
  grpc::Status CancelOrder(grpc::ServerContext*, const pm::CancelOrderRequest*,
                           pm::CancelOrderResponse*) override;
  grpc::Status ExecuteTrade(grpc::ServerContext*, const pm::ExecuteTradeRequest*,
                            pm::ExecuteTradeResponse*) override;
  grpc::Status ResolveMarket(grpc::ServerContext*, const pm::ResolveMarketRequest*,
                             pm::ResolveMarketResponse*) override;

  // --- registry -----------------------------------------------------------
  grpc::Status RegisterUser(grpc::ServerContext*, const pm::RegisterUserRequest*,
                            pm::UserResponse*) override;
  grpc::Status GrantAdmin(grpc::ServerContext*, const pm::GrantAdminRequest*,
                          pm::UserResponse*) override;
  grpc::Status Deposit(grpc::ServerContext*, const pm::DepositRequest*,
                       pm::DepositResponse*) override;
  grpc::Status CreateMarket(grpc::ServerContext*, const pm::CreateMarketRequest*,
                            pm::MarketResponse*) override;

  // --- queries ------------------------------------------------------------
  grpc::Status GetMarket(grpc::ServerContext*, const pm::GetMarketRequest*,
                         pm::MarketResponse*) override;
  grpc::Status GetOrderBook(grpc::ServerContext*, const pm::OrderBookRequest*,
                            pm::OrderBookResponse*) override;
  grpc::Status GetHoldings(grpc::ServerContext*, const pm::HoldingsRequest*,
                           pm::HoldingsResponse*) override;
  grpc::Status ListTransactions(grpc::ServerContext*, const pm::TransactionsRequest*,
                                pm::TransactionsResponse*) override;

private:
  struct Impl;                    // forward-declared implementation
  std::unique_ptr<Impl> d_;       // pimpl
};
