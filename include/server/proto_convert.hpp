#pragma once
#include "prediction_market.pb.h"

#include "domain/holding.hpp"
#include "domain/market.hpp"
#include "domain/order.hpp"
#include "domain/records.hpp"
#include "engine/market_queries.hpp"

namespace pm = prediction_market::v1;

// Wire decimal -> Q4 (throws on bad scale / overflow)
int64_t from_decimal(const pm::Decimal& d);
void    to_decimal(int64_t q4, pm::Decimal* out);

void to_proto(const User& u, pm::User* out);
void to_proto(const Market& m, const std::vector<Outcome>& outcomes, pm::Market* out);
void to_proto(const Outcome& o, pm::Outcome* out);
void to_proto(const Order& o, pm::Order* out);
void to_proto(const TradeRow& t, pm::Trade* out);
void to_proto(const TransactionRow& t, pm::Transaction* out);
void to_proto(const HoldingMetrics& h, pm::HoldingView* out);
