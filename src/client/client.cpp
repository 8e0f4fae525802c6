#include <grpcpp/grpcpp.h>
#include "prediction_market.grpc.pb.h"
#include "prediction_market.pb.h"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace pm = prediction_market::v1;

static void usage(const char* prog) {
    std::cerr <<
      "Usage:\n"
      "  " << prog << " <addr> register <name> <email>\n"
      "  " << prog << " <addr> deposit <user_id> <raw> <scale>\n"
      "  " << prog << " <addr> create-market <admin_id> <title> <description> <category> <outcome> <outcome>...\n"
      "  " << prog << " <addr> place <user_id> <market_id> <outcome_id> <BUY|SELL> <LIMIT|MARKET> <amount_raw> <amount_scale> [<price_raw> <price_scale>]\n"
      "  " << prog << " <addr> trade <user_id> <market_id> <outcome_id> <BUY|SELL> <raw> <scale> [shares]\n"
      "  " << prog << " <addr> cancel <user_id> <order_id>\n"
      "  " << prog << " <addr> resolve <admin_id> <market_id> <winning_outcome_id>\n"
      "  " << prog << " <addr> book <market_id> <outcome_id>\n"
      "  " << prog << " <addr> holdings <user_id>\n"
      "  Example:\n"
      "  " << prog << " localhost:50051 place USR-2 MKT-1 OUT-1 BUY LIMIT 100000 4 4500 4\n";
}

static std::string dec(const pm::Decimal& d) {
    // scale-4 wire values rendered as 12.3400
    std::string s = std::to_string(d.raw() < 0 ? -d.raw() : d.raw());
    const std::size_t scale = static_cast<std::size_t>(d.scale());
    if (s.size() <= scale) s.insert(0, scale - s.size() + 1, '0');
    if (scale > 0) s.insert(s.size() - scale, ".");
    return (d.raw() < 0 ? "-" : "") + s;
}

static void set_dec(pm::Decimal* d, const std::string& raw, const std::string& scale) {
    d->set_raw(std::stoll(raw));
    d->set_scale(std::stoi(scale));
}

static pm::Side parse_side(const std::string& s) {
    if (s == "BUY") return pm::BUY;
    if (s == "SELL") return pm::SELL;
    throw std::invalid_argument("side must be BUY or SELL: " + s);
}

// 0 accepted, 2 transport failure, 3 rejected by the server
template <typename Resp>
static int report(const grpc::Status& status, const Resp& resp) {
    if (!status.ok()) {
        std::cerr << "[client] RPC failed: " << status.error_code() << " - " << status.error_message() << "\n";
        return 2;
    }
    if (!resp.success()) {
        std::cerr << "[client] rejected: " << pm::ErrorCode_Name(resp.error_code())
                  << " - " << resp.error_message() << "\n";
        return 3;
    }
    return 0;
}

static void print_order(const pm::Order& o) {
    std::cout << "[client] order_id=" << o.order_id()
              << " status=" << pm::OrderStatus_Name(o.status())
              << " amount=" << dec(o.amount())
              << " filled=" << dec(o.filled())
              << " price=" << dec(o.price()) << "\n";
}

int main(int argc, char** argv) {
    if (argc < 3) { usage(argv[0]); return 1; }

    const std::string addr = argv[1];
    const std::string cmd  = argv[2];
    std::vector<std::string> args(argv + 3, argv + argc);

    // InsecureServerCredentials() is fine for local dev. For anything else, switch to TLS
    auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    std::unique_ptr<pm::PredictionMarket::Stub> stub = pm::PredictionMarket::NewStub(channel);
    grpc::ClientContext ctx;

    try {
        if (cmd == "register" && args.size() == 2) {
            pm::RegisterUserRequest req;
            req.set_name(args[0]);
            req.set_email(args[1]);
            pm::UserResponse resp;
            const int rc = report(stub->RegisterUser(&ctx, req, &resp), resp);
            if (rc == 0) std::cout << "[client] user_id=" << resp.user().user_id()
                                   << " balance=" << dec(resp.user().balance()) << "\n";
            return rc;
        }

        if (cmd == "deposit" && args.size() == 3) {
            pm::DepositRequest req;
            req.set_user_id(args[0]);
            set_dec(req.mutable_amount(), args[1], args[2]);
            pm::DepositResponse resp;
            const int rc = report(stub->Deposit(&ctx, req, &resp), resp);
            if (rc == 0) std::cout << "[client] balance=" << dec(resp.balance()) << "\n";
            return rc;
        }

        if (cmd == "create-market" && args.size() >= 6) {
            pm::CreateMarketRequest req;
            req.set_caller_id(args[0]);
            req.set_title(args[1]);
            req.set_description(args[2]);
            req.set_category(args[3]);
            // closes 30 days from now
            const auto end = std::chrono::system_clock::now() + std::chrono::hours(24 * 30);
            req.set_end_date_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                end.time_since_epoch()).count());
            for (std::size_t i = 4; i < args.size(); ++i) req.add_outcomes()->set_title(args[i]);
            pm::MarketResponse resp;
            const int rc = report(stub->CreateMarket(&ctx, req, &resp), resp);
            if (rc == 0) {
                std::cout << "[client] market_id=" << resp.market().market_id() << "\n";
                for (const auto& o : resp.market().outcomes()) {
                    std::cout << "  " << o.outcome_id() << " " << o.title()
                              << " p=" << dec(o.probability()) << "\n";
                }
            }
            return rc;
        }

        if (cmd == "place" && (args.size() == 7 || args.size() == 9)) {
            pm::PlaceOrderRequest req;
            req.set_user_id(args[0]);
            req.set_market_id(args[1]);
            req.set_outcome_id(args[2]);
            req.set_side(parse_side(args[3]));
            req.set_kind(args[4] == "LIMIT" ? pm::LIMIT : pm::MARKET);
            set_dec(req.mutable_amount(), args[5], args[6]);
            if (args.size() == 9) set_dec(req.mutable_price(), args[7], args[8]);
            pm::PlaceOrderResponse resp;
            const int rc = report(stub->PlaceOrder(&ctx, req, &resp), resp);
            if (rc == 0) {
                print_order(resp.order());
                for (const auto& id : resp.matched_order_ids()) std::cout << "  matched " << id << "\n";
            }
            return rc;
        }

        if (cmd == "trade" && (args.size() == 6 || args.size() == 7)) {
            pm::ExecuteTradeRequest req;
            req.set_user_id(args[0]);
            req.set_market_id(args[1]);
            req.set_outcome_id(args[2]);
            req.set_side(parse_side(args[3]));
            set_dec(req.mutable_amount(), args[4], args[5]);
            req.set_shares_mode(args.size() == 7 && args[6] == "shares");
            pm::ExecuteTradeResponse resp;
            const int rc = report(stub->ExecuteTrade(&ctx, req, &resp), resp);
            if (rc == 0) std::cout << "[client] trade_id=" << resp.trade().trade_id()
                                   << " shares=" << dec(resp.trade().amount())
                                   << " price=" << dec(resp.trade().price())
                                   << " notional=" << dec(resp.notional())
                                   << " new_probability=" << dec(resp.new_probability()) << "\n";
            return rc;
        }

        if (cmd == "cancel" && args.size() == 2) {
            pm::CancelOrderRequest req;
            req.set_user_id(args[0]);
            req.set_order_id(args[1]);
            pm::CancelOrderResponse resp;
            const int rc = report(stub->CancelOrder(&ctx, req, &resp), resp);
            if (rc == 0) print_order(resp.order());
            return rc;
        }

        if (cmd == "resolve" && args.size() == 3) {
            pm::ResolveMarketRequest req;
            req.set_admin_id(args[0]);
            req.set_market_id(args[1]);
            req.set_winning_outcome_id(args[2]);
            pm::ResolveMarketResponse resp;
            const int rc = report(stub->ResolveMarket(&ctx, req, &resp), resp);
            if (rc == 0) std::cout << "[client] holders_paid=" << resp.holders_paid()
                                   << " total_payout=" << dec(resp.total_payout())
                                   << " orders_cancelled=" << resp.orders_cancelled()
                                   << " total_refunded=" << dec(resp.total_refunded()) << "\n";
            return rc;
        }

        if (cmd == "book" && args.size() == 2) {
            pm::OrderBookRequest req;
            req.set_market_id(args[0]);
            req.set_outcome_id(args[1]);
            pm::OrderBookResponse resp;
            const int rc = report(stub->GetOrderBook(&ctx, req, &resp), resp);
            if (rc == 0) {
                for (const auto& l : resp.asks()) std::cout << "  ASK " << dec(l.price()) << " x " << dec(l.volume()) << "\n";
                for (const auto& l : resp.bids()) std::cout << "  BID " << dec(l.price()) << " x " << dec(l.volume()) << "\n";
            }
            return rc;
        }

        if (cmd == "holdings" && args.size() == 1) {
            pm::HoldingsRequest req;
            req.set_user_id(args[0]);
            pm::HoldingsResponse resp;
            const int rc = report(stub->GetHoldings(&ctx, req, &resp), resp);
            if (rc == 0) {
                for (const auto& m : resp.markets()) {
                    std::cout << m.market_id() << " " << m.market_title()
                              << (m.is_resolved() ? " (resolved)" : "") << "\n";
                    for (const auto& h : m.holdings()) {
                        std::cout << "  " << h.outcome_title()
                                  << " qty=" << dec(h.quantity())
                                  << " avg=" << dec(h.avg_price())
                                  << " now=" << dec(h.current_price())
                                  << " pnl=" << dec(h.unrealized_pnl()) << "\n";
                    }
                }
                std::cout << "[client] portfolio value=" << dec(resp.portfolio_value())
                          << " pnl=" << dec(resp.portfolio_pnl()) << "\n";
            }
            return rc;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[client] bad argument: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "[client] number out of range: " << e.what() << "\n";
        return 1;
    }

    usage(argv[0]);
    return 1;
}
