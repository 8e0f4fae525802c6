#pragma once
#include "prediction_market.pb.h"

namespace pm = prediction_market::v1;
using Side         = pm::Side;
using OrderKind    = pm::OrderKind;
using OrderStatus  = pm::OrderStatus;
using PositionSide = pm::PositionSide;

// Compile-time guard so DB/engine break loudly if proto values change
static_assert(int(pm::BUY)       == 1, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::SELL)      == 2, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::LIMIT)     == 1, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::MARKET)    == 2, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::OPEN)      == 1, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::FILLED)    == 2, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::CANCELLED) == 3, "Proto enum changed: update DB CHECK + code");
static_assert(int(pm::YES)       == 1, "Proto enum changed: update DB CHECK + code");

inline Side opposite(Side s) { return s == pm::BUY ? pm::SELL : pm::BUY; }

inline const char* side_str(Side s) { return s == pm::BUY ? "BUY" : "SELL"; }
inline const char* kind_str(OrderKind k) { return k == pm::LIMIT ? "LIMIT" : "MARKET"; }

inline const char* status_str(OrderStatus s) {
  switch (s) {
    case pm::OPEN:      return "OPEN";
    case pm::FILLED:    return "FILLED";
    case pm::CANCELLED: return "CANCELLED";
    default:            return "UNSPECIFIED";
  }
}
