#pragma once
#include <stdexcept>
#include <string>
#include "prediction_market.pb.h"

namespace pm = prediction_market::v1;
using ErrorCode = pm::ErrorCode;

const char* error_code_str(ErrorCode code);

// Raised by the engines; the whole SQLite transaction is rolled back and the
// code is reported to the caller unchanged.
class MarketError : public std::runtime_error {
public:
  MarketError(ErrorCode code, const std::string& msg)
    : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

[[noreturn]] inline void fail(ErrorCode code, const std::string& msg) {
  throw MarketError(code, msg);
}
