#include "domain/errors.hpp"

const char* error_code_str(ErrorCode code) {
  switch (code) {
    case pm::OK:                   return "ok";
    case pm::VALIDATION_ERROR:     return "validation_error";
    case pm::NOT_FOUND:            return "not_found";
    case pm::FORBIDDEN:            return "forbidden";
    case pm::INSUFFICIENT_BALANCE: return "insufficient_balance";
    case pm::INSUFFICIENT_SHARES:  return "insufficient_shares";
    case pm::MARKET_RESOLVED:      return "market_resolved";
    case pm::ALREADY_RESOLVED:     return "already_resolved";
    case pm::ALREADY_CLOSED:       return "already_closed";
    case pm::INVALID_OUTCOME:      return "invalid_outcome";
    case pm::CONFLICT:             return "conflict";
    case pm::INTERNAL:             return "internal";
    default:                       return "unknown";
  }
}
