#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// Every decimal in the engine is a Q4 fixed-point integer: 1.0000 == 10000.
using PriceQ4  = int64_t;   // probabilities and trade prices
using AmountQ4 = int64_t;   // balances, notionals, share quantities

inline constexpr int     kTargetScale = 4;
inline constexpr int64_t kOneQ4       = 10000;
inline constexpr PriceQ4 kMinProbQ4   = 100;    // 0.01
inline constexpr PriceQ4 kMaxProbQ4   = 9900;   // 0.99

inline constexpr int64_t POW10[19] = {
  1LL,10LL,100LL,1000LL,10000LL,100000LL,1000000LL,10000000LL,100000000LL,
  1000000000LL,10000000000LL,100000000000LL,1000000000000LL,10000000000000LL,
  100000000000000LL,1000000000000000LL,10000000000000000LL,
  100000000000000000LL,1000000000000000000LL
};

inline int64_t checked_mul(int64_t a, int64_t b) {
  if (a == 0 || b == 0) return 0;
  const int64_t max = std::numeric_limits<int64_t>::max();
  const int64_t min = std::numeric_limits<int64_t>::min();
  if (a > 0 ? (b > 0 ? a > max / b : b < min / a)
            : (b > 0 ? a < min / b : a != 0 && b < max / a)) {
    throw std::overflow_error("fixed-point overflow");
  }
  return a * b;
}

inline int64_t checked_add(int64_t a, int64_t b) {
  if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
      (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
    throw std::overflow_error("fixed-point overflow");
  }
  return a + b;
}

// num / den rounded half away from zero. den must be non-zero.
inline int64_t round_div(int64_t num, int64_t den) {
  if (den == 0) throw std::domain_error("division by zero");
  if (den < 0) { num = -num; den = -den; }
  const int64_t q = num / den;
  const int64_t r = num % den;
  if (r == 0) return q;
  // |r| * 2 >= den  <=>  |r| >= den - |r|
  const int64_t abs_r = r < 0 ? -r : r;
  if (abs_r >= den - abs_r) return num < 0 ? q - 1 : q + 1;
  return q;
}

// a * b for two Q4 values, result in Q4.
inline int64_t mul_q4(int64_t a, int64_t b) {
  return round_div(checked_mul(a, b), kOneQ4);
}

// a / b for two Q4 values, result in Q4.
inline int64_t div_q4(int64_t a, int64_t b) {
  return round_div(checked_mul(a, kOneQ4), b);
}

inline PriceQ4 normalize_to_q4(int64_t price, int raw_scale) {
  if (raw_scale < 0 || raw_scale > 18) throw std::invalid_argument("scale out of range");
  if (raw_scale == kTargetScale) return price;

  const int diff = kTargetScale - raw_scale;

  if (diff > 0) {
    const int64_t mul = POW10[diff];
    if (price > 0 && price > std::numeric_limits<int64_t>::max() / mul) throw std::overflow_error("overflow");
    if (price < 0 && price < std::numeric_limits<int64_t>::min() / mul) throw std::overflow_error("underflow");
    return price * mul;
  } else {
    return price / POW10[-diff];  // trunc toward 0
  }
}

// "12.3400" style rendering, used in logs and JSON metadata.
inline std::string q4_to_string(int64_t v) {
  const bool neg = v < 0;
  const uint64_t mag = neg ? 0ULL - static_cast<uint64_t>(v) : static_cast<uint64_t>(v);
  std::string frac = std::to_string(mag % kOneQ4);
  frac.insert(0, 4 - frac.size(), '0');
  return (neg ? "-" : "") + std::to_string(mag / kOneQ4) + "." + frac;
}
