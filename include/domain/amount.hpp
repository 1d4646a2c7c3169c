#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>

// Fungible base units. Never fractional; fees are rounded toward zero.
using Amount = uint64_t;

inline constexpr uint32_t kBasisPointsDenominator = 10000;

inline Amount checked_add(Amount a, Amount b) {
  if (a > std::numeric_limits<Amount>::max() - b) throw std::overflow_error("amount overflow");
  return a + b;
}

inline Amount checked_sub(Amount a, Amount b) {
  if (b > a) throw std::underflow_error("amount underflow");
  return a - b;
}

// value * bp / 10000 without an intermediate product that could overflow.
inline Amount apply_basis_points(Amount value, uint32_t bp) {
  if (bp > kBasisPointsDenominator) throw std::invalid_argument("basis points out of range");
  return (value / kBasisPointsDenominator) * bp
       + (value % kBasisPointsDenominator) * bp / kBasisPointsDenominator;
}
