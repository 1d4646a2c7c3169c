#pragma once
#include "domain/amount.hpp"

struct FeeQuote {
  Amount platform_fee  = 0;
  Amount seller_amount = 0;
};

// platform_fee = max(price * bp / 10000, minimum_fee); price must cover it.
inline FeeQuote quote_fee(Amount price, uint32_t fee_percent_bp, Amount minimum_fee) {
  Amount fee = apply_basis_points(price, fee_percent_bp);
  if (fee < minimum_fee) fee = minimum_fee;
  return FeeQuote{fee, checked_sub(price, fee)};
}
