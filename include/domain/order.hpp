#pragma once
#include <cstdint>
#include "domain/address.hpp"
#include "domain/amount.hpp"
#include "domain/ids.hpp"

enum class OrderStatus { Pending = 0, Fulfilled = 1, Cancelled = 2 };

inline const char* to_string(OrderStatus s) {
  switch (s) {
    case OrderStatus::Pending:   return "PENDING";
    case OrderStatus::Fulfilled: return "FULFILLED";
    case OrderStatus::Cancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

struct Order {
  OrderId     order_id      = 0;
  ListingId   listing_id    = 0;
  ItemId      item_id       = 0;
  Amount      price         = 0;
  Amount      platform_fee  = 0;
  Amount      seller_amount = 0;   // price - platform_fee, fixed at creation
  Address     buyer;
  Address     seller;
  int64_t     created_at_ms = 0;
  OrderStatus status        = OrderStatus::Pending;

  bool is_terminal() const { return status != OrderStatus::Pending; }
};
