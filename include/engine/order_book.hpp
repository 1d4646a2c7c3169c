#pragma once
#include "domain/order.hpp"

#include <map>

// Orders by id. Status only ever moves Pending -> Fulfilled | Cancelled;
// transitions out of a terminal state are refused.
class OrderBook {
public:
  const Order* find(OrderId id) const;

  // New orders must be Pending; restored ones may be in any state.
  const Order& insert(Order order);
  void restore(Order order);

  // Return the updated order, or nullptr when the order is unknown or
  // already terminal (nothing changed).
  const Order* cancel(OrderId id);
  const Order* fulfil(OrderId id);

  size_t size() const { return orders_.size(); }

private:
  const Order* transition_(OrderId id, OrderStatus to);

  std::map<OrderId, Order> orders_;
};
