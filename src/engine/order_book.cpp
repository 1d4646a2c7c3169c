#include "engine/order_book.hpp"

#include <stdexcept>
#include <string>

const Order* OrderBook::find(OrderId id) const {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

const Order& OrderBook::insert(Order order) {
  if (order.status != OrderStatus::Pending) {
    throw std::logic_error("new order must be pending");
  }
  auto [it, inserted] = orders_.emplace(order.order_id, std::move(order));
  if (!inserted) throw std::logic_error("duplicate order id " + std::to_string(it->first));
  return it->second;
}

void OrderBook::restore(Order order) {
  const OrderId id = order.order_id;
  if (!orders_.emplace(id, std::move(order)).second) {
    throw std::logic_error("duplicate order id " + std::to_string(id));
  }
}

const Order* OrderBook::transition_(OrderId id, OrderStatus to) {
  auto it = orders_.find(id);
  if (it == orders_.end() || it->second.is_terminal()) return nullptr;
  it->second.status = to;
  return &it->second;
}

const Order* OrderBook::cancel(OrderId id) { return transition_(id, OrderStatus::Cancelled); }
const Order* OrderBook::fulfil(OrderId id) { return transition_(id, OrderStatus::Fulfilled); }
