#pragma once
#include <cstdint>
#include <optional>
#include "domain/address.hpp"
#include "domain/amount.hpp"
#include "domain/ids.hpp"

enum class EventType {
  ListingCreated        = 0,
  OrderPlaced           = 1,
  ItemSold              = 2,
  ItemNoLongerAvailable = 3,
  ItemNoLongerExists    = 4,
};

inline const char* to_string(EventType t) {
  switch (t) {
    case EventType::ListingCreated:        return "LISTING_CREATED";
    case EventType::OrderPlaced:           return "ORDER_PLACED";
    case EventType::ItemSold:              return "ITEM_SOLD";
    case EventType::ItemNoLongerAvailable: return "ITEM_NO_LONGER_AVAILABLE";
    case EventType::ItemNoLongerExists:    return "ITEM_NO_LONGER_EXISTS";
  }
  return "UNKNOWN";
}

struct MarketEvent {
  EventType              type = EventType::ListingCreated;
  ListingId              listing_id = 0;
  std::optional<OrderId> order_id;
  ItemId                 item_id = 0;
  Address                item_registry;
  Address                seller;      // recorded owner
  Address                buyer;       // empty unless an order is involved
  Amount                 price = 0;
  int64_t                at_ms = 0;
};
