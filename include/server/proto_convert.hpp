#pragma once
#include "nft_market.pb.h"

#include "domain/error.hpp"
#include "domain/event.hpp"
#include "domain/listing.hpp"
#include "domain/order.hpp"

namespace mkt = nft_market::v1;

// Compile-time guard so the wire mapping breaks loudly if either side changes
static_assert(int(mkt::PENDING)   == int(OrderStatus::Pending)   + 1, "Proto enum changed: update mapping");
static_assert(int(mkt::FULFILLED) == int(OrderStatus::Fulfilled) + 1, "Proto enum changed: update mapping");
static_assert(int(mkt::CANCELLED) == int(OrderStatus::Cancelled) + 1, "Proto enum changed: update mapping");
static_assert(int(mkt::EVENT_ITEM_NO_LONGER_EXISTS) == int(EventType::ItemNoLongerExists) + 1,
              "Proto enum changed: update mapping");
static_assert(int(mkt::EXTERNAL_FAILURE) == int(ErrorKind::ExternalFailure) + 1,
              "Proto enum changed: update mapping");

inline mkt::OrderStatus to_proto(OrderStatus s) { return static_cast<mkt::OrderStatus>(int(s) + 1); }
inline mkt::EventType to_proto(EventType t)     { return static_cast<mkt::EventType>(int(t) + 1); }
inline mkt::ErrorKind to_proto(ErrorKind k)     { return static_cast<mkt::ErrorKind>(int(k) + 1); }

inline void to_proto(const Listing& l, mkt::Listing* out) {
  out->set_listing_id(l.listing_id);
  out->set_item_id(l.item_id);
  out->set_price(l.price);
  out->set_recorded_owner(l.recorded_owner);
  out->set_item_registry(l.item_registry);
  out->set_metadata_uri(l.metadata_uri);
}

inline void to_proto(const Order& o, mkt::Order* out) {
  out->set_order_id(o.order_id);
  out->set_listing_id(o.listing_id);
  out->set_item_id(o.item_id);
  out->set_price(o.price);
  out->set_platform_fee(o.platform_fee);
  out->set_seller_amount(o.seller_amount);
  out->set_buyer(o.buyer);
  out->set_seller(o.seller);
  out->set_created_at_ms(o.created_at_ms);
  out->set_status(to_proto(o.status));
}

inline void to_proto(const MarketEvent& ev, mkt::MarketEvent* out) {
  out->set_type(to_proto(ev.type));
  out->set_listing_id(ev.listing_id);
  out->set_order_id(ev.order_id.value_or(0));
  out->set_item_id(ev.item_id);
  out->set_item_registry(ev.item_registry);
  out->set_seller(ev.seller);
  out->set_buyer(ev.buyer);
  out->set_price(ev.price);
  out->set_at_ms(ev.at_ms);
}
