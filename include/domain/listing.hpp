#pragma once
#include <string>
#include "domain/address.hpp"
#include "domain/amount.hpp"
#include "domain/ids.hpp"

struct Listing {
  ListingId   listing_id = 0;
  ItemId      item_id    = 0;
  Amount      price      = 0;
  Address     recorded_owner;   // registry answer at listing time, NOT live
  Address     item_registry;
  std::string metadata_uri;
};

inline bool operator==(const Listing& a, const Listing& b) {
  return a.listing_id == b.listing_id && a.item_id == b.item_id && a.price == b.price &&
         a.recorded_owner == b.recorded_owner && a.item_registry == b.item_registry &&
         a.metadata_uri == b.metadata_uri;
}
