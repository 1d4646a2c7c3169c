#include "engine/listing_registry.hpp"

#include <stdexcept>
#include <string>

const Listing* ListingRegistry::find(ListingId id) const {
  auto it = listings_.find(id);
  return it == listings_.end() ? nullptr : &it->second;
}

void ListingRegistry::insert(Listing listing) {
  const ListingId id = listing.listing_id;
  if (!listings_.emplace(id, std::move(listing)).second) {
    throw std::logic_error("duplicate listing id " + std::to_string(id));
  }
}

bool ListingRegistry::remove(ListingId id) {
  return listings_.erase(id) != 0;
}
