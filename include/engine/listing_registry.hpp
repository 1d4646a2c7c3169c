#pragma once
#include "domain/listing.hpp"

#include <map>

// Active listings by id. Entries are immutable; they are only inserted or
// removed (sold, or found stale).
class ListingRegistry {
public:
  const Listing* find(ListingId id) const;
  void insert(Listing listing);
  bool remove(ListingId id);

  size_t size() const { return listings_.size(); }

private:
  std::map<ListingId, Listing> listings_;
};
