#pragma once
#include "domain/admin_config.hpp"
#include "domain/event.hpp"
#include "domain/listing.hpp"
#include "domain/order.hpp"

// Write-through sink for every mutation the engine makes. Called after the
// in-memory state has changed. Default implementations ignore everything.
class MarketJournal {
public:
  virtual ~MarketJournal() = default;

  virtual void listing_stored(const Listing&) {}
  virtual void listing_removed(ListingId) {}
  virtual void order_saved(const Order&) {}
  virtual void admin_changed(const AdminConfig&) {}
  virtual void event_emitted(const MarketEvent&) {}
};
