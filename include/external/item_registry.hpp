#pragma once
#include "domain/address.hpp"
#include "domain/ids.hpp"

// Item ownership registry the marketplace trades against. The marketplace
// never owns items; it only asks the registry to move them between parties.
// Failures are reported as ExternalCallError (or std::overflow_error for
// arithmetic faults).
class ItemRegistry {
public:
  virtual ~ItemRegistry() = default;

  // Throws if the item does not exist.
  virtual Address owner_of(ItemId item) const = 0;
  virtual Address get_approved(ItemId item) const = 0;
  virtual bool is_approved_for_all(const Address& owner, const Address& op) const = 0;

  // Atomic: either the item moves to `to` or nothing changes.
  virtual void safe_transfer_from(const Address& op,
                                  const Address& from,
                                  const Address& to,
                                  ItemId item) = 0;
};

// Maps the registry address stored in a listing to a live registry.
class RegistryDirectory {
public:
  virtual ~RegistryDirectory() = default;

  // Throws ExternalCallError if nothing is deployed at `registry`.
  virtual ItemRegistry& resolve(const Address& registry) = 0;
};
