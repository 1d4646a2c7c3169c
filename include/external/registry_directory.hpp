#pragma once
#include "external/item_registry.hpp"

#include <unordered_map>

// Fixed address -> registry table. Registries are not owned.
class StaticRegistryDirectory final : public RegistryDirectory {
public:
  void add(const Address& registry_address, ItemRegistry& registry);

  ItemRegistry& resolve(const Address& registry_address) override;

private:
  std::unordered_map<Address, ItemRegistry*> registries_;
};
