#include "external/registry_directory.hpp"
#include "external/external_error.hpp"

void StaticRegistryDirectory::add(const Address& registry_address, ItemRegistry& registry) {
  registries_[normalize_address(registry_address)] = &registry;
}

ItemRegistry& StaticRegistryDirectory::resolve(const Address& registry_address) {
  auto it = registries_.find(normalize_address(registry_address));
  if (it == registries_.end()) {
    // Calling into an address with no code: nothing explains the failure.
    throw ExternalCallError(FailureClass::Opaque, "");
  }
  return *it->second;
}
