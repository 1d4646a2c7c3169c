#include "external/in_memory_item_registry.hpp"
#include "external/external_error.hpp"

#include <string>

namespace {

[[noreturn]] void revert(const std::string& reason) {
  throw ExternalCallError(FailureClass::Revert, reason);
}

} // namespace

void InMemoryItemRegistry::mint(const Address& to, ItemId item) {
  const Address owner = normalize_address(to);
  if (is_null_address(owner)) revert("mint to the zero address");
  if (exists(item)) revert("token already minted");
  owners_.emplace(item, owner);
}

void InMemoryItemRegistry::burn(const Address& caller, ItemId item) {
  const Address owner = owner_of(item);
  if (!can_operate(normalize_address(caller), owner, item)) revert("caller is not token owner or approved");
  owners_.erase(item);
  approvals_.erase(item);
}

void InMemoryItemRegistry::approve(const Address& caller, const Address& approved, ItemId item) {
  const Address owner = owner_of(item);
  const Address who   = normalize_address(caller);
  if (who != owner && !is_approved_for_all(owner, who)) {
    revert("approve caller is not token owner or approved for all");
  }
  const Address to = normalize_address(approved);
  if (to == owner) revert("approval to current owner");
  approvals_[item] = to;
}

void InMemoryItemRegistry::set_approval_for_all(const Address& owner, const Address& op, bool approved) {
  const auto key = std::make_pair(normalize_address(owner), normalize_address(op));
  if (key.first == key.second) revert("approve to caller");
  if (approved) operators_.insert(key);
  else          operators_.erase(key);
}

void InMemoryItemRegistry::set_rejecting_receiver(const Address& receiver, bool rejecting) {
  if (rejecting) rejecting_.insert(normalize_address(receiver));
  else           rejecting_.erase(normalize_address(receiver));
}

Address InMemoryItemRegistry::owner_of(ItemId item) const {
  auto it = owners_.find(item);
  if (it == owners_.end()) revert("invalid token ID");
  return it->second;
}

Address InMemoryItemRegistry::get_approved(ItemId item) const {
  if (!exists(item)) revert("invalid token ID");
  auto it = approvals_.find(item);
  return it == approvals_.end() ? Address() : it->second;
}

bool InMemoryItemRegistry::is_approved_for_all(const Address& owner, const Address& op) const {
  return operators_.count(std::make_pair(normalize_address(owner), normalize_address(op))) != 0;
}

bool InMemoryItemRegistry::can_operate(const Address& op, const Address& owner, ItemId item) const {
  if (op == owner) return true;
  auto it = approvals_.find(item);
  if (it != approvals_.end() && it->second == op) return true;
  return is_approved_for_all(owner, op);
}

void InMemoryItemRegistry::safe_transfer_from(const Address& op,
                                              const Address& from,
                                              const Address& to,
                                              ItemId item) {
  const Address owner  = owner_of(item);
  const Address sender = normalize_address(from);
  const Address dest   = normalize_address(to);

  if (owner != sender) revert("transfer from incorrect owner");
  if (!can_operate(normalize_address(op), owner, item)) revert("caller is not token owner or approved");
  if (is_null_address(dest)) revert("transfer to the zero address");
  if (rejecting_.count(dest)) revert("transfer to non ERC721Receiver implementer");

  // All checks passed; apply.
  approvals_.erase(item);
  owners_[item] = dest;
}
