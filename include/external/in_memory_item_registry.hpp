#pragma once
#include "external/item_registry.hpp"

#include <map>
#include <set>
#include <unordered_map>
#include <utility>

// Process-local item registry used by the sandbox server and by tests.
class InMemoryItemRegistry final : public ItemRegistry {
public:
  void mint(const Address& to, ItemId item);
  void burn(const Address& caller, ItemId item);
  void approve(const Address& caller, const Address& approved, ItemId item);
  void set_approval_for_all(const Address& owner, const Address& op, bool approved);

  // Receivers flagged here reject incoming safe transfers.
  void set_rejecting_receiver(const Address& receiver, bool rejecting);

  bool exists(ItemId item) const { return owners_.count(item) != 0; }

  Address owner_of(ItemId item) const override;
  Address get_approved(ItemId item) const override;
  bool is_approved_for_all(const Address& owner, const Address& op) const override;
  void safe_transfer_from(const Address& op,
                          const Address& from,
                          const Address& to,
                          ItemId item) override;

private:
  bool can_operate(const Address& op, const Address& owner, ItemId item) const;

  std::unordered_map<ItemId, Address>  owners_;
  std::unordered_map<ItemId, Address>  approvals_;
  std::set<std::pair<Address, Address>> operators_;   // (owner, operator)
  std::set<Address>                    rejecting_;
};
