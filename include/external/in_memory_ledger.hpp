#pragma once
#include "external/fungible_ledger.hpp"

#include <map>
#include <unordered_map>
#include <utility>

// Process-local fungible ledger used by the sandbox server and by tests.
// Addresses it reports to receivers as `caller` are its own `self` address.
class InMemoryLedger final : public FungibleLedger {
public:
  explicit InMemoryLedger(Address self);

  const Address& address() const { return self_; }

  void credit(const Address& account, Amount amount);
  void approve(const Address& owner, const Address& spender, Amount amount);

  // Receiver notified by transfer_with_callback() when `account` is the target.
  void register_receiver(const Address& account, TransferReceiver* receiver);

  Amount balance_of(const Address& account) const override;
  Amount allowance(const Address& owner, const Address& spender) const override;

  bool transfer_from(const Address& spender,
                     const Address& from,
                     const Address& to,
                     Amount amount) override;

  bool transfer_with_callback(const Address& spender,
                              const Address& from,
                              const Address& to,
                              Amount amount,
                              const Payload& payload) override;

private:
  void move_(const Address& spender, const Address& from, const Address& to, Amount amount);

  Address self_;
  std::unordered_map<Address, Amount>            balances_;
  std::map<std::pair<Address, Address>, Amount>  allowances_;   // (owner, spender)
  std::unordered_map<Address, TransferReceiver*> receivers_;
};
