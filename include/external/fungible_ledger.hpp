#pragma once
#include "domain/address.hpp"
#include "domain/amount.hpp"
#include "domain/payload.hpp"

// Capability the ledger holds to notify a receiver that a callback-carrying
// transfer landed. `caller` is the identity of the ledger making the call.
class TransferReceiver {
public:
  virtual ~TransferReceiver() = default;

  virtual void on_transfer_received(const Address& caller,
                                    const Address& from,
                                    Amount amount,
                                    const Payload& payload) = 0;
};

// Fungible balance ledger. `spender` is whoever is moving funds on behalf of
// `from` and must hold enough allowance unless it is `from` itself.
class FungibleLedger {
public:
  virtual ~FungibleLedger() = default;

  virtual Amount balance_of(const Address& account) const = 0;
  virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

  virtual bool transfer_from(const Address& spender,
                             const Address& from,
                             const Address& to,
                             Amount amount) = 0;

  // On success invokes the receiver registered for `to` with
  // (from, amount, payload) before returning. If the receiver throws, the
  // transfer is undone and the exception propagates.
  virtual bool transfer_with_callback(const Address& spender,
                                      const Address& from,
                                      const Address& to,
                                      Amount amount,
                                      const Payload& payload) = 0;
};
