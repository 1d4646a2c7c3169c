#include <gtest/gtest.h>
#include "external/external_error.hpp"
#include "external/in_memory_item_registry.hpp"
#include "external/in_memory_ledger.hpp"
#include "external/registry_directory.hpp"

#include <functional>
#include <limits>
#include <stdexcept>

namespace {

const Address kLedger = "0x000000000000000000000000000000000000f00d";
const Address kAlice  = "0x00000000000000000000000000000000000a11ce";
const Address kBob    = "0x0000000000000000000000000000000000000b0b";
const Address kCarol  = "0x00000000000000000000000000000000000ca201";

struct RecordingReceiver : TransferReceiver {
  int calls = 0;
  Address last_caller, last_from;
  Amount last_amount = 0;
  Payload last_payload;
  bool reject = false;

  void on_transfer_received(const Address& caller, const Address& from,
                            Amount amount, const Payload& payload) override {
    ++calls;
    last_caller = caller;
    last_from = from;
    last_amount = amount;
    last_payload = payload;
    if (reject) throw std::runtime_error("receiver rejected");
  }
};

FailureClass failure_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const ExternalCallError& e) {
    return e.failure();
  }
  ADD_FAILURE() << "expected ExternalCallError";
  return FailureClass::Opaque;
}

} // namespace

// ------------------------------------------------------------------ ledger

TEST(InMemoryLedger, TransferFromSpendsAllowance) {
  InMemoryLedger ledger(kLedger);
  ledger.credit(kAlice, 100);
  ledger.approve(kAlice, kCarol, 60);

  EXPECT_TRUE(ledger.transfer_from(kCarol, kAlice, kBob, 40));
  EXPECT_EQ(ledger.balance_of(kAlice), 60u);
  EXPECT_EQ(ledger.balance_of(kBob), 40u);
  EXPECT_EQ(ledger.allowance(kAlice, kCarol), 20u);

  EXPECT_EQ(failure_of([&] { ledger.transfer_from(kCarol, kAlice, kBob, 21); }), FailureClass::Revert);
  EXPECT_EQ(ledger.balance_of(kAlice), 60u);
}

TEST(InMemoryLedger, OwnerNeedsNoAllowance) {
  InMemoryLedger ledger(kLedger);
  ledger.credit(kAlice, 10);
  EXPECT_TRUE(ledger.transfer_from(kAlice, kAlice, kBob, 10));
  EXPECT_EQ(ledger.balance_of(kBob), 10u);
}

TEST(InMemoryLedger, InsufficientBalanceReverts) {
  InMemoryLedger ledger(kLedger);
  ledger.credit(kAlice, 5);
  ledger.approve(kAlice, kCarol, 100);
  EXPECT_EQ(failure_of([&] { ledger.transfer_from(kCarol, kAlice, kBob, 6); }), FailureClass::Revert);
  EXPECT_EQ(ledger.allowance(kAlice, kCarol), 100u);
}

TEST(InMemoryLedger, CreditOverflowIsArithmetic) {
  InMemoryLedger ledger(kLedger);
  ledger.credit(kAlice, std::numeric_limits<Amount>::max());
  EXPECT_THROW(ledger.credit(kAlice, 1), std::overflow_error);
}

TEST(InMemoryLedger, CallbackCarriesLedgerIdentityAndPayload) {
  InMemoryLedger ledger(kLedger);
  RecordingReceiver rx;
  ledger.register_receiver(kCarol, &rx);
  ledger.credit(kAlice, 10);
  ledger.approve(kAlice, kCarol, 10);

  EXPECT_TRUE(ledger.transfer_with_callback(kCarol, kAlice, kCarol, 3, "payload"));
  EXPECT_EQ(rx.calls, 1);
  EXPECT_EQ(rx.last_caller, kLedger);
  EXPECT_EQ(rx.last_from, kAlice);
  EXPECT_EQ(rx.last_amount, 3u);
  EXPECT_EQ(rx.last_payload, "payload");
  EXPECT_EQ(ledger.balance_of(kCarol), 3u);
}

TEST(InMemoryLedger, RejectingReceiverUndoesTransfer) {
  InMemoryLedger ledger(kLedger);
  RecordingReceiver rx;
  rx.reject = true;
  ledger.register_receiver(kCarol, &rx);
  ledger.credit(kAlice, 10);
  ledger.approve(kAlice, kCarol, 10);

  EXPECT_THROW(ledger.transfer_with_callback(kCarol, kAlice, kCarol, 4, "p"), std::runtime_error);
  EXPECT_EQ(ledger.balance_of(kAlice), 10u);
  EXPECT_EQ(ledger.balance_of(kCarol), 0u);
  EXPECT_EQ(ledger.allowance(kAlice, kCarol), 10u);
}

TEST(InMemoryLedger, CallbackToNonReceiverReverts) {
  InMemoryLedger ledger(kLedger);
  ledger.credit(kAlice, 10);
  EXPECT_EQ(failure_of([&] { ledger.transfer_with_callback(kAlice, kAlice, kBob, 1, "p"); }),
            FailureClass::Revert);
  EXPECT_EQ(ledger.balance_of(kAlice), 10u);
}

// ------------------------------------------------------------------ registry

TEST(InMemoryItemRegistry, OwnershipAndApprovals) {
  InMemoryItemRegistry reg;
  reg.mint(kAlice, 1);
  EXPECT_EQ(reg.owner_of(1), kAlice);
  EXPECT_EQ(reg.get_approved(1), "");

  reg.approve(kAlice, kBob, 1);
  EXPECT_EQ(reg.get_approved(1), kBob);

  reg.set_approval_for_all(kAlice, kCarol, true);
  EXPECT_TRUE(reg.is_approved_for_all(kAlice, kCarol));
  EXPECT_FALSE(reg.is_approved_for_all(kAlice, kBob));
}

TEST(InMemoryItemRegistry, UnknownItemReverts) {
  InMemoryItemRegistry reg;
  EXPECT_EQ(failure_of([&] { reg.owner_of(9); }), FailureClass::Revert);
  EXPECT_EQ(failure_of([&] { reg.get_approved(9); }), FailureClass::Revert);
}

TEST(InMemoryItemRegistry, TransferClearsApprovalAndChecksOperator) {
  InMemoryItemRegistry reg;
  reg.mint(kAlice, 1);
  EXPECT_EQ(failure_of([&] { reg.safe_transfer_from(kBob, kAlice, kBob, 1); }), FailureClass::Revert);

  reg.approve(kAlice, kCarol, 1);
  reg.safe_transfer_from(kCarol, kAlice, kBob, 1);
  EXPECT_EQ(reg.owner_of(1), kBob);
  EXPECT_EQ(reg.get_approved(1), "");
}

TEST(InMemoryItemRegistry, RejectingReceiverLeavesItemInPlace) {
  InMemoryItemRegistry reg;
  reg.mint(kAlice, 1);
  reg.set_rejecting_receiver(kBob, true);
  EXPECT_EQ(failure_of([&] { reg.safe_transfer_from(kAlice, kAlice, kBob, 1); }), FailureClass::Revert);
  EXPECT_EQ(reg.owner_of(1), kAlice);
}

TEST(InMemoryItemRegistry, BurnRemovesItem) {
  InMemoryItemRegistry reg;
  reg.mint(kAlice, 1);
  reg.burn(kAlice, 1);
  EXPECT_FALSE(reg.exists(1));
}

TEST(StaticRegistryDirectory, UnknownAddressIsOpaque) {
  StaticRegistryDirectory dir;
  InMemoryItemRegistry reg;
  dir.add("0xE7", reg);
  EXPECT_EQ(&dir.resolve("0xe7"), &reg);
  EXPECT_EQ(failure_of([&] { dir.resolve("0xe8"); }), FailureClass::Opaque);
}
