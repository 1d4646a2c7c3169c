#include "external/in_memory_ledger.hpp"
#include "external/external_error.hpp"

InMemoryLedger::InMemoryLedger(Address self) : self_(normalize_address(std::move(self))) {}

void InMemoryLedger::credit(const Address& account, Amount amount) {
  const Address who = normalize_address(account);
  if (is_null_address(who)) throw ExternalCallError(FailureClass::Revert, "mint to the zero address");
  balances_[who] = checked_add(balances_[who], amount);
}

void InMemoryLedger::approve(const Address& owner, const Address& spender, Amount amount) {
  const Address o = normalize_address(owner);
  const Address s = normalize_address(spender);
  if (is_null_address(o) || is_null_address(s)) {
    throw ExternalCallError(FailureClass::Revert, "approve with the zero address");
  }
  allowances_[{o, s}] = amount;
}

void InMemoryLedger::register_receiver(const Address& account, TransferReceiver* receiver) {
  const Address who = normalize_address(account);
  if (receiver) receivers_[who] = receiver;
  else          receivers_.erase(who);
}

Amount InMemoryLedger::balance_of(const Address& account) const {
  auto it = balances_.find(normalize_address(account));
  return it == balances_.end() ? 0 : it->second;
}

Amount InMemoryLedger::allowance(const Address& owner, const Address& spender) const {
  auto it = allowances_.find({normalize_address(owner), normalize_address(spender)});
  return it == allowances_.end() ? 0 : it->second;
}

void InMemoryLedger::move_(const Address& spender, const Address& from, const Address& to, Amount amount) {
  if (is_null_address(to)) throw ExternalCallError(FailureClass::Revert, "transfer to the zero address");

  const Amount from_balance = balance_of(from);
  if (from_balance < amount) throw ExternalCallError(FailureClass::Revert, "transfer amount exceeds balance");

  const bool spends_allowance = (spender != from);
  if (spends_allowance && allowance(from, spender) < amount) {
    throw ExternalCallError(FailureClass::Revert, "insufficient allowance");
  }

  // Compute every new value before writing any of them.
  const Amount new_to = (from == to) ? from_balance : checked_add(balance_of(to), amount);
  if (spends_allowance) allowances_[{from, spender}] -= amount;
  balances_[from] = from_balance - amount;
  balances_[to]   = (from == to) ? from_balance : new_to;
}

bool InMemoryLedger::transfer_from(const Address& spender,
                                   const Address& from,
                                   const Address& to,
                                   Amount amount) {
  move_(normalize_address(spender), normalize_address(from), normalize_address(to), amount);
  return true;
}

bool InMemoryLedger::transfer_with_callback(const Address& spender,
                                            const Address& from,
                                            const Address& to,
                                            Amount amount,
                                            const Payload& payload) {
  const Address s = normalize_address(spender);
  const Address f = normalize_address(from);
  const Address t = normalize_address(to);

  auto rit = receivers_.find(t);
  if (rit == receivers_.end()) {
    throw ExternalCallError(FailureClass::Revert, "transfer to non receiver implementer");
  }

  // Snapshot what move_() touches so a rejecting receiver leaves no trace.
  const Amount from_before  = balance_of(f);
  const Amount to_before    = balance_of(t);
  const Amount allow_before = allowance(f, s);

  move_(s, f, t, amount);
  try {
    rit->second->on_transfer_received(self_, f, amount, payload);
  } catch (...) {
    balances_[f] = from_before;
    balances_[t] = (f == t) ? from_before : to_before;
    if (s != f) allowances_[{f, s}] = allow_before;
    throw;
  }
  return true;
}
