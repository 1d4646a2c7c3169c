#pragma once
#include <string>

// Account / contract identity as seen by the ledger and the item registries.
// Always compared in normalized (lower-case) form, see normalize_address().
using Address = std::string;

inline const Address kZeroAddress = "0x0000000000000000000000000000000000000000";

inline bool is_null_address(const Address& a) {
  return a.empty() || a == kZeroAddress;
}

Address normalize_address(Address a);
