#pragma once
#include "domain/address.hpp"
#include "domain/amount.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

class InMemoryItemRegistry;
class InMemoryLedger;
class SettlementEngine;
class Storage; // forward declaration, don't pull SQLite headers here

struct HostOptions {
  std::string db_path = "db/nft_market.db";
  Address     market  = "0x000000000000000000000000000000000000d00d";
  Address     ledger  = "0x000000000000000000000000000000000000f00d";
  Address     admin   = "0x000000000000000000000000000000000000ad00";
  uint32_t    fee_percent_bp = 300;
  Amount      minimum_fee    = 1;
};

// Owns everything one marketplace process runs: the SQLite store, the
// sandbox ledger and item registries, and the settlement engine wired to them.
// Callers must hold request_mutex() for every call into the engine or the
// sandbox collaborators; that lock is what serializes requests.
class MarketHost {
public:
  explicit MarketHost(HostOptions opts);
  ~MarketHost();

  MarketHost(const MarketHost&)            = delete;
  MarketHost& operator=(const MarketHost&) = delete;

  SettlementEngine& engine();
  InMemoryLedger& ledger();
  Storage& storage();

  // Sandbox registry deployed at `address`, created on first use.
  InMemoryItemRegistry& registry(const Address& address);
  // nullptr when nothing is deployed at `address`.
  InMemoryItemRegistry* find_registry(const Address& address);

  std::mutex& request_mutex();

private:
  struct Impl;
  std::unique_ptr<Impl> d_;
};
