#include "server/market_host.hpp"

#include "engine/settlement_engine.hpp"
#include "external/in_memory_item_registry.hpp"
#include "external/in_memory_ledger.hpp"
#include "external/registry_directory.hpp"
#include "storage/storage.h"

#include <iostream>
#include <map>

// ============================= Impl =============================
struct MarketHost::Impl {
  explicit Impl(HostOptions o) : opts(std::move(o)), storage(opts.db_path), ledger(opts.ledger) {
    storage.init();

    // Persisted admin state wins over flags; flags only seed a fresh database.
    AdminConfig cfg;
    if (auto stored = storage.load_admin_config()) {
      cfg = *stored;
    } else {
      cfg.admin          = normalize_address(opts.admin);
      cfg.fee_percent_bp = opts.fee_percent_bp;
      cfg.minimum_fee    = opts.minimum_fee;
    }

    EngineConfig ec;
    ec.market = opts.market;
    ec.ledger = ledger.address();
    ec.admin  = cfg;
    engine = std::make_unique<SettlementEngine>(ec, ledger, directory, &storage);
    storage.admin_changed(engine->admin_config());

    auto listings = storage.load_listings();
    auto orders   = storage.load_orders();
    engine->restore(listings, orders, storage.load_next_listing_seq(), storage.load_next_order_seq());
    std::cout << "[HOST] restored listings=" << listings.size() << " orders=" << orders.size()
              << " market=" << engine->market_address() << " ledger=" << ledger.address()
              << " admin=" << engine->admin_config().admin << "\n";

    ledger.register_receiver(engine->market_address(), engine.get());
  }

  HostOptions             opts;
  Storage                 storage;      // long-lived DB handle
  InMemoryLedger          ledger;
  StaticRegistryDirectory directory;
  std::map<Address, std::unique_ptr<InMemoryItemRegistry>> registries;
  std::unique_ptr<SettlementEngine> engine;
  std::mutex              request_mu;   // one request at a time
};

// ========================== API surface =========================
MarketHost::MarketHost(HostOptions opts) : d_(std::make_unique<Impl>(std::move(opts))) {}

MarketHost::~MarketHost() = default;

SettlementEngine& MarketHost::engine() { return *d_->engine; }
InMemoryLedger& MarketHost::ledger() { return d_->ledger; }
Storage& MarketHost::storage() { return d_->storage; }
std::mutex& MarketHost::request_mutex() { return d_->request_mu; }

InMemoryItemRegistry& MarketHost::registry(const Address& address) {
  const Address key = normalize_address(address);
  auto& slot = d_->registries[key];
  if (!slot) {
    slot = std::make_unique<InMemoryItemRegistry>();
    d_->directory.add(key, *slot);
    std::cout << "[HOST] deployed sandbox item registry at " << key << "\n";
  }
  return *slot;
}

InMemoryItemRegistry* MarketHost::find_registry(const Address& address) {
  auto it = d_->registries.find(normalize_address(address));
  return it == d_->registries.end() ? nullptr : it->second.get();
}
