#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/admin_config.hpp"
#include "domain/listing.hpp"
#include "domain/order.hpp"
#include "external/fungible_ledger.hpp"
#include "external/item_registry.hpp"

class MarketJournal;

struct EngineConfig {
  Address     market;   // identity the marketplace acts as (spender / operator)
  Address     ledger;   // only caller allowed on the settlement callback
  AdminConfig admin;
  std::function<int64_t()> clock;   // epoch ms; defaults to the system clock
};

// Listing / order / settlement state machine.
//
// Not thread-safe: every public call is one serialized request. The ledger
// re-enters through on_transfer_received() from inside buy(); that path
// re-validates ownership and authorization instead of trusting the snapshot
// buy() worked from.
class SettlementEngine final : public TransferReceiver {
public:
  SettlementEngine(EngineConfig config,
                   FungibleLedger& ledger,
                   RegistryDirectory& registries,
                   MarketJournal* journal = nullptr);
  ~SettlementEngine() override;   // defined in .cpp (Impl is incomplete here)

  SettlementEngine(const SettlementEngine&) = delete;
  SettlementEngine& operator=(const SettlementEngine&) = delete;
  SettlementEngine(SettlementEngine&&) = delete;              // the ledger holds our address
  SettlementEngine& operator=(SettlementEngine&&) = delete;

  ListingId list(const Address& caller,
                 ItemId item,
                 Amount price,
                 const Address& registry,
                 std::string metadata_uri);

  OrderId buy(const Address& caller, ListingId listing_id);

  // Settlement completion, called by the ledger after the fee leg lands.
  void on_transfer_received(const Address& caller,
                            const Address& from,
                            Amount amount,
                            const Payload& payload) override;

  std::optional<Listing> nft_info(ListingId id) const;
  std::optional<Order> order_info(OrderId id) const;

  uint32_t fee_percent() const;
  Amount minimum_fee() const;
  const AdminConfig& admin_config() const;
  const Address& market_address() const;

  void change_fee_percent(const Address& caller, uint32_t fee_percent_bp);
  void change_minimum_fee(const Address& caller, Amount minimum_fee);
  void set_admin(const Address& caller, const Address& new_admin);

  // Rehydrate from storage. Only valid on a freshly constructed engine.
  // Orders still Pending were interrupted mid-settlement and come back Cancelled.
  void restore(const std::vector<Listing>& listings,
               const std::vector<Order>& orders,
               ListingId next_listing_id,
               OrderId next_order_id);

  size_t active_listings() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pImpl;
};
