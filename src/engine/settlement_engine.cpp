#include "engine/settlement_engine.hpp"

#include "domain/error.hpp"
#include "domain/event.hpp"
#include "engine/admin_policy.hpp"
#include "engine/fee.hpp"
#include "engine/journal.hpp"
#include "engine/listing_registry.hpp"
#include "engine/order_book.hpp"
#include "engine/sequence.hpp"
#include "external/external_error.hpp"
#include "utils/time.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

// Runs one call into a collaborator and maps its failure onto the engine's
// error kinds. `revert_kind` is used when the collaborator gave a reason.
// A MarketError coming back through the ledger (re-entrant callback) passes
// through untouched.
template <typename Fn>
auto guarded_call(Fn&& fn,
                  ErrorKind revert_kind,
                  const char* what,
                  std::optional<ListingId> lid,
                  std::optional<OrderId> oid) -> decltype(fn()) {
  try {
    return fn();
  } catch (const MarketError&) {
    throw;
  } catch (const ExternalCallError& e) {
    if (e.failure() == FailureClass::Panic) {
      throw MarketError(ErrorKind::ArithmeticFault, what, lid, oid, e.reason());
    }
    if (e.failure() == FailureClass::Revert && !e.reason().empty()) {
      throw MarketError(revert_kind, what, lid, oid, e.reason());
    }
    throw MarketError(ErrorKind::ExternalFailure, what, lid, oid);
  } catch (const std::overflow_error& e) {
    throw MarketError(ErrorKind::ArithmeticFault, what, lid, oid, e.what());
  } catch (const std::underflow_error& e) {
    throw MarketError(ErrorKind::ArithmeticFault, what, lid, oid, e.what());
  } catch (const std::exception&) {
    throw MarketError(ErrorKind::ExternalFailure, what, lid, oid);
  }
}

// Approval lookups are best-effort: a failing query means "not approved".
template <typename Fn>
bool probe(Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception&) {
    return false;
  }
}

enum class Drift { None, ItemGone, OwnerChanged };

Address required_address(const Address& a, const char* what) {
  Address out = normalize_address(a);
  if (is_null_address(out)) throw MarketError(ErrorKind::InvalidAddress, std::string(what) + " cannot be the null address");
  return out;
}

} // namespace

// All internals live here, not in the header:
struct SettlementEngine::Impl {
  EngineConfig       cfg;
  FungibleLedger&    ledger;
  RegistryDirectory& registries;
  MarketJournal*     journal;
  AdminPolicy        policy;
  SequenceAllocator  listing_seq;
  SequenceAllocator  order_seq;
  ListingRegistry    listings;
  OrderBook          orders;

  Impl(EngineConfig c, FungibleLedger& l, RegistryDirectory& r, MarketJournal* j)
    : cfg(std::move(c)), ledger(l), registries(r), journal(j), policy(cfg.admin) {
    cfg.market = required_address(cfg.market, "market address");
    cfg.ledger = required_address(cfg.ledger, "ledger address");
    cfg.admin  = policy.config();
    if (!cfg.clock) cfg.clock = now_epoch_ms;
  }

  // -------------- journal / events --------------
  void emit(EventType type, const Listing& l, std::optional<OrderId> oid, const Address& buyer) {
    if (!journal) return;
    MarketEvent ev;
    ev.type          = type;
    ev.listing_id    = l.listing_id;
    ev.order_id      = oid;
    ev.item_id       = l.item_id;
    ev.item_registry = l.item_registry;
    ev.seller        = l.recorded_owner;
    ev.buyer         = buyer;
    ev.price         = l.price;
    ev.at_ms         = cfg.clock();
    journal->event_emitted(ev);
  }

  void drop_listing(const Listing& l) {
    if (listings.remove(l.listing_id) && journal) journal->listing_removed(l.listing_id);
  }

  void cancel(OrderId oid) {
    if (const Order* o = orders.cancel(oid); o && journal) journal->order_saved(*o);
  }

  // -------------- external truth --------------
  Drift check_drift(const Listing& l) {
    Address current;
    try {
      current = normalize_address(registries.resolve(l.item_registry).owner_of(l.item_id));
    } catch (const std::exception&) {
      return Drift::ItemGone;
    }
    return current == l.recorded_owner ? Drift::None : Drift::OwnerChanged;
  }

  // Removes a listing whose snapshot no longer matches the registry.
  void retire_stale(const Listing& l, Drift drift, std::optional<OrderId> oid) {
    drop_listing(l);
    emit(drift == Drift::ItemGone ? EventType::ItemNoLongerExists : EventType::ItemNoLongerAvailable,
         l, oid, Address());
  }

  ItemRegistry& registry_for(const Address& addr, ErrorKind revert_kind,
                             std::optional<ListingId> lid, std::optional<OrderId> oid) {
    return guarded_call([&]() -> ItemRegistry& { return registries.resolve(addr); },
                        revert_kind, "item registry unreachable", lid, oid);
  }

  // owner, then single-item approval, then operator approval.
  bool may_list(ItemRegistry& reg, const Address& caller, const Address& owner, ItemId item) {
    if (caller == owner) return true;
    if (probe([&] { return normalize_address(reg.get_approved(item)) == caller; })) return true;
    return probe([&] { return reg.is_approved_for_all(owner, caller); });
  }

  bool market_may_move(ItemRegistry& reg, const Listing& l) {
    if (probe([&] { return reg.is_approved_for_all(l.recorded_owner, cfg.market); })) return true;
    return probe([&] { return normalize_address(reg.get_approved(l.item_id)) == cfg.market; });
  }

  // -------------- settlement legs --------------
  void require_funds(const Order& o) {
    const Amount buyer_allowance = guarded_call(
        [&] { return ledger.allowance(o.buyer, cfg.market); },
        ErrorKind::ExternalRevert, "buyer allowance query failed", o.listing_id, o.order_id);
    if (buyer_allowance < o.price) {
      throw MarketError(ErrorKind::InsufficientAllowance,
                        "buyer allowance " + std::to_string(buyer_allowance) +
                        " below price " + std::to_string(o.price),
                        o.listing_id, o.order_id);
    }

    // The seller covers the fee and, should a later step fail, the price refund.
    const Amount seller_allowance = guarded_call(
        [&] { return ledger.allowance(o.seller, cfg.market); },
        ErrorKind::ExternalRevert, "seller allowance query failed", o.listing_id, o.order_id);
    if (seller_allowance < o.platform_fee || seller_allowance - o.platform_fee < o.price) {
      throw MarketError(ErrorKind::InsufficientAllowance,
                        "seller allowance " + std::to_string(seller_allowance) +
                        " below platform fee " + std::to_string(o.platform_fee) +
                        " plus price " + std::to_string(o.price),
                        o.listing_id, o.order_id);
    }

    const Amount buyer_balance = guarded_call(
        [&] { return ledger.balance_of(o.buyer); },
        ErrorKind::ExternalRevert, "buyer balance query failed", o.listing_id, o.order_id);
    if (buyer_balance < o.price) {
      throw MarketError(ErrorKind::InsufficientBalance,
                        "buyer balance " + std::to_string(buyer_balance) +
                        " below price " + std::to_string(o.price),
                        o.listing_id, o.order_id);
    }
  }

  // Leg 1: buyer pays the seller directly.
  void transfer_price(const Order& o) {
    const bool ok = guarded_call(
        [&] { return ledger.transfer_from(cfg.market, o.buyer, o.seller, o.price); },
        ErrorKind::ExternalRevert, "price transfer failed", o.listing_id, o.order_id);
    if (!ok) throw MarketError(ErrorKind::ExternalFailure, "ledger refused price transfer", o.listing_id, o.order_id);
  }

  // Leg 2: seller pays the fee to the marketplace; the ledger calls back.
  void transfer_fee(const Order& o) {
    const Payload payload = encode_order_payload(o.order_id);
    const bool ok = guarded_call(
        [&] { return ledger.transfer_with_callback(cfg.market, o.seller, cfg.market, o.platform_fee, payload); },
        ErrorKind::ExternalRevert, "fee transfer failed", o.listing_id, o.order_id);
    if (!ok) throw MarketError(ErrorKind::ExternalFailure, "ledger refused fee transfer", o.listing_id, o.order_id);
  }

  // Compensates leg 1 once anything after it failed. The ledger has already
  // undone leg 2 by the time its failure reaches us.
  void refund_price(const Order& o, const MarketError& cause) {
    bool ok = false;
    try {
      ok = ledger.transfer_from(cfg.market, o.seller, o.buyer, o.price);
    } catch (const std::exception& e) {
      throw MarketError(ErrorKind::ExternalFailure,
                        std::string("price refund failed (") + e.what() + ") after: " + cause.detail(),
                        o.listing_id, o.order_id, cause.external_reason());
    }
    if (!ok) {
      throw MarketError(ErrorKind::ExternalFailure, "ledger refused price refund after: " + cause.detail(),
                        o.listing_id, o.order_id, cause.external_reason());
    }
  }

  // -------------- requests --------------
  ListingId list(const Address& caller, ItemId item, Amount price, const Address& registry, std::string uri) {
    const Address who      = normalize_address(caller);
    const Address reg_addr = normalize_address(registry);

    if (is_null_address(reg_addr)) {
      throw MarketError(ErrorKind::InvalidRegistry, "item registry address is null");
    }
    if (price < policy.minimum_fee()) {
      throw MarketError(ErrorKind::InvalidPrice,
                        "price " + std::to_string(price) + " below minimum fee " +
                        std::to_string(policy.minimum_fee()));
    }

    ItemRegistry& reg = registry_for(reg_addr, ErrorKind::ItemNotFound, std::nullopt, std::nullopt);
    const Address owner = normalize_address(guarded_call(
        [&] { return reg.owner_of(item); },
        ErrorKind::ItemNotFound, "item not found", std::nullopt, std::nullopt));

    if (!may_list(reg, who, owner, item)) {
      throw MarketError(ErrorKind::NotAuthorized,
                        "caller " + who + " is neither owner nor approved for item " + std::to_string(item));
    }

    Listing l;
    l.listing_id     = listing_seq.allocate();
    l.item_id        = item;
    l.price          = price;
    l.recorded_owner = owner;
    l.item_registry  = reg_addr;
    l.metadata_uri   = std::move(uri);

    listings.insert(l);
    if (journal) journal->listing_stored(l);
    emit(EventType::ListingCreated, l, std::nullopt, Address());
    return l.listing_id;
  }

  OrderId buy(const Address& caller, ListingId lid) {
    const Address buyer = required_address(caller, "buyer");

    const Listing* found = listings.find(lid);
    if (!found) throw MarketError(ErrorKind::InvalidListing, "no active listing", lid);
    const Listing listing = *found;

    // The snapshot may be stale: the owner can sell or burn the item elsewhere.
    switch (check_drift(listing)) {
      case Drift::ItemGone:
        retire_stale(listing, Drift::ItemGone, std::nullopt);
        throw MarketError(ErrorKind::ItemNoLongerExists, "item no longer exists", lid);
      case Drift::OwnerChanged:
        retire_stale(listing, Drift::OwnerChanged, std::nullopt);
        throw MarketError(ErrorKind::OwnershipChanged, "item changed hands since listing", lid);
      case Drift::None:
        break;
    }

    if (listing.price < policy.minimum_fee()) {
      throw MarketError(ErrorKind::InvalidPrice,
                        "price " + std::to_string(listing.price) + " below minimum fee " +
                        std::to_string(policy.minimum_fee()), lid);
    }
    if (buyer == listing.recorded_owner) {
      throw MarketError(ErrorKind::SameParty, "seller cannot buy own listing", lid);
    }

    const FeeQuote quote = quote_fee(listing.price, policy.fee_percent(), policy.minimum_fee());

    Order o;
    o.order_id      = order_seq.allocate();
    o.listing_id    = listing.listing_id;
    o.item_id       = listing.item_id;
    o.price         = listing.price;
    o.platform_fee  = quote.platform_fee;
    o.seller_amount = quote.seller_amount;
    o.buyer         = buyer;
    o.seller        = listing.recorded_owner;
    o.created_at_ms = cfg.clock();
    o.status        = OrderStatus::Pending;

    const Order& placed = orders.insert(o);
    if (journal) journal->order_saved(placed);
    emit(EventType::OrderPlaced, listing, o.order_id, buyer);

    bool price_paid = false;
    try {
      require_funds(o);
      transfer_price(o);
      price_paid = true;
      transfer_fee(o);
    } catch (const MarketError& e) {
      cancel(o.order_id);
      if (price_paid) refund_price(o, e.with_order(o.order_id));
      throw e.with_order(o.order_id);
    }
    return o.order_id;
  }

  void settle(const Address& caller, const Address& from, Amount amount, const Payload& payload) {
    const OrderId oid = decode_order_payload(payload);

    // Only the ledger may drive settlement; anyone else leaves no trace.
    if (normalize_address(caller) != cfg.ledger) {
      throw MarketError(ErrorKind::Unauthorized,
                        "settlement callback from " + caller + " is not the configured ledger",
                        std::nullopt, oid);
    }

    const Order* found = orders.find(oid);
    if (!found) throw MarketError(ErrorKind::InvalidOrder, "unknown order", std::nullopt, oid);
    if (found->is_terminal()) return;   // repeated delivery
    const Order order = *found;

    if (normalize_address(from) != order.seller || amount != order.platform_fee || is_null_address(order.buyer)) {
      cancel(oid);
      throw MarketError(ErrorKind::InvalidOrder,
                        "fee leg from " + from + " amount " + std::to_string(amount) +
                        " does not match order", order.listing_id, oid);
    }

    const Listing* lfound = listings.find(order.listing_id);
    if (!lfound || lfound->item_id != order.item_id) {
      cancel(oid);
      throw MarketError(ErrorKind::InvalidListing, "listing retired before settlement", order.listing_id, oid);
    }
    const Listing listing = *lfound;

    const Drift drift = check_drift(listing);
    if (drift != Drift::None) {
      cancel(oid);
      retire_stale(listing, drift, oid);
      return;
    }

    ItemRegistry& reg = registry_for(listing.item_registry, ErrorKind::ExternalRevert, listing.listing_id, oid);
    if (!market_may_move(reg, listing)) {
      cancel(oid);
      throw MarketError(ErrorKind::NotAuthorized,
                        "owner has not approved the marketplace to move the item", listing.listing_id, oid);
    }

    try {
      guarded_call([&] { reg.safe_transfer_from(cfg.market, listing.recorded_owner, order.buyer, listing.item_id); },
                   ErrorKind::ExternalRevert, "item transfer failed", listing.listing_id, oid);
    } catch (const MarketError&) {
      cancel(oid);
      throw;
    }

    drop_listing(listing);
    if (const Order* done = orders.fulfil(oid); done && journal) journal->order_saved(*done);
    emit(EventType::ItemSold, listing, oid, order.buyer);
  }
};

// ------------------------ SettlementEngine API ---------------------------
SettlementEngine::SettlementEngine(EngineConfig config,
                                   FungibleLedger& ledger,
                                   RegistryDirectory& registries,
                                   MarketJournal* journal)
  : pImpl(std::make_unique<Impl>(std::move(config), ledger, registries, journal)) {}

SettlementEngine::~SettlementEngine() = default;

ListingId SettlementEngine::list(const Address& caller, ItemId item, Amount price,
                                 const Address& registry, std::string metadata_uri) {
  return pImpl->list(caller, item, price, registry, std::move(metadata_uri));
}

OrderId SettlementEngine::buy(const Address& caller, ListingId listing_id) {
  return pImpl->buy(caller, listing_id);
}

void SettlementEngine::on_transfer_received(const Address& caller, const Address& from,
                                            Amount amount, const Payload& payload) {
  pImpl->settle(caller, from, amount, payload);
}

std::optional<Listing> SettlementEngine::nft_info(ListingId id) const {
  if (const Listing* l = pImpl->listings.find(id)) return *l;
  return std::nullopt;
}

std::optional<Order> SettlementEngine::order_info(OrderId id) const {
  if (const Order* o = pImpl->orders.find(id)) return *o;
  return std::nullopt;
}

uint32_t SettlementEngine::fee_percent() const { return pImpl->policy.fee_percent(); }
Amount SettlementEngine::minimum_fee() const { return pImpl->policy.minimum_fee(); }
const AdminConfig& SettlementEngine::admin_config() const { return pImpl->policy.config(); }
const Address& SettlementEngine::market_address() const { return pImpl->cfg.market; }
size_t SettlementEngine::active_listings() const { return pImpl->listings.size(); }

void SettlementEngine::change_fee_percent(const Address& caller, uint32_t fee_percent_bp) {
  pImpl->policy.change_fee_percent(caller, fee_percent_bp);
  if (pImpl->journal) pImpl->journal->admin_changed(pImpl->policy.config());
}

void SettlementEngine::change_minimum_fee(const Address& caller, Amount minimum_fee) {
  pImpl->policy.change_minimum_fee(caller, minimum_fee);
  if (pImpl->journal) pImpl->journal->admin_changed(pImpl->policy.config());
}

void SettlementEngine::set_admin(const Address& caller, const Address& new_admin) {
  pImpl->policy.set_admin(caller, new_admin);
  if (pImpl->journal) pImpl->journal->admin_changed(pImpl->policy.config());
}

void SettlementEngine::restore(const std::vector<Listing>& listings,
                               const std::vector<Order>& orders,
                               ListingId next_listing_id,
                               OrderId next_order_id) {
  if (pImpl->listings.size() != 0 || pImpl->orders.size() != 0) {
    throw std::logic_error("restore() on an engine that already holds state");
  }
  ListingId max_listing = 0;
  for (const auto& l : listings) {
    pImpl->listings.insert(l);
    max_listing = std::max(max_listing, l.listing_id);
  }
  // A Pending order on disk means the process stopped mid-settlement.
  OrderId max_order = 0;
  for (const auto& o : orders) {
    if (o.status == OrderStatus::Pending) {
      Order stale = o;
      stale.status = OrderStatus::Cancelled;
      pImpl->orders.restore(stale);
      if (pImpl->journal) pImpl->journal->order_saved(stale);
    } else {
      pImpl->orders.restore(o);
    }
    max_order = std::max(max_order, o.order_id);
  }
  pImpl->listing_seq.advance_to(std::max(next_listing_id, max_listing + 1));
  pImpl->order_seq.advance_to(std::max(next_order_id, max_order + 1));
}
