#pragma once
#include "domain/admin_config.hpp"
#include "domain/event.hpp"
#include "domain/listing.hpp"
#include "domain/order.hpp"
#include "engine/journal.hpp"

#include <SQLiteCpp/SQLiteCpp.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Lightweight persistence layer backed by SQLite (via SQLiteCpp).
// Notes:
//  - Call init() once after construction to set pragmas and create tables.
//  - Row writes return bool on success; they never throw (exceptions are caught internally).
//  - Each write commits on its own unless a RequestTxn is open.
//  - As a MarketJournal it mirrors every engine mutation; failed writes are logged.
//  - Amounts are uint64 stored bit-for-bit in SQLite's signed INTEGER.
class Storage final : public MarketJournal {
public:
  // One SQLite transaction around every journal write of a single request.
  // Rolls back on destruction unless commit() was reached.
  class RequestTxn {
  public:
    explicit RequestTxn(Storage& storage);
    ~RequestTxn();

    RequestTxn(const RequestTxn&)            = delete;
    RequestTxn& operator=(const RequestTxn&) = delete;

    void commit();

  private:
    Storage&            storage_;
    SQLite::Transaction txn_;
  };

  // Opens (or creates) the database file.
  // Thread-safe mode: OPEN_FULLMUTEX; you should still serialize writes at the app level.
  explicit Storage(const std::string& db_path);

  // PRAGMAs + schema creation.
  void init();

  // Next free ids: one past the highest id ever seen (removed listings included).
  uint64_t load_next_listing_seq() const;
  uint64_t load_next_order_seq() const;

  std::vector<Listing> load_listings() const;
  std::vector<Order> load_orders() const;
  std::optional<AdminConfig> load_admin_config() const;

  // Newest first.
  std::vector<MarketEvent> recent_events(int limit) const;

  bool insert_listing(const Listing& l);
  bool delete_listing(ListingId id);
  bool upsert_order(const Order& o);
  bool save_admin_config(const AdminConfig& cfg);
  bool append_event(const MarketEvent& ev);

  // MarketJournal
  void listing_stored(const Listing& l) override;
  void listing_removed(ListingId id) override;
  void order_saved(const Order& o) override;
  void admin_changed(const AdminConfig& cfg) override;
  void event_emitted(const MarketEvent& ev) override;

private:
  // Listings, orders, events, admin DDL.
  void create_schema_();

  // Runs one row write in its own transaction, or inside the open RequestTxn.
  template <typename Fn>
  bool write_(Fn&& fn);

private:
  SQLite::Database db_;
  bool             in_request_ = false;
};
