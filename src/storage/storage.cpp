#include "storage/storage.h"

#include <iostream>
#include <stdexcept>

namespace {

int64_t to_db(uint64_t v) { return static_cast<int64_t>(v); }
uint64_t from_db(const SQLite::Column& c) { return static_cast<uint64_t>(c.getInt64()); }

Listing read_listing(SQLite::Statement& q) {
  Listing l;
  l.listing_id     = from_db(q.getColumn(0));
  l.item_id        = from_db(q.getColumn(1));
  l.price          = from_db(q.getColumn(2));
  l.recorded_owner = q.getColumn(3).getString();
  l.item_registry  = q.getColumn(4).getString();
  l.metadata_uri   = q.getColumn(5).getString();
  return l;
}

Order read_order(SQLite::Statement& q) {
  Order o;
  o.order_id      = from_db(q.getColumn(0));
  o.listing_id    = from_db(q.getColumn(1));
  o.item_id       = from_db(q.getColumn(2));
  o.price         = from_db(q.getColumn(3));
  o.platform_fee  = from_db(q.getColumn(4));
  o.seller_amount = from_db(q.getColumn(5));
  o.buyer         = q.getColumn(6).getString();
  o.seller        = q.getColumn(7).getString();
  o.created_at_ms = q.getColumn(8).getInt64();
  o.status        = static_cast<OrderStatus>(q.getColumn(9).getInt());
  return o;
}

} // namespace

// -------------------- ctor / init --------------------
Storage::Storage(const std::string& db_path)
  : db_(db_path.c_str(),
        SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE | SQLite::OPEN_FULLMUTEX)
{
  // Simple contention handling for brief write-lock situations
  db_.setBusyTimeout(5000); // ms
}

void Storage::init() {
  db_.exec("PRAGMA journal_mode=WAL;");
  db_.exec("PRAGMA synchronous=NORMAL;");
  db_.exec("PRAGMA foreign_keys=ON;");
  create_schema_();
}

void Storage::create_schema_() {
  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS listings (
  listing_id          INTEGER PRIMARY KEY,
  item_id             INTEGER NOT NULL,
  price               INTEGER NOT NULL,
  recorded_owner      TEXT NOT NULL,
  item_registry       TEXT NOT NULL,
  metadata_uri        TEXT NOT NULL
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS orders (
  order_id            INTEGER PRIMARY KEY,
  listing_id          INTEGER NOT NULL,
  item_id             INTEGER NOT NULL,
  price               INTEGER NOT NULL,
  platform_fee        INTEGER NOT NULL,
  seller_amount       INTEGER NOT NULL,
  buyer               TEXT NOT NULL,
  seller              TEXT NOT NULL,
  created_ts          INTEGER NOT NULL,        -- epoch ms
  status              INTEGER NOT NULL         -- 0 PENDING, 1 FULFILLED, 2 CANCELLED
    CHECK (status IN (0,1,2))
);
)SQL");

  db_.exec(R"SQL(
CREATE INDEX IF NOT EXISTS idx_orders_listing
  ON orders(listing_id);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS events (
  id                  INTEGER PRIMARY KEY AUTOINCREMENT,
  type                INTEGER NOT NULL,
  listing_id          INTEGER NOT NULL,
  order_id            INTEGER,                 -- nullable
  item_id             INTEGER NOT NULL,
  item_registry       TEXT NOT NULL,
  seller              TEXT NOT NULL,
  buyer               TEXT NOT NULL,
  price               INTEGER NOT NULL,
  event_ts            INTEGER NOT NULL         -- epoch ms
);
)SQL");

  db_.exec(R"SQL(
CREATE TABLE IF NOT EXISTS admin_config (
  id                  INTEGER PRIMARY KEY CHECK (id = 1),
  admin               TEXT NOT NULL,
  fee_percent_bp      INTEGER NOT NULL,
  minimum_fee         INTEGER NOT NULL
);
)SQL");
}

// -------------------- request scope --------------------
Storage::RequestTxn::RequestTxn(Storage& storage) : storage_(storage), txn_(storage.db_) {
  storage_.in_request_ = true;
}

Storage::RequestTxn::~RequestTxn() {
  storage_.in_request_ = false;   // txn_ rolls back after this if not committed
}

void Storage::RequestTxn::commit() {
  txn_.commit();
  storage_.in_request_ = false;
}

template <typename Fn>
bool Storage::write_(Fn&& fn)
{
  try {
    if (in_request_) {
      fn();
      return true;
    }
    SQLite::Transaction txn(db_);
    fn();
    txn.commit();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[STORAGE][error] " << e.what() << "\n";
    return false;
  }
}

// -------------------- writes --------------------
bool Storage::insert_listing(const Listing& l)
{
  return write_([&] {
    SQLite::Statement stmt(db_,
      "INSERT INTO listings(listing_id, item_id, price, recorded_owner, item_registry, metadata_uri) "
      "VALUES (?,?,?,?,?,?)");
    stmt.bind(1, to_db(l.listing_id));
    stmt.bind(2, to_db(l.item_id));
    stmt.bind(3, to_db(l.price));
    stmt.bind(4, l.recorded_owner);
    stmt.bind(5, l.item_registry);
    stmt.bind(6, l.metadata_uri);
    stmt.exec();
  });
}

bool Storage::delete_listing(ListingId id)
{
  return write_([&] {
    SQLite::Statement stmt(db_, "DELETE FROM listings WHERE listing_id=?");
    stmt.bind(1, to_db(id));
    if (stmt.exec() != 1) throw std::runtime_error("no such listing");
  });
}

bool Storage::upsert_order(const Order& o)
{
  return write_([&] {
    SQLite::Statement stmt(db_,
      "INSERT INTO orders(order_id, listing_id, item_id, price, platform_fee, seller_amount, "
      "                   buyer, seller, created_ts, status) "
      "VALUES (?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(order_id) DO UPDATE SET status=excluded.status");
    stmt.bind(1,  to_db(o.order_id));
    stmt.bind(2,  to_db(o.listing_id));
    stmt.bind(3,  to_db(o.item_id));
    stmt.bind(4,  to_db(o.price));
    stmt.bind(5,  to_db(o.platform_fee));
    stmt.bind(6,  to_db(o.seller_amount));
    stmt.bind(7,  o.buyer);
    stmt.bind(8,  o.seller);
    stmt.bind(9,  static_cast<int64_t>(o.created_at_ms));
    stmt.bind(10, static_cast<int>(o.status));
    stmt.exec();
  });
}

bool Storage::save_admin_config(const AdminConfig& cfg)
{
  return write_([&] {
    SQLite::Statement stmt(db_,
      "INSERT INTO admin_config(id, admin, fee_percent_bp, minimum_fee) VALUES (1,?,?,?) "
      "ON CONFLICT(id) DO UPDATE SET admin=excluded.admin, "
      "  fee_percent_bp=excluded.fee_percent_bp, minimum_fee=excluded.minimum_fee");
    stmt.bind(1, cfg.admin);
    stmt.bind(2, static_cast<int64_t>(cfg.fee_percent_bp));
    stmt.bind(3, to_db(cfg.minimum_fee));
    stmt.exec();
  });
}

bool Storage::append_event(const MarketEvent& ev)
{
  return write_([&] {
    SQLite::Statement stmt(db_,
      "INSERT INTO events(type, listing_id, order_id, item_id, item_registry, seller, buyer, price, event_ts) "
      "VALUES (?,?,?,?,?,?,?,?,?)");
    stmt.bind(1, static_cast<int>(ev.type));
    stmt.bind(2, to_db(ev.listing_id));
    if (ev.order_id.has_value())
      stmt.bind(3, to_db(*ev.order_id));
    else
      stmt.bind(3); // NULL
    stmt.bind(4, to_db(ev.item_id));
    stmt.bind(5, ev.item_registry);
    stmt.bind(6, ev.seller);
    stmt.bind(7, ev.buyer);
    stmt.bind(8, to_db(ev.price));
    stmt.bind(9, static_cast<int64_t>(ev.at_ms));
    stmt.exec();
  });
}

// -------------------- journal --------------------
void Storage::listing_stored(const Listing& l) {
  if (!insert_listing(l))
    std::cerr << "[STORAGE][error] insert_listing failed listing_id=" << l.listing_id << "\n";
}

void Storage::listing_removed(ListingId id) {
  if (!delete_listing(id))
    std::cerr << "[STORAGE][error] delete_listing failed listing_id=" << id << "\n";
}

void Storage::order_saved(const Order& o) {
  if (!upsert_order(o))
    std::cerr << "[STORAGE][error] upsert_order failed order_id=" << o.order_id
              << " status=" << to_string(o.status) << "\n";
}

void Storage::admin_changed(const AdminConfig& cfg) {
  if (!save_admin_config(cfg))
    std::cerr << "[STORAGE][error] save_admin_config failed admin=" << cfg.admin << "\n";
}

void Storage::event_emitted(const MarketEvent& ev) {
  if (!append_event(ev))
    std::cerr << "[STORAGE][error] append_event failed type=" << to_string(ev.type)
              << " listing_id=" << ev.listing_id << "\n";
}

// -------------------- reads --------------------
uint64_t Storage::load_next_listing_seq() const
{
  // Removed listings only survive in the event log.
  SQLite::Statement q(db_,
    "SELECT MAX(COALESCE((SELECT MAX(listing_id) FROM listings), 0), "
    "           COALESCE((SELECT MAX(listing_id) FROM events), 0)) + 1");
  q.executeStep();
  return from_db(q.getColumn(0));
}

uint64_t Storage::load_next_order_seq() const
{
  SQLite::Statement q(db_, "SELECT COALESCE(MAX(order_id), 0) + 1 FROM orders");
  q.executeStep();
  return from_db(q.getColumn(0));
}

std::vector<Listing> Storage::load_listings() const
{
  std::vector<Listing> out;
  SQLite::Statement q(db_,
    "SELECT listing_id, item_id, price, recorded_owner, item_registry, metadata_uri "
    "FROM listings ORDER BY listing_id");
  while (q.executeStep()) out.push_back(read_listing(q));
  return out;
}

std::vector<Order> Storage::load_orders() const
{
  std::vector<Order> out;
  SQLite::Statement q(db_,
    "SELECT order_id, listing_id, item_id, price, platform_fee, seller_amount, "
    "       buyer, seller, created_ts, status "
    "FROM orders ORDER BY order_id");
  while (q.executeStep()) out.push_back(read_order(q));
  return out;
}

std::optional<AdminConfig> Storage::load_admin_config() const
{
  SQLite::Statement q(db_, "SELECT admin, fee_percent_bp, minimum_fee FROM admin_config WHERE id=1");
  if (!q.executeStep()) return std::nullopt;
  AdminConfig cfg;
  cfg.admin          = q.getColumn(0).getString();
  cfg.fee_percent_bp = static_cast<uint32_t>(q.getColumn(1).getInt64());
  cfg.minimum_fee    = from_db(q.getColumn(2));
  return cfg;
}

std::vector<MarketEvent> Storage::recent_events(int limit) const
{
  std::vector<MarketEvent> out;
  try {
    SQLite::Statement q(db_,
      "SELECT type, listing_id, order_id, item_id, item_registry, seller, buyer, price, event_ts "
      "FROM events ORDER BY id DESC LIMIT ?");
    q.bind(1, limit);
    while (q.executeStep()) {
      MarketEvent ev;
      ev.type          = static_cast<EventType>(q.getColumn(0).getInt());
      ev.listing_id    = from_db(q.getColumn(1));
      const auto oid   = q.getColumn(2);
      if (!oid.isNull()) ev.order_id = from_db(oid);
      ev.item_id       = from_db(q.getColumn(3));
      ev.item_registry = q.getColumn(4).getString();
      ev.seller        = q.getColumn(5).getString();
      ev.buyer         = q.getColumn(6).getString();
      ev.price         = from_db(q.getColumn(7));
      ev.at_ms         = q.getColumn(8).getInt64();
      out.push_back(std::move(ev));
    }
  } catch (const std::exception& e) {
    std::cerr << "[STORAGE][error] recent_events failed: " << e.what() << "\n";
  }
  return out;
}
