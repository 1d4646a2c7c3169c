#include <gtest/gtest.h>
#include "storage/storage.h"

#include <cstdio>
#include <limits>
#include <string>

namespace {

std::string temp_db_path() {
  return "/tmp/nft_market_storage_test.sqlite";
}

void remove_db(const std::string& path) {
  std::remove(path.c_str());
  std::remove((path + "-wal").c_str());
  std::remove((path + "-shm").c_str());
}

Listing sample_listing(ListingId id) {
  Listing l;
  l.listing_id     = id;
  l.item_id        = 100 + id;
  l.price          = 2;
  l.recorded_owner = "0x00000000000000000000000000000000000a11ce";
  l.item_registry  = "0x00000000000000000000000000000000000000e7";
  l.metadata_uri   = "ipfs://item";
  return l;
}

Order sample_order(OrderId id, ListingId listing) {
  Order o;
  o.order_id      = id;
  o.listing_id    = listing;
  o.item_id       = 100 + listing;
  o.price         = 2;
  o.platform_fee  = 1;
  o.seller_amount = 1;
  o.buyer         = "0x0000000000000000000000000000000000000b0b";
  o.seller        = "0x00000000000000000000000000000000000a11ce";
  o.created_at_ms = 1'700'000'000'000;
  o.status        = OrderStatus::Pending;
  return o;
}

MarketEvent sample_event(EventType type, ListingId listing, std::optional<OrderId> oid) {
  MarketEvent ev;
  ev.type       = type;
  ev.listing_id = listing;
  ev.order_id   = oid;
  ev.item_id    = 100 + listing;
  ev.seller     = "0x00000000000000000000000000000000000a11ce";
  ev.price      = 2;
  ev.at_ms      = 1'700'000'000'000;
  return ev;
}

} // namespace

struct StorageFixture : ::testing::Test {
  std::string db_path;

  void SetUp() override {
    db_path = temp_db_path();
    remove_db(db_path);
  }

  void TearDown() override { remove_db(db_path); }
};

TEST_F(StorageFixture, FreshDatabaseStartsSequencesAtOne) {
  Storage s(db_path);
  s.init();
  EXPECT_EQ(s.load_next_listing_seq(), 1u);
  EXPECT_EQ(s.load_next_order_seq(), 1u);
  EXPECT_TRUE(s.load_listings().empty());
  EXPECT_FALSE(s.load_admin_config().has_value());
}

TEST_F(StorageFixture, JournalSurvivesReopen) {
  {
    Storage s(db_path);
    s.init();
    s.listing_stored(sample_listing(1));
    s.listing_stored(sample_listing(2));
    s.listing_removed(1);

    Order o = sample_order(1, 1);
    s.order_saved(o);
    o.status = OrderStatus::Fulfilled;
    s.order_saved(o);

    AdminConfig cfg;
    cfg.admin = "0x000000000000000000000000000000000000ad00";
    cfg.fee_percent_bp = 250;
    cfg.minimum_fee = 7;
    s.admin_changed(cfg);
  }

  Storage s(db_path);
  s.init();
  auto listings = s.load_listings();
  ASSERT_EQ(listings.size(), 1u);
  EXPECT_EQ(listings[0], sample_listing(2));

  auto orders = s.load_orders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].status, OrderStatus::Fulfilled);
  EXPECT_EQ(orders[0].platform_fee, 1u);
  EXPECT_EQ(orders[0].buyer, "0x0000000000000000000000000000000000000b0b");
  EXPECT_EQ(orders[0].created_at_ms, 1'700'000'000'000);

  auto cfg = s.load_admin_config();
  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->fee_percent_bp, 250u);
  EXPECT_EQ(cfg->minimum_fee, 7u);

  EXPECT_EQ(s.load_next_order_seq(), 2u);
}

TEST_F(StorageFixture, RemovedListingIdsAreNotReused) {
  Storage s(db_path);
  s.init();
  s.listing_stored(sample_listing(4));
  s.event_emitted(sample_event(EventType::ListingCreated, 4, std::nullopt));
  s.listing_removed(4);
  EXPECT_TRUE(s.load_listings().empty());
  EXPECT_EQ(s.load_next_listing_seq(), 5u);
}

TEST_F(StorageFixture, DuplicateListingInsertFails) {
  Storage s(db_path);
  s.init();
  EXPECT_TRUE(s.insert_listing(sample_listing(1)));
  EXPECT_FALSE(s.insert_listing(sample_listing(1)));
  EXPECT_FALSE(s.delete_listing(9));
}

TEST_F(StorageFixture, FullRangeAmountsRoundTrip) {
  Storage s(db_path);
  s.init();
  Listing l = sample_listing(1);
  l.price = std::numeric_limits<Amount>::max();
  ASSERT_TRUE(s.insert_listing(l));
  EXPECT_EQ(s.load_listings().at(0).price, std::numeric_limits<Amount>::max());
}

TEST_F(StorageFixture, RecentEventsNewestFirst) {
  Storage s(db_path);
  s.init();
  s.event_emitted(sample_event(EventType::ListingCreated, 1, std::nullopt));
  s.event_emitted(sample_event(EventType::OrderPlaced, 1, 1));
  s.event_emitted(sample_event(EventType::ItemSold, 1, 1));

  auto all = s.recent_events(10);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].type, EventType::ItemSold);
  EXPECT_EQ(all[0].order_id, std::optional<OrderId>(1));
  EXPECT_EQ(all[2].type, EventType::ListingCreated);
  EXPECT_FALSE(all[2].order_id.has_value());

  EXPECT_EQ(s.recent_events(2).size(), 2u);
}

TEST_F(StorageFixture, UncommittedRequestLeavesNoRows) {
  Storage s(db_path);
  s.init();
  {
    Storage::RequestTxn txn(s);
    s.listing_removed(1);
    s.order_saved(sample_order(1, 1));
    s.event_emitted(sample_event(EventType::OrderPlaced, 1, 1));
    // dropped before commit(): the request never finished
  }
  EXPECT_TRUE(s.load_orders().empty());
  EXPECT_TRUE(s.recent_events(10).empty());

  // Row writes outside a request commit on their own again.
  s.order_saved(sample_order(2, 1));
  EXPECT_EQ(s.load_orders().size(), 1u);
}

TEST_F(StorageFixture, CommittedRequestKeepsFinalOrderState) {
  {
    Storage s(db_path);
    s.init();
    Storage::RequestTxn txn(s);
    Order o = sample_order(1, 1);
    s.order_saved(o);
    o.status = OrderStatus::Cancelled;
    s.order_saved(o);
    txn.commit();
  }

  Storage s(db_path);
  s.init();
  auto orders = s.load_orders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].status, OrderStatus::Cancelled);
}
