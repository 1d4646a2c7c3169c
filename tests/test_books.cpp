#include <gtest/gtest.h>
#include "engine/listing_registry.hpp"
#include "engine/order_book.hpp"
#include "engine/sequence.hpp"

#include <stdexcept>
#include <string>

namespace {

Listing make_listing(ListingId id) {
  Listing l;
  l.listing_id     = id;
  l.item_id        = 100 + id;
  l.price          = 10;
  l.recorded_owner = "0xa11ce";
  l.item_registry  = "0xe7";
  l.metadata_uri   = "ipfs://" + std::to_string(id);
  return l;
}

Order make_order(OrderId id, OrderStatus status = OrderStatus::Pending) {
  Order o;
  o.order_id = id;
  o.listing_id = 1;
  o.price = 10;
  o.platform_fee = 1;
  o.seller_amount = 9;
  o.buyer = "0xb0b";
  o.seller = "0xa11ce";
  o.status = status;
  return o;
}

} // namespace

TEST(SequenceAllocator, StartsAtOneAndIsMonotonic) {
  SequenceAllocator seq;
  EXPECT_EQ(seq.allocate(), 1u);
  EXPECT_EQ(seq.allocate(), 2u);
  seq.advance_to(3);
  EXPECT_EQ(seq.allocate(), 3u);
  seq.advance_to(10);
  EXPECT_EQ(seq.allocate(), 10u);
  EXPECT_THROW(seq.advance_to(5), std::logic_error);
}

TEST(ListingRegistry, InsertFindRemove) {
  ListingRegistry reg;
  reg.insert(make_listing(1));
  reg.insert(make_listing(2));
  ASSERT_NE(reg.find(1), nullptr);
  EXPECT_EQ(*reg.find(2), make_listing(2));
  EXPECT_EQ(reg.size(), 2u);

  EXPECT_TRUE(reg.remove(1));
  EXPECT_FALSE(reg.remove(1));
  EXPECT_EQ(reg.find(1), nullptr);
  EXPECT_EQ(reg.size(), 1u);
}

TEST(ListingRegistry, DuplicateIdIsALogicError) {
  ListingRegistry reg;
  reg.insert(make_listing(1));
  EXPECT_THROW(reg.insert(make_listing(1)), std::logic_error);
}

TEST(OrderBook, PendingToFulfilledIsFinal) {
  OrderBook book;
  book.insert(make_order(1));
  const Order* o = book.fulfil(1);
  ASSERT_NE(o, nullptr);
  EXPECT_EQ(o->status, OrderStatus::Fulfilled);

  EXPECT_EQ(book.cancel(1), nullptr);
  EXPECT_EQ(book.fulfil(1), nullptr);
  EXPECT_EQ(book.find(1)->status, OrderStatus::Fulfilled);
}

TEST(OrderBook, CancelledNeverComesBack) {
  OrderBook book;
  book.insert(make_order(7));
  ASSERT_NE(book.cancel(7), nullptr);
  EXPECT_EQ(book.fulfil(7), nullptr);
  EXPECT_EQ(book.find(7)->status, OrderStatus::Cancelled);
  EXPECT_EQ(book.size(), 1u);
}

TEST(OrderBook, UnknownOrderTransitionsAreNoOps) {
  OrderBook book;
  EXPECT_EQ(book.cancel(42), nullptr);
  EXPECT_EQ(book.fulfil(42), nullptr);
}

TEST(OrderBook, NewOrdersMustBePending) {
  OrderBook book;
  EXPECT_THROW(book.insert(make_order(1, OrderStatus::Fulfilled)), std::logic_error);
  book.restore(make_order(1, OrderStatus::Fulfilled));   // rehydration keeps any state
  EXPECT_THROW(book.insert(make_order(1)), std::logic_error);
}
