#include <gtest/gtest.h>
#include "domain/error.hpp"
#include "domain/payload.hpp"

TEST(OrderPayload, BigEndianLayout) {
  const Payload p = encode_order_payload(0x0102030405060708ULL);
  ASSERT_EQ(p.size(), 8u);
  EXPECT_EQ(static_cast<unsigned char>(p[0]), 0x01);
  EXPECT_EQ(static_cast<unsigned char>(p[7]), 0x08);
  EXPECT_EQ(decode_order_payload(p), 0x0102030405060708ULL);
}

TEST(OrderPayload, HighBitsSurvive) {
  EXPECT_EQ(decode_order_payload(encode_order_payload(~0ULL)), ~0ULL);
}

TEST(OrderPayload, MalformedIsInvalidOrder) {
  try {
    decode_order_payload(std::string("abc"));
    FAIL() << "expected MarketError";
  } catch (const MarketError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidOrder);
  }
  EXPECT_THROW(decode_order_payload(Payload()), MarketError);
}

TEST(MarketErrorText, CarriesIdsAndReason) {
  MarketError e(ErrorKind::ExternalRevert, "price transfer failed", 4, 9, "insufficient allowance");
  const std::string what = e.what();
  EXPECT_NE(what.find("EXTERNAL_REVERT"), std::string::npos);
  EXPECT_NE(what.find("listing=4"), std::string::npos);
  EXPECT_NE(what.find("order=9"), std::string::npos);
  EXPECT_NE(what.find("insufficient allowance"), std::string::npos);
}

TEST(MarketErrorText, WithOrderKeepsExistingId) {
  MarketError e(ErrorKind::InvalidPrice, "x", 1);
  EXPECT_EQ(e.with_order(5).order_id(), std::optional<OrderId>(5));
  EXPECT_EQ(e.with_order(5).with_order(6).order_id(), std::optional<OrderId>(5));
  EXPECT_EQ(e.with_order(5).listing_id(), std::optional<ListingId>(1));
}
