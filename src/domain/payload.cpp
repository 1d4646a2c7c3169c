#include "domain/payload.hpp"
#include "domain/error.hpp"

namespace {
constexpr size_t kOrderPayloadSize = 8;
}

Payload encode_order_payload(OrderId oid) {
  Payload out(kOrderPayloadSize, '\0');
  for (size_t i = 0; i < kOrderPayloadSize; ++i) {
    out[kOrderPayloadSize - 1 - i] = static_cast<char>((oid >> (8 * i)) & 0xFF);
  }
  return out;
}

OrderId decode_order_payload(const Payload& payload) {
  if (payload.size() != kOrderPayloadSize) {
    throw MarketError(ErrorKind::InvalidOrder,
                      "malformed settlement payload (size=" + std::to_string(payload.size()) + ")");
  }
  OrderId oid = 0;
  for (unsigned char b : payload) oid = (oid << 8) | b;
  return oid;
}
