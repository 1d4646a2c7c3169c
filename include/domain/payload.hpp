#pragma once
#include <string>
#include "domain/ids.hpp"

// Opaque bytes the ledger hands back verbatim on the settlement callback.
using Payload = std::string;

// 8-byte big-endian order id.
Payload encode_order_payload(OrderId oid);

// Throws MarketError(InvalidOrder) on malformed payloads.
OrderId decode_order_payload(const Payload& payload);
