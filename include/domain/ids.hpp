#pragma once
#include <cstdint>

using ListingId = uint64_t;
using OrderId   = uint64_t;
using ItemId    = uint64_t;
