#pragma once
#include <cstdint>
#include "domain/address.hpp"
#include "domain/amount.hpp"

struct AdminConfig {
  Address  admin;
  uint32_t fee_percent_bp = 300;
  Amount   minimum_fee    = 1;
};
