#include "engine/admin_policy.hpp"
#include "domain/error.hpp"

#include <string>

namespace {

void validate_fee_percent(uint32_t bp) {
  if (bp > kBasisPointsDenominator) {
    throw MarketError(ErrorKind::InvalidFee,
                      "fee percent must be <= " + std::to_string(kBasisPointsDenominator) +
                      "bp, got " + std::to_string(bp));
  }
}

Address validated_admin(const Address& a) {
  Address admin = normalize_address(a);
  if (is_null_address(admin)) throw MarketError(ErrorKind::InvalidAddress, "admin cannot be the null address");
  return admin;
}

} // namespace

AdminPolicy::AdminPolicy(AdminConfig config) : config_(std::move(config)) {
  config_.admin = validated_admin(config_.admin);
  validate_fee_percent(config_.fee_percent_bp);
}

void AdminPolicy::require_admin_(const Address& caller) const {
  if (normalize_address(caller) != config_.admin) {
    throw MarketError(ErrorKind::NotAdmin, "caller " + caller + " is not the admin");
  }
}

void AdminPolicy::change_fee_percent(const Address& caller, uint32_t fee_percent_bp) {
  require_admin_(caller);
  validate_fee_percent(fee_percent_bp);
  config_.fee_percent_bp = fee_percent_bp;
}

void AdminPolicy::change_minimum_fee(const Address& caller, Amount minimum_fee) {
  require_admin_(caller);
  config_.minimum_fee = minimum_fee;
}

void AdminPolicy::set_admin(const Address& caller, const Address& new_admin) {
  require_admin_(caller);
  config_.admin = validated_admin(new_admin);
}
