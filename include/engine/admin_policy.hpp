#pragma once
#include "domain/admin_config.hpp"

// Fee configuration guarded by a single admin identity. Changes apply to
// later listings and orders only; fees already quoted into an order stay.
class AdminPolicy {
public:
  // Throws MarketError(InvalidAddress / InvalidFee) on a bad seed config.
  explicit AdminPolicy(AdminConfig config);

  const AdminConfig& config() const { return config_; }
  const Address& admin() const { return config_.admin; }
  uint32_t fee_percent() const { return config_.fee_percent_bp; }
  Amount minimum_fee() const { return config_.minimum_fee; }

  void change_fee_percent(const Address& caller, uint32_t fee_percent_bp);
  void change_minimum_fee(const Address& caller, Amount minimum_fee);
  void set_admin(const Address& caller, const Address& new_admin);

private:
  void require_admin_(const Address& caller) const;

  AdminConfig config_;
};
