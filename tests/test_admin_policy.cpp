#include <gtest/gtest.h>
#include "domain/error.hpp"
#include "engine/admin_policy.hpp"

#include <functional>

namespace {

const Address kAdmin = "0x000000000000000000000000000000000000ad00";
const Address kEve   = "0x0000000000000000000000000000000000000e0e";

AdminConfig seed() {
  AdminConfig cfg;
  cfg.admin = kAdmin;
  cfg.fee_percent_bp = 300;
  cfg.minimum_fee = 1;
  return cfg;
}

ErrorKind kind_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const MarketError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected MarketError";
  return ErrorKind::ExternalFailure;
}

} // namespace

TEST(AdminPolicy, AdminChangesFees) {
  AdminPolicy policy(seed());
  policy.change_fee_percent(kAdmin, 250);
  policy.change_minimum_fee(kAdmin, 5);
  EXPECT_EQ(policy.fee_percent(), 250u);
  EXPECT_EQ(policy.minimum_fee(), 5u);
}

TEST(AdminPolicy, CallerMatchIsCaseInsensitive) {
  AdminPolicy policy(seed());
  policy.change_minimum_fee("0x000000000000000000000000000000000000AD00", 9);
  EXPECT_EQ(policy.minimum_fee(), 9u);
}

TEST(AdminPolicy, NonAdminIsRejected) {
  AdminPolicy policy(seed());
  EXPECT_EQ(kind_of([&] { policy.change_fee_percent(kEve, 0); }), ErrorKind::NotAdmin);
  EXPECT_EQ(kind_of([&] { policy.change_minimum_fee(kEve, 0); }), ErrorKind::NotAdmin);
  EXPECT_EQ(kind_of([&] { policy.set_admin(kEve, kEve); }), ErrorKind::NotAdmin);
  EXPECT_EQ(policy.fee_percent(), 300u);
  EXPECT_EQ(policy.admin(), kAdmin);
}

TEST(AdminPolicy, AdminRoleCanBeHandedOver) {
  AdminPolicy policy(seed());
  policy.set_admin(kAdmin, kEve);
  EXPECT_EQ(policy.admin(), kEve);
  EXPECT_EQ(kind_of([&] { policy.change_minimum_fee(kAdmin, 3); }), ErrorKind::NotAdmin);
  policy.change_minimum_fee(kEve, 3);
  EXPECT_EQ(policy.minimum_fee(), 3u);
}

TEST(AdminPolicy, RejectsBadValues) {
  AdminPolicy policy(seed());
  EXPECT_EQ(kind_of([&] { policy.change_fee_percent(kAdmin, 10001); }), ErrorKind::InvalidFee);
  EXPECT_EQ(kind_of([&] { policy.set_admin(kAdmin, kZeroAddress); }), ErrorKind::InvalidAddress);

  AdminConfig bad = seed();
  bad.admin.clear();
  EXPECT_EQ(kind_of([&] { AdminPolicy p(bad); }), ErrorKind::InvalidAddress);
}
