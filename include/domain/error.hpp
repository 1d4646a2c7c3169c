#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include "domain/ids.hpp"

enum class ErrorKind {
  // validation
  InvalidRegistry,
  InvalidPrice,
  InvalidFee,
  InvalidAddress,
  SameParty,
  // authorization
  NotAuthorized,
  NotAdmin,
  Unauthorized,
  // consistency
  InvalidListing,
  ItemNotFound,
  ItemNoLongerExists,
  OwnershipChanged,
  InvalidOrder,
  // insufficiency
  InsufficientAllowance,
  InsufficientBalance,
  // external failures
  ExternalRevert,
  ArithmeticFault,
  ExternalFailure,
};

const char* to_string(ErrorKind k);

// Every engine rejection. Carries the ids involved so callers can trace
// which listing / order the failure belongs to.
class MarketError : public std::runtime_error {
public:
  MarketError(ErrorKind kind,
              std::string detail,
              std::optional<ListingId> listing_id = std::nullopt,
              std::optional<OrderId> order_id = std::nullopt,
              std::string external_reason = {});

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& detail() const noexcept { return detail_; }
  const std::optional<ListingId>& listing_id() const noexcept { return listing_id_; }
  const std::optional<OrderId>& order_id() const noexcept { return order_id_; }
  const std::string& external_reason() const noexcept { return external_reason_; }

  // Copy of this error with the order id filled in (kept if already set).
  MarketError with_order(OrderId oid) const;

private:
  ErrorKind                kind_;
  std::string              detail_;
  std::optional<ListingId> listing_id_;
  std::optional<OrderId>   order_id_;
  std::string              external_reason_;
};
