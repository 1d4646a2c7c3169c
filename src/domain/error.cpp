#include "domain/error.hpp"
#include <sstream>

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::InvalidRegistry:       return "INVALID_REGISTRY";
    case ErrorKind::InvalidPrice:          return "INVALID_PRICE";
    case ErrorKind::InvalidFee:            return "INVALID_FEE";
    case ErrorKind::InvalidAddress:        return "INVALID_ADDRESS";
    case ErrorKind::SameParty:             return "SAME_PARTY";
    case ErrorKind::NotAuthorized:         return "NOT_AUTHORIZED";
    case ErrorKind::NotAdmin:              return "NOT_ADMIN";
    case ErrorKind::Unauthorized:          return "UNAUTHORIZED";
    case ErrorKind::InvalidListing:        return "INVALID_LISTING";
    case ErrorKind::ItemNotFound:          return "ITEM_NOT_FOUND";
    case ErrorKind::ItemNoLongerExists:    return "ITEM_NO_LONGER_EXISTS";
    case ErrorKind::OwnershipChanged:      return "OWNERSHIP_CHANGED";
    case ErrorKind::InvalidOrder:          return "INVALID_ORDER";
    case ErrorKind::InsufficientAllowance: return "INSUFFICIENT_ALLOWANCE";
    case ErrorKind::InsufficientBalance:   return "INSUFFICIENT_BALANCE";
    case ErrorKind::ExternalRevert:        return "EXTERNAL_REVERT";
    case ErrorKind::ArithmeticFault:       return "ARITHMETIC_FAULT";
    case ErrorKind::ExternalFailure:       return "EXTERNAL_FAILURE";
  }
  return "UNKNOWN";
}

namespace {

std::string compose(ErrorKind kind,
                    const std::string& detail,
                    const std::optional<ListingId>& listing_id,
                    const std::optional<OrderId>& order_id,
                    const std::string& reason) {
  std::ostringstream os;
  os << to_string(kind) << ": " << detail;
  if (listing_id) os << " listing=" << *listing_id;
  if (order_id)   os << " order=" << *order_id;
  if (!reason.empty()) os << " reason=\"" << reason << "\"";
  return os.str();
}

} // namespace

MarketError::MarketError(ErrorKind kind,
                         std::string detail,
                         std::optional<ListingId> listing_id,
                         std::optional<OrderId> order_id,
                         std::string external_reason)
  : std::runtime_error(compose(kind, detail, listing_id, order_id, external_reason)),
    kind_(kind),
    detail_(std::move(detail)),
    listing_id_(listing_id),
    order_id_(order_id),
    external_reason_(std::move(external_reason)) {}

MarketError MarketError::with_order(OrderId oid) const {
  if (order_id_) return *this;
  return MarketError(kind_, detail_, listing_id_, oid, external_reason_);
}
