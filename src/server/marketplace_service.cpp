#include "server/marketplace_service.hpp"

#include "engine/settlement_engine.hpp"
#include "server/market_host.hpp"
#include "server/proto_convert.hpp"
#include "storage/storage.h"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>

namespace {

constexpr int kDefaultEventLimit = 50;
constexpr int kMaxEventLimit     = 1000;

template <typename Resp>
void reject(Resp* resp, const MarketError& e) {
  resp->set_success(false);
  resp->set_error_message(e.what());
  resp->set_error_kind(to_proto(e.kind()));
}

void fill_fees(const SettlementEngine& engine, mkt::GetFeesResponse* out) {
  const auto& cfg = engine.admin_config();
  out->set_fee_percent_bp(cfg.fee_percent_bp);
  out->set_minimum_fee(cfg.minimum_fee);
  out->set_admin(cfg.admin);
}

// Runs one engine request with all of its journal writes in one SQLite
// transaction. Rejections commit too: the cancelled order they leave behind
// is part of the record. Anything else rolls the request back.
template <typename Fn>
void in_request_txn(Storage& storage, Fn&& fn) {
  Storage::RequestTxn txn(storage);
  try {
    fn();
  } catch (const MarketError&) {
    txn.commit();
    throw;
  }
  txn.commit();
}

int64_t elapsed_us(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - t0).count();
}

} // namespace

MarketplaceServiceImpl::MarketplaceServiceImpl(MarketHost& host) : host_(host) {}

// RPC: List(ListRequest) -> ListResponse
grpc::Status MarketplaceServiceImpl::List(grpc::ServerContext* ctx,
                                          const mkt::ListRequest* req,
                                          mkt::ListResponse* resp) {
  const auto t0   = std::chrono::steady_clock::now();
  const auto peer = ctx ? ctx->peer() : "unknown";

  // --- log ----------------------------------------------------------------
  std::cout << "[SERVER] [List] ================================================================= New Listing\n"
            << " peer="     << peer
            << " caller="   << req->caller()
            << " registry=" << req->registry()
            << " item_id="  << req->item_id()
            << " price="    << req->price()
            << std::endl;

  // --- engine -------------------------------------------------------------
  std::lock_guard<std::mutex> lk(host_.request_mutex()); // one request at a time
  try {
    ListingId id = 0;
    in_request_txn(host_.storage(), [&] {
      id = host_.engine().list(req->caller(), req->item_id(), req->price(),
                               req->registry(), req->metadata_uri());
    });
    resp->set_success(true);
    resp->set_listing_id(id);
    std::cout << "[SERVER] [List][ok] listing_id=" << id << " stored\n";
  } catch (const MarketError& e) {
    reject(resp, e);
    std::cerr << "[SERVER] [List][reject] kind=" << to_string(e.kind()) << " " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] [List][error] internal: " << e.what() << "\n";
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }

  std::cout << "[SERVER] [List] done in " << elapsed_us(t0) << "us\n";
  return grpc::Status::OK;
}

// RPC: Buy(BuyRequest) -> BuyResponse
grpc::Status MarketplaceServiceImpl::Buy(grpc::ServerContext* ctx,
                                         const mkt::BuyRequest* req,
                                         mkt::BuyResponse* resp) {
  const auto t0   = std::chrono::steady_clock::now();
  const auto peer = ctx ? ctx->peer() : "unknown";

  std::cout << "[SERVER] [Buy] ================================================================= New Order\n"
            << " peer="       << peer
            << " caller="     << req->caller()
            << " listing_id=" << req->listing_id()
            << std::endl;

  resp->set_listing_id(req->listing_id());
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  auto& engine = host_.engine();
  try {
    OrderId oid = 0;
    in_request_txn(host_.storage(), [&] { oid = engine.buy(req->caller(), req->listing_id()); });
    const auto order  = engine.order_info(oid);

    resp->set_success(true);
    resp->set_order_id(oid);
    if (order) resp->set_status(to_proto(order->status));

    if (order && order->status == OrderStatus::Fulfilled) {
      std::cout << "[SERVER] [Buy][ok] oid=" << oid << " fulfilled fee=" << order->platform_fee
                << " seller_amount=" << order->seller_amount << "\n";
    } else {
      // Fee leg landed but settlement stopped (item moved under the listing).
      std::cerr << "[SERVER] [Buy][warn] oid=" << oid << " status="
                << (order ? to_string(order->status) : "MISSING") << "\n";
    }
  } catch (const MarketError& e) {
    reject(resp, e);
    if (e.order_id()) {
      resp->set_order_id(*e.order_id());
      if (auto order = engine.order_info(*e.order_id())) resp->set_status(to_proto(order->status));
    }
    std::cerr << "[SERVER] [Buy][reject] kind=" << to_string(e.kind()) << " " << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] [Buy][error] internal: " << e.what() << "\n";
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }

  std::cout << "[SERVER] [Buy] listing_id=" << req->listing_id() << " done in " << elapsed_us(t0) << "us\n";
  return grpc::Status::OK;
}

grpc::Status MarketplaceServiceImpl::NftInfo(grpc::ServerContext*,
                                             const mkt::NftInfoRequest* req,
                                             mkt::NftInfoResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  if (auto l = host_.engine().nft_info(req->listing_id())) {
    resp->set_found(true);
    to_proto(*l, resp->mutable_listing());
  }
  return grpc::Status::OK;
}

grpc::Status MarketplaceServiceImpl::OrderInfo(grpc::ServerContext*,
                                               const mkt::OrderInfoRequest* req,
                                               mkt::OrderInfoResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  if (auto o = host_.engine().order_info(req->order_id())) {
    resp->set_found(true);
    to_proto(*o, resp->mutable_order());
  }
  return grpc::Status::OK;
}

grpc::Status MarketplaceServiceImpl::GetFees(grpc::ServerContext*,
                                             const mkt::GetFeesRequest*,
                                             mkt::GetFeesResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  fill_fees(host_.engine(), resp);
  return grpc::Status::OK;
}

// --- admin ----------------------------------------------------------------
grpc::Status MarketplaceServiceImpl::ChangeFeePercent(grpc::ServerContext*,
                                                      const mkt::ChangeFeePercentRequest* req,
                                                      mkt::AdminResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  try {
    in_request_txn(host_.storage(), [&] { host_.engine().change_fee_percent(req->caller(), req->fee_percent_bp()); });
    resp->set_success(true);
    std::cout << "[SERVER] [ChangeFeePercent][ok] fee_percent_bp=" << req->fee_percent_bp() << "\n";
  } catch (const MarketError& e) {
    reject(resp, e);
    std::cerr << "[SERVER] [ChangeFeePercent][reject] kind=" << to_string(e.kind()) << " caller=" << req->caller() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] [ChangeFeePercent][error] internal: " << e.what() << "\n";
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
  fill_fees(host_.engine(), resp->mutable_fees());
  return grpc::Status::OK;
}

grpc::Status MarketplaceServiceImpl::ChangeMinimumFee(grpc::ServerContext*,
                                                      const mkt::ChangeMinimumFeeRequest* req,
                                                      mkt::AdminResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  try {
    in_request_txn(host_.storage(), [&] { host_.engine().change_minimum_fee(req->caller(), req->minimum_fee()); });
    resp->set_success(true);
    std::cout << "[SERVER] [ChangeMinimumFee][ok] minimum_fee=" << req->minimum_fee() << "\n";
  } catch (const MarketError& e) {
    reject(resp, e);
    std::cerr << "[SERVER] [ChangeMinimumFee][reject] kind=" << to_string(e.kind()) << " caller=" << req->caller() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] [ChangeMinimumFee][error] internal: " << e.what() << "\n";
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
  fill_fees(host_.engine(), resp->mutable_fees());
  return grpc::Status::OK;
}

grpc::Status MarketplaceServiceImpl::SetAdmin(grpc::ServerContext*,
                                              const mkt::SetAdminRequest* req,
                                              mkt::AdminResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  try {
    in_request_txn(host_.storage(), [&] { host_.engine().set_admin(req->caller(), req->new_admin()); });
    resp->set_success(true);
    std::cout << "[SERVER] [SetAdmin][ok] admin=" << host_.engine().admin_config().admin << "\n";
  } catch (const MarketError& e) {
    reject(resp, e);
    std::cerr << "[SERVER] [SetAdmin][reject] kind=" << to_string(e.kind()) << " caller=" << req->caller() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] [SetAdmin][error] internal: " << e.what() << "\n";
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
  fill_fees(host_.engine(), resp->mutable_fees());
  return grpc::Status::OK;
}

grpc::Status MarketplaceServiceImpl::RecentEvents(grpc::ServerContext*,
                                                  const mkt::RecentEventsRequest* req,
                                                  mkt::RecentEventsResponse* resp) {
  int limit = req->limit() > 0 ? req->limit() : kDefaultEventLimit;
  if (limit > kMaxEventLimit) limit = kMaxEventLimit;

  std::lock_guard<std::mutex> lk(host_.request_mutex());
  for (const auto& ev : host_.storage().recent_events(limit)) {
    to_proto(ev, resp->add_events());
  }
  return grpc::Status::OK;
}
