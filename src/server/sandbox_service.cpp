#include "server/sandbox_service.hpp"

#include "external/external_error.hpp"
#include "external/in_memory_item_registry.hpp"
#include "external/in_memory_ledger.hpp"
#include "server/market_host.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

// Runs one sandbox mutation and reports the collaborator's own failure text.
grpc::Status run_sandbox_call(const char* rpc, mkt::SandboxResponse* resp, const std::function<void()>& fn) {
  try {
    fn();
    resp->set_success(true);
  } catch (const ExternalCallError& e) {
    resp->set_success(false);
    resp->set_error_message(e.what());
    std::cerr << "[SERVER] [" << rpc << "][reject] reason=" << e.what() << "\n";
  } catch (const std::overflow_error& e) {
    resp->set_success(false);
    resp->set_error_message(e.what());
    std::cerr << "[SERVER] [" << rpc << "][reject] arithmetic=" << e.what() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] [" << rpc << "][error] internal: " << e.what() << "\n";
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
  return grpc::Status::OK;
}

SandboxServiceImpl::SandboxServiceImpl(MarketHost& host) : host_(host) {}

grpc::Status SandboxServiceImpl::MintItem(grpc::ServerContext*,
                                          const mkt::MintItemRequest* req,
                                          mkt::SandboxResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  if (is_null_address(normalize_address(req->registry()))) {
    resp->set_success(false);
    resp->set_error_message("registry is required");
    return grpc::Status::OK;
  }
  std::cout << "[SERVER] [MintItem] registry=" << req->registry() << " to=" << req->to()
            << " item_id=" << req->item_id() << "\n";
  return run_sandbox_call("MintItem", resp, [&] { host_.registry(req->registry()).mint(req->to(), req->item_id()); });
}

grpc::Status SandboxServiceImpl::ApproveItem(grpc::ServerContext*,
                                             const mkt::ApproveItemRequest* req,
                                             mkt::SandboxResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  auto* reg = host_.find_registry(req->registry());
  if (!reg) {
    resp->set_success(false);
    resp->set_error_message("no registry at " + req->registry());
    return grpc::Status::OK;
  }
  return run_sandbox_call("ApproveItem", resp, [&] { reg->approve(req->caller(), req->approved(), req->item_id()); });
}

grpc::Status SandboxServiceImpl::SetApprovalForAll(grpc::ServerContext*,
                                                   const mkt::SetApprovalForAllRequest* req,
                                                   mkt::SandboxResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  auto* reg = host_.find_registry(req->registry());
  if (!reg) {
    resp->set_success(false);
    resp->set_error_message("no registry at " + req->registry());
    return grpc::Status::OK;
  }
  return run_sandbox_call("SetApprovalForAll", resp, [&] {
    reg->set_approval_for_all(req->owner(), req->operator_address(), req->approved());
  });
}

grpc::Status SandboxServiceImpl::OwnerOf(grpc::ServerContext*,
                                         const mkt::OwnerOfRequest* req,
                                         mkt::OwnerOfResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  auto* reg = host_.find_registry(req->registry());
  if (!reg) {
    resp->set_error_message("no registry at " + req->registry());
    return grpc::Status::OK;
  }
  try {
    resp->set_owner(reg->owner_of(req->item_id()));
    resp->set_success(true);
  } catch (const ExternalCallError& e) {
    resp->set_error_message(e.what());
  }
  return grpc::Status::OK;
}

grpc::Status SandboxServiceImpl::Credit(grpc::ServerContext*,
                                        const mkt::CreditRequest* req,
                                        mkt::SandboxResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  std::cout << "[SERVER] [Credit] account=" << req->account() << " amount=" << req->amount() << "\n";
  return run_sandbox_call("Credit", resp, [&] { host_.ledger().credit(req->account(), req->amount()); });
}

grpc::Status SandboxServiceImpl::ApproveAllowance(grpc::ServerContext*,
                                                  const mkt::ApproveAllowanceRequest* req,
                                                  mkt::SandboxResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  return run_sandbox_call("ApproveAllowance", resp, [&] {
    host_.ledger().approve(req->owner(), req->spender(), req->amount());
  });
}

grpc::Status SandboxServiceImpl::BalanceOf(grpc::ServerContext*,
                                           const mkt::BalanceOfRequest* req,
                                           mkt::BalanceOfResponse* resp) {
  std::lock_guard<std::mutex> lk(host_.request_mutex());
  resp->set_balance(host_.ledger().balance_of(req->account()));
  return grpc::Status::OK;
}
