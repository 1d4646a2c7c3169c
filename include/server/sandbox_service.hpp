#pragma once
#include <grpcpp/grpcpp.h>
#include "nft_market.grpc.pb.h"

#include <functional>

namespace mkt = nft_market::v1;

class MarketHost;

// Runs one sandbox mutation. Collaborator rejections become success=false
// with their reason; any other failure is reported as INTERNAL.
grpc::Status run_sandbox_call(const char* rpc, mkt::SandboxResponse* resp, const std::function<void()>& fn);

// Drives the in-process ledger and item registries so a marketplace can be
// exercised end to end without real collaborators.
class SandboxServiceImpl final : public mkt::Sandbox::Service {
public:
  explicit SandboxServiceImpl(MarketHost& host);

  grpc::Status MintItem(grpc::ServerContext*, const mkt::MintItemRequest*, mkt::SandboxResponse*) override;
  grpc::Status ApproveItem(grpc::ServerContext*, const mkt::ApproveItemRequest*, mkt::SandboxResponse*) override;
  grpc::Status SetApprovalForAll(grpc::ServerContext*,
                                 const mkt::SetApprovalForAllRequest*,
                                 mkt::SandboxResponse*) override;
  grpc::Status OwnerOf(grpc::ServerContext*, const mkt::OwnerOfRequest*, mkt::OwnerOfResponse*) override;
  grpc::Status Credit(grpc::ServerContext*, const mkt::CreditRequest*, mkt::SandboxResponse*) override;
  grpc::Status ApproveAllowance(grpc::ServerContext*,
                                const mkt::ApproveAllowanceRequest*,
                                mkt::SandboxResponse*) override;
  grpc::Status BalanceOf(grpc::ServerContext*, const mkt::BalanceOfRequest*, mkt::BalanceOfResponse*) override;

private:
  MarketHost& host_;
};
