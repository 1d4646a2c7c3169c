#pragma once
#include <grpcpp/grpcpp.h>
#include "nft_market.grpc.pb.h"

namespace mkt = nft_market::v1;

class MarketHost;

class MarketplaceServiceImpl final : public mkt::Marketplace::Service {
public:
  explicit MarketplaceServiceImpl(MarketHost& host);

  MarketplaceServiceImpl(const MarketplaceServiceImpl&)            = delete;
  MarketplaceServiceImpl& operator=(const MarketplaceServiceImpl&) = delete;

  grpc::Status List(grpc::ServerContext*, const mkt::ListRequest*, mkt::ListResponse*) override;
  grpc::Status Buy(grpc::ServerContext*, const mkt::BuyRequest*, mkt::BuyResponse*) override;
  grpc::Status NftInfo(grpc::ServerContext*, const mkt::NftInfoRequest*, mkt::NftInfoResponse*) override;
  grpc::Status OrderInfo(grpc::ServerContext*, const mkt::OrderInfoRequest*, mkt::OrderInfoResponse*) override;
  grpc::Status GetFees(grpc::ServerContext*, const mkt::GetFeesRequest*, mkt::GetFeesResponse*) override;

  grpc::Status ChangeFeePercent(grpc::ServerContext*,
                                const mkt::ChangeFeePercentRequest*,
                                mkt::AdminResponse*) override;
  grpc::Status ChangeMinimumFee(grpc::ServerContext*,
                                const mkt::ChangeMinimumFeeRequest*,
                                mkt::AdminResponse*) override;
  grpc::Status SetAdmin(grpc::ServerContext*, const mkt::SetAdminRequest*, mkt::AdminResponse*) override;

  grpc::Status RecentEvents(grpc::ServerContext*,
                            const mkt::RecentEventsRequest*,
                            mkt::RecentEventsResponse*) override;

private:
  MarketHost& host_;
};
