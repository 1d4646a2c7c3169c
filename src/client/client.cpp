#include <grpcpp/grpcpp.h>
#include "nft_market.grpc.pb.h"
#include "nft_market.pb.h"
#include <iostream>
#include <memory>
#include <string>

namespace mkt = nft_market::v1;

static void usage(const char* prog) {
    std::cerr <<
      "Usage:\n"
      "  " << prog << " <addr> list   <caller> <registry> <item_id> <price> [metadata_uri]\n"
      "  " << prog << " <addr> buy    <caller> <listing_id>\n"
      "  " << prog << " <addr> nft    <listing_id>\n"
      "  " << prog << " <addr> order  <order_id>\n"
      "  " << prog << " <addr> fees\n"
      "  " << prog << " <addr> events [limit]\n"
      "  " << prog << " <addr> mint   <registry> <to> <item_id>\n"
      "  " << prog << " <addr> approve-all <registry> <owner> <operator>\n"
      "  " << prog << " <addr> credit <account> <amount>\n"
      "  " << prog << " <addr> allow  <owner> <spender> <amount>\n"
      "  Example:\n"
      "  " << prog << " localhost:50061 list 0xa11ce 0xe7 42 2 ipfs://item-42\n";
}

static int rpc_failed(const grpc::Status& status) {
    std::cerr << "[client] RPC failed: " << status.error_code() << " - " << status.error_message() << "\n";
    return 2;
}

static int report(const grpc::Status& status, const mkt::SandboxResponse& resp) {
    if (!status.ok()) return rpc_failed(status);
    if (!resp.success()) {
        std::cerr << "[client] rejected: " << resp.error_message() << "\n";
        return 3;
    }
    std::cout << "[client] ok\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 3) { usage(argv[0]); return 1; }

    const std::string addr = argv[1];
    const std::string cmd  = argv[2];
    auto arg = [&](int i) -> std::string { return (i < argc) ? argv[i] : std::string(); };
    auto need = [&](int n) { return argc >= 3 + n; };

    // InsecureChannelCredentials() is fine for local dev. For anything else, switch to TLS
    auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    auto market  = mkt::Marketplace::NewStub(channel);
    auto sandbox = mkt::Sandbox::NewStub(channel);

    try {
        grpc::ClientContext ctx;

        if (cmd == "list" && need(4)) {
            mkt::ListRequest req;
            req.set_caller(arg(3));
            req.set_registry(arg(4));
            req.set_item_id(std::stoull(arg(5)));
            req.set_price(std::stoull(arg(6)));
            req.set_metadata_uri(arg(7));
            mkt::ListResponse resp;
            auto status = market->List(&ctx, req, &resp);
            if (!status.ok()) return rpc_failed(status);
            if (!resp.success()) {
                std::cerr << "[client] rejected: " << mkt::ErrorKind_Name(resp.error_kind())
                          << " " << resp.error_message() << "\n";
                return 3;
            }
            std::cout << "[client] listed listing_id=" << resp.listing_id() << "\n";
            return 0;
        }

        if (cmd == "buy" && need(2)) {
            mkt::BuyRequest req;
            req.set_caller(arg(3));
            req.set_listing_id(std::stoull(arg(4)));
            mkt::BuyResponse resp;
            auto status = market->Buy(&ctx, req, &resp);
            if (!status.ok()) return rpc_failed(status);
            if (!resp.success()) {
                std::cerr << "[client] rejected: " << mkt::ErrorKind_Name(resp.error_kind())
                          << " order_id=" << resp.order_id() << " " << resp.error_message() << "\n";
                return 3;
            }
            std::cout << "[client] order_id=" << resp.order_id()
                      << " status=" << mkt::OrderStatus_Name(resp.status()) << "\n";
            return 0;
        }

        if (cmd == "nft" && need(1)) {
            mkt::NftInfoRequest req;
            req.set_listing_id(std::stoull(arg(3)));
            mkt::NftInfoResponse resp;
            auto status = market->NftInfo(&ctx, req, &resp);
            if (!status.ok()) return rpc_failed(status);
            if (!resp.found()) { std::cerr << "[client] no such listing\n"; return 3; }
            std::cout << resp.listing().DebugString();
            return 0;
        }

        if (cmd == "order" && need(1)) {
            mkt::OrderInfoRequest req;
            req.set_order_id(std::stoull(arg(3)));
            mkt::OrderInfoResponse resp;
            auto status = market->OrderInfo(&ctx, req, &resp);
            if (!status.ok()) return rpc_failed(status);
            if (!resp.found()) { std::cerr << "[client] no such order\n"; return 3; }
            std::cout << resp.order().DebugString();
            return 0;
        }

        if (cmd == "fees") {
            mkt::GetFeesResponse resp;
            auto status = market->GetFees(&ctx, mkt::GetFeesRequest(), &resp);
            if (!status.ok()) return rpc_failed(status);
            std::cout << "[client] fee_percent_bp=" << resp.fee_percent_bp()
                      << " minimum_fee=" << resp.minimum_fee() << " admin=" << resp.admin() << "\n";
            return 0;
        }

        if (cmd == "events") {
            mkt::RecentEventsRequest req;
            if (need(1)) req.set_limit(std::stoi(arg(3)));
            mkt::RecentEventsResponse resp;
            auto status = market->RecentEvents(&ctx, req, &resp);
            if (!status.ok()) return rpc_failed(status);
            for (const auto& ev : resp.events()) {
                std::cout << mkt::EventType_Name(ev.type()) << " listing=" << ev.listing_id()
                          << " order=" << ev.order_id() << " item=" << ev.item_id()
                          << " price=" << ev.price() << "\n";
            }
            return 0;
        }

        if (cmd == "mint" && need(3)) {
            mkt::MintItemRequest req;
            req.set_registry(arg(3));
            req.set_to(arg(4));
            req.set_item_id(std::stoull(arg(5)));
            mkt::SandboxResponse resp;
            return report(sandbox->MintItem(&ctx, req, &resp), resp);
        }

        if (cmd == "approve-all" && need(3)) {
            mkt::SetApprovalForAllRequest req;
            req.set_registry(arg(3));
            req.set_owner(arg(4));
            req.set_operator_address(arg(5));
            req.set_approved(true);
            mkt::SandboxResponse resp;
            return report(sandbox->SetApprovalForAll(&ctx, req, &resp), resp);
        }

        if (cmd == "credit" && need(2)) {
            mkt::CreditRequest req;
            req.set_account(arg(3));
            req.set_amount(std::stoull(arg(4)));
            mkt::SandboxResponse resp;
            return report(sandbox->Credit(&ctx, req, &resp), resp);
        }

        if (cmd == "allow" && need(3)) {
            mkt::ApproveAllowanceRequest req;
            req.set_owner(arg(3));
            req.set_spender(arg(4));
            req.set_amount(std::stoull(arg(5)));
            mkt::SandboxResponse resp;
            return report(sandbox->ApproveAllowance(&ctx, req, &resp), resp);
        }
    } catch (const std::logic_error& e) {   // stoull / stoi
        std::cerr << "[client] bad numeric argument: " << e.what() << "\n";
        return 1;
    }

    usage(argv[0]);
    return 1;
}
