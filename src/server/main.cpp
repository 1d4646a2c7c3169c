#include "server/market_host.hpp"
#include "server/marketplace_service.hpp"
#include "server/sandbox_service.hpp"

#include <SQLiteCpp/SQLiteCpp.h>
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true, std::memory_order_relaxed); }

static void usage(const char* prog) {
  std::cerr <<
    "Usage:\n"
    "  " << prog << " [--addr HOST:PORT] [--db PATH] [--market ADDR] [--ledger ADDR]\n"
    "  " << std::string(std::char_traits<char>::length(prog), ' ')
         << " [--admin ADDR] [--fee-bp N] [--min-fee N]\n";
}

int main(int argc, char** argv) {
  std::string addr = "0.0.0.0:50061"; // 0.0.0.0 listens on all local interfaces
  HostOptions opts;

  // Parse command line and flags
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      const bool has_value = i + 1 < argc;
      if      (a == "--addr"    && has_value) addr = argv[++i];
      else if (a == "--db"      && has_value) opts.db_path = argv[++i];
      else if (a == "--market"  && has_value) opts.market = argv[++i];
      else if (a == "--ledger"  && has_value) opts.ledger = argv[++i];
      else if (a == "--admin"   && has_value) opts.admin = argv[++i];
      else if (a == "--fee-bp"  && has_value) opts.fee_percent_bp = static_cast<uint32_t>(std::stoul(argv[++i]));
      else if (a == "--min-fee" && has_value) opts.minimum_fee = std::stoull(argv[++i]);
      else { usage(argv[0]); return (a == "--help" || a == "-h") ? 0 : 1; }
    }
  } catch (const std::logic_error& e) {   // stoul / stoull
    std::cerr << "[SERVER] ERROR: bad numeric flag: " << e.what() << "\n";
    usage(argv[0]);
    return 1;
  }

  try {
    // Ensure directory exists and use a FILE path, not a directory
    std::filesystem::path db_file(opts.db_path);
    if (db_file.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(db_file.parent_path(), ec); // ok if already exists
    }

    MarketHost host(opts);
    MarketplaceServiceImpl market_service(host);
    SandboxServiceImpl sandbox_service(host);

    grpc::ServerBuilder builder;
    int selected_port = 0;
    builder.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(&market_service);
    builder.RegisterService(&sandbox_service);
    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();

    if (!server) {
      std::cerr << "[SERVER] ERROR: BuildAndStart() returned null\n";
      return 1;
    }
    if (selected_port == 0) {
      std::cerr << "[SERVER] ERROR: failed to bind " << addr << " (in use or permission issue)\n";
      return 1;
    }

    std::cout << "[SERVER] listening on " << addr << " ; db=" << opts.db_path << "\n";

    std::signal(SIGINT,  on_signal);
    std::signal(SIGTERM, on_signal);

    std::thread stopper([&]{
      while (!g_stop.load(std::memory_order_relaxed)) std::this_thread::sleep_for(50ms);
      server->Shutdown(std::chrono::system_clock::now() + 2s);
    });

    server->Wait();
    stopper.join();
    return 0;

  } catch (const SQLite::Exception& e) {
    std::cerr << "[SERVER] SQLite error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "[SERVER] Fatal error: " << e.what() << "\n";
    return 3;
  }
}
