#include "server/prediction_market_service.hpp"
#include "server/server_config.hpp"
#include "storage/storage.hpp"
#include "utils/log.hpp"

#include <grpcpp/grpcpp.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true, std::memory_order_relaxed); }

int main(int argc, char** argv) {
  auto cfg = parse_args(argc, argv, std::cerr);
  if (!cfg) {
    print_usage(std::cerr, argv[0]);
    return 1;
  }
  if (cfg->quiet) engine_log_enabled().store(false);

  try {
    // Ensure directory exists and use a FILE path, not a directory
    std::filesystem::path db_file(cfg->db_path);
    if (db_file.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(db_file.parent_path(), ec); // ok if already exists
      if (ec) {
        std::cerr << "[SERVER] ERROR: cannot create " << db_file.parent_path().string()
                  << ": " << ec.message() << "\n";
        return 1;
      }
    }

    PredictionMarketServiceImpl service(db_file.string(), cfg->max_retries);
    if (!cfg->admin_email.empty()) {
      service.bootstrap_admin(cfg->admin_name, cfg->admin_email);
    }

    grpc::ServerBuilder builder;
    int selected_port = 0;
    builder.AddListeningPort(cfg->addr, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server = builder.BuildAndStart();

    if (!server) {
      std::cerr << "[SERVER] ERROR: BuildAndStart() returned null\n";
      return 1;
    }
    if (selected_port == 0) {
      std::cerr << "[SERVER] ERROR: failed to bind " << cfg->addr << " (in use or permission issue)\n";
      return 1;
    }

    std::cout << "[SERVER] listening on " << cfg->addr << " ; db=" << db_file.string()
              << " ; max_retries=" << cfg->max_retries << "\n";

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
