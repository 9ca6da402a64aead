#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/grpc/reconcile_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/reconcile_service.hpp"

using keyshop::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: keyshop-ledger <config.yaml> OR keyshop-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = keyshop::config::ConfigLoader::LoadFromYaml(config_path);

    keyshop::observability::InitializeLogging(config);
    keyshop::observability::InitializeTracing(config);
    keyshop::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = keyshop::factory::Build(config);

    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<keyshop::grpc::LedgerServer>(std::make_shared<keyshop::service::LedgerService>(app.context)));
    services.push_back(std::make_unique<keyshop::grpc::ReconcileServer>(std::make_shared<keyshop::service::ReconcileService>(app.context)));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    KEYSHOP_LOG_INFO("Keyshop ledger started", {keyshop::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    KEYSHOP_LOG_INFO("Shutting down keyshop ledger");

    server.Stop();
    app.Shutdown();
    keyshop::observability::ShutdownMetrics();
    keyshop::observability::ShutdownTracing();
    keyshop::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    KEYSHOP_LOG_ERROR("Fatal error", {keyshop::observability::StringField("error", e.what())});
    keyshop::observability::ShutdownMetrics();
    keyshop::observability::ShutdownTracing();
    keyshop::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
