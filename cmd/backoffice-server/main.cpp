#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/backoffice_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using backoffice::runtime::Server;

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
    std::cerr << "Usage: backoffice-server <config.yaml> OR backoffice-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = backoffice::config::ConfigLoader::LoadFromYaml(config_path);

    backoffice::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = backoffice::factory::Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<backoffice::grpc::BackOfficeServer>(app.sales_service, app.catalog_service, app.reporting_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BACKOFFICE_LOG_INFO("Back office server started", {backoffice::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BACKOFFICE_LOG_INFO("Shutting down back office server");

    server.Stop();
    backoffice::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BACKOFFICE_LOG_ERROR("Fatal error", {backoffice::observability::StringField("error", e.what())});
    backoffice::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
