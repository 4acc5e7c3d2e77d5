#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using siros::runtime::Server;

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
    std::cerr << "Usage: siros-server <config.yaml> OR siros-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = siros::config::ConfigLoader::LoadFromYaml(config_path);

    siros::observability::InitializeLogging(config);
    siros::observability::InitializeTracing(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = siros::factory::Build(config);

    // Startup integrity check: a broken chain is reported, not fatal.
    try {
      const auto report = app.manager->VerifyAllChains();
      SIROS_LOG_INFO("audit chains verified", {siros::observability::IntField("chains", static_cast<std::int64_t>(report.chains_verified)),
                                               siros::observability::IntField("records", static_cast<std::int64_t>(report.records_verified))});
    } catch (const siros::util::ChainBroken& e) {
      SIROS_LOG_ERROR("audit chain verification failed",
                      {siros::observability::StringField("resource_id", e.resource_id()),
                       siros::observability::IntField("index", static_cast<std::int64_t>(e.index())), siros::observability::StringField("error", e.what())});
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(siros::config::BindAddress(config), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SIROS_LOG_INFO("siros started", {siros::observability::StringField("bind_address", siros::config::BindAddress(config))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SIROS_LOG_INFO("shutting down siros");

    server.Stop();
    siros::observability::ShutdownTracing();
    siros::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SIROS_LOG_ERROR("fatal error", {siros::observability::StringField("error", e.what())});
    siros::observability::ShutdownTracing();
    siros::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
