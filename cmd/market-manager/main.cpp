#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/chain/block_clock.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using market::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  market::observability::ShutdownLogging();
  market::observability::ShutdownMetrics();
  market::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: market-manager <config.yaml> OR market-manager --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = market::config::ConfigLoader::LoadFromYaml(config_path);

    market::observability::InitializeTracing(config);
    market::observability::InitializeMetrics(config);
    market::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = market::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    MARKET_LOG_INFO("Market manager started",
                    {market::observability::StringField("bind_address", config.server().bind_address()),
                     market::observability::StringField("contract_principal", config.chain().contract_principal()),
                     market::observability::TokenField("block_height", app.context.clock->CurrentHeight()),
                     market::observability::BoolField("manual_clock", app.context.manual_clock != nullptr)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MARKET_LOG_INFO("Shutting down market manager");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    MARKET_LOG_ERROR("Fatal error", {market::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
