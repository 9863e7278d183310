#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/page_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using pagereg::factory::Build;
using pagereg::runtime::Server;

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
    std::cerr << "Usage: page-registry <config.yaml> OR page-registry --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pagereg::config::ConfigLoader::LoadFromYaml(config_path);

    pagereg::observability::InitializeTracing(config);
    pagereg::observability::InitializeMetrics(config);
    pagereg::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<pagereg::grpc::PageServer>(app.page_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PAGEREG_LOG_INFO("Page registry started", {pagereg::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PAGEREG_LOG_INFO("Shutting down page registry");

    server.Stop();
    pagereg::observability::ShutdownLogging();
    pagereg::observability::ShutdownMetrics();
    pagereg::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PAGEREG_LOG_ERROR("Fatal error", {pagereg::observability::StringField("error", e.what())});
    pagereg::observability::ShutdownLogging();
    pagereg::observability::ShutdownMetrics();
    pagereg::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
