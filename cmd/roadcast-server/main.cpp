#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/application.hpp"
#include "internal/runtime/server.hpp"

using roadcast::runtime::Server;

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
    std::cerr << "Usage: roadcast-server <config.yaml> OR roadcast-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = roadcast::config::ConfigLoader::LoadFromYaml(config_path);

    roadcast::observability::InitializeTracing(config);
    roadcast::observability::InitializeMetrics(config);
    roadcast::observability::InitializeLogging(config);

    // No upstream wire clients ship with the server; cached and
    // graph-resident data is still served.
    auto app = roadcast::runtime::BuildApplication(config, roadcast::factory::UnconfiguredProviders());

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ROADCAST_LOG_INFO("roadcast started", {roadcast::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ROADCAST_LOG_INFO("shutting down roadcast");

    server.Stop();
    app.engine.janitor->Stop();
    roadcast::observability::ShutdownLogging();
    roadcast::observability::ShutdownMetrics();
    roadcast::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ROADCAST_LOG_ERROR("fatal error", {roadcast::observability::StringField("error", e.what())});
    roadcast::observability::ShutdownLogging();
    roadcast::observability::ShutdownMetrics();
    roadcast::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
