#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using release::runtime::Server;

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
    std::cerr << "Usage: release-coordinator <config.yaml> OR release-coordinator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = release::config::ConfigLoader::LoadFromYaml(config_path);

    release::observability::InitializeTracing(config);
    release::observability::InitializeLogging(config);

    auto app = release::factory::Build(config);

    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Handlers go in before Start so an early signal is not lost.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RELEASE_LOG_INFO("Release coordinator started", {release::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELEASE_LOG_INFO("Shutting down release coordinator");

    server.Stop();
    release::observability::ShutdownLogging();
    release::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RELEASE_LOG_ERROR("Fatal error", {release::observability::StringField("error", e.what())});
    release::observability::ShutdownLogging();
    release::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
