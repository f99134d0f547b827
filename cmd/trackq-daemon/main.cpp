#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#if TRACKQ_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

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
    std::cerr << "Usage: trackq-daemon <config.yaml> OR trackq-daemon --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = trackq::config::ConfigLoader::LoadFromYaml(config_path);

    trackq::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = trackq::factory::Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.manager->Start();

#if TRACKQ_WITH_GRPC
    trackq::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
#endif
    TRACKQ_LOG_INFO("trackq daemon started", {trackq::observability::StringField("bind_address", config.server().bind_address()),
                                              trackq::observability::IntField("workers", config.download().concurrent_downloads())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TRACKQ_LOG_INFO("Shutting down trackq daemon");

#if TRACKQ_WITH_GRPC
    server.Stop();
#endif
    app.manager->Stop();
    app.bridge->Shutdown();
    trackq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    TRACKQ_LOG_ERROR("Fatal error", {trackq::observability::StringField("error", e.what())});
    trackq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
