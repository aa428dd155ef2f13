#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

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
    std::cerr << "Usage: archstore <config.yaml> OR archstore --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = archstore::config::ConfigLoader::LoadFromYaml(config_path);

    archstore::observability::InitializeTracing(config);
    archstore::observability::InitializeMetrics(config);
    archstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Open store (migrates when needed)
    // ------------------------------------------------------------
    auto runtime = archstore::factory::BuildRuntime(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    runtime.StartWorkers();
    ARCHSTORE_LOG_INFO("archstore started", {archstore::observability::StringField("store", config.store().path())});

    const auto cleanup_interval = archstore::util::ToMillis(config.backup().cleanup_interval());
    auto       next_cleanup     = std::chrono::steady_clock::now();

    while (g_running) {
      if (std::chrono::steady_clock::now() >= next_cleanup) {
        try {
          runtime.backups->CleanupExpired();
          runtime.backups->CleanupTemporaryFiles(config.store().path());
        } catch (const archstore::util::StoreError& e) {
          ARCHSTORE_LOG_ERROR("backup cleanup failed", {archstore::observability::StringField("error", e.what())});
        }
        next_cleanup = std::chrono::steady_clock::now() + cleanup_interval;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    ARCHSTORE_LOG_INFO("Shutting down archstore");

    runtime.Shutdown();
    archstore::observability::ShutdownLogging();
    archstore::observability::ShutdownMetrics();
    archstore::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    ARCHSTORE_LOG_CRITICAL("Fatal error", {archstore::observability::StringField("error", e.what())});
    archstore::observability::ShutdownLogging();
    archstore::observability::ShutdownMetrics();
    archstore::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
