#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  streak::observability::ShutdownLogging();
  streak::observability::ShutdownMetrics();
  streak::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: streak-engine <config.yaml> OR streak-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = streak::config::ConfigLoader::LoadFromYaml(config_path);

    streak::observability::InitializeTracing(config);
    streak::observability::InitializeMetrics(config);
    streak::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto runtime = streak::factory::BuildRuntime(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (config.sweep().enabled()) {
      runtime.scheduler->Start();
    } else {
      STREAK_LOG_WARN("daily sweep disabled");
    }
    STREAK_LOG_INFO("streak engine started",
                    {streak::observability::BoolField("sweep_enabled", config.sweep().enabled()),
                     streak::observability::UIntField("sweep_workers", config.sweep().workers())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    STREAK_LOG_INFO("shutting down streak engine");

    runtime.scheduler->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    STREAK_LOG_ERROR("fatal error", {streak::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
