#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <stdexcept>
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

namespace {

void ShutdownObservability() {
  outbox::observability::ShutdownLogging();
  outbox::observability::ShutdownMetrics();
  outbox::observability::ShutdownTracing();
}

int Usage() {
  std::cerr << "Usage: outbox-relay [--once] <config.yaml> OR outbox-relay [--once] --config <config.yaml>" << std::endl;
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        once = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--once") {
      once = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      return Usage();
    }
  }
  if (config_path.empty()) return Usage();

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = outbox::config::ConfigLoader::LoadFromYaml(config_path);

    outbox::observability::InitializeTracing(config);
    outbox::observability::InitializeMetrics(config);
    outbox::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = outbox::factory::Build(config);

    if (once) {
      app.publisher->EnqueueAll({}).get();
      OUTBOX_LOG_INFO("outbox sweep finished");
      ShutdownObservability();
      return 0;
    }

    if (!app.sweep_worker) {
      throw std::runtime_error("sweep.interval_ms must be positive unless --once is given");
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.sweep_worker->Start();
    OUTBOX_LOG_INFO("outbox relay started",
                    {outbox::observability::IntField("sweep_interval_ms", static_cast<std::int64_t>(config.sweep().interval_ms()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    OUTBOX_LOG_INFO("shutting down outbox relay");

    app.sweep_worker->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    OUTBOX_LOG_ERROR("fatal error", {outbox::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
