#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/error_codes.hpp"

using durable::factory::Build;
using durable::observability::BoolField;
using durable::observability::IntField;
using durable::observability::StringField;

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
    std::cerr << "Usage: durable-engine <config.yaml> OR durable-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = durable::config::ConfigLoader::LoadFromYaml(config_path);

    durable::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // ------------------------------------------------------------
    // Restore persisted runs and start workers
    // ------------------------------------------------------------
    std::string flow_classes;
    for (const auto& flow_class : app.registry->FlowClasses()) {
      if (!flow_classes.empty()) flow_classes += ',';
      flow_classes += flow_class;
    }

    auto restored = app.scheduler->Start();
    DURABLE_LOG_INFO("Durable engine started", {StringField("backend", config.database().has_sqlite() ? "sqlite" : "memory"),
                                                StringField("flows", flow_classes),
                                                BoolField("allow_error_recovery", config.engine().allow_error_recovery()),
                                                IntField("restored_runs", static_cast<int64_t>(restored))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    DURABLE_LOG_INFO("Shutting down durable engine", {IntField("active_runs", static_cast<int64_t>(app.scheduler->ActiveRuns()))});

    app.scheduler->Stop();
    durable::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    DURABLE_LOG_ERROR("Fatal error", {StringField("code", durable::util::ErrorCodeOf(e)), StringField("error", e.what())});
    durable::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
