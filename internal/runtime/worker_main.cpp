#include "worker_main.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "worker_service.hpp"

namespace sda::runtime {

using sda::config::ConfigLoader;
using sda::config::WorkerKind;
using sda::observability::StringField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

} // namespace

int RunWorkerMain(int argc, char** argv, const std::string& program, WorkerKind kind) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: " << program << " <config.yaml> OR " << program << " --config <config.yaml>" << std::endl;
    return 1;
  }

  sda::runtime::config::RuntimeConfig config;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    config = ConfigLoader::LoadFromYaml(config_path);
    ConfigLoader::ApplyEnvironmentOverrides(config);

    sda::observability::InitializeLogging(config.logging(), program);
    ConfigLoader::Validate(config, kind);

    {
      // ----------------------------------------------------------
      // Build worker (dependency graph)
      // ----------------------------------------------------------
      auto worker = kind == WorkerKind::kSync ? sda::factory::BuildSync(config) : sda::factory::BuildVerify(config);

      WorkerService service(worker.broker, std::move(worker.loop));

      // Register signal handlers before starting to avoid race window.
      std::signal(SIGINT, HandleSignal);
      std::signal(SIGTERM, HandleSignal);

      service.Start();
      SDA_LOG_INFO("starting " + program + " service", {StringField("queue", config.broker().queue())});

      while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

      SDA_LOG_INFO("shutting down " + program);
      service.Stop();
    }

    sda::factory::Shutdown(config);
    sda::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SDA_LOG_ERROR("fatal error", {StringField("error", e.what())});
    sda::factory::Shutdown(config);
    sda::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}

} // namespace sda::runtime
