#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/shipper.hpp"

using eventship::observability::IntField;
using eventship::observability::StringField;

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
    std::cerr << "Usage: eventship <config.yaml> OR eventship --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = eventship::config::ConfigLoader::LoadFromYaml(config_path);

    eventship::observability::InitializeLogging(config);

    auto app = eventship::factory::Build(config);

    // Register signal handlers before starting engines to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.shipper->Start();
    EVENTSHIP_LOG_INFO("eventship started", {StringField("log_dir", config.host().log_dir()),
                                             IntField("providers", config.providers_size())});

    while (g_running && app.shipper->Running()) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EVENTSHIP_LOG_INFO("Shutting down eventship");
    app.shipper->Stop();

    const auto failures = app.shipper->Failures();
    for (const auto& [provider, error] : failures) {
      EVENTSHIP_LOG_ERROR("Provider failed", {StringField("provider", provider), StringField("error", error)});
    }

    eventship::observability::ShutdownLogging();
    return failures.empty() ? 0 : 3;
  } catch (const std::exception& e) {
    EVENTSHIP_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    eventship::observability::ShutdownLogging();
    return 2;
  }
}
