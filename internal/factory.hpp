#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/host/log_host.hpp"
#include "internal/tailing/tailing_engine.hpp"

namespace eventship::checkpoint {
class CheckpointStore;
}

namespace eventship::publish {
class Publisher;
}

namespace eventship::runtime {
class Shipper;
}

namespace eventship::factory {

/*
  Application

  Everything the daemon keeps alive for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<const host::LogHost>         host;
  std::shared_ptr<checkpoint::CheckpointStore> checkpoints;
  std::shared_ptr<publish::Publisher>          publisher;
  std::unique_ptr<runtime::Shipper>            shipper;

  Application();
  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;
  ~Application();
};

host::HostOptions BuildHostOptions(const eventship::runtime::config::RuntimeConfig& config);

tailing::EngineOptions BuildEngineOptions(const eventship::runtime::config::ProviderConfig& provider,
                                          const eventship::runtime::config::RetryConfig&    retry);

std::shared_ptr<checkpoint::CheckpointStore> BuildCheckpointStore(const eventship::runtime::config::CheckpointConfig& config);

/*
  Composition root: the only place that knows the concrete store and
  publisher types. Throws on setup failures.
*/
Application Build(const eventship::runtime::config::RuntimeConfig& config);

} // namespace eventship::factory
