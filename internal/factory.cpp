#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <stdexcept>

#include "internal/checkpoint/memory_checkpoint_store.hpp"
#include "internal/checkpoint/sqlite_checkpoint_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/publish/json_lines_publisher.hpp"
#include "internal/runtime/shipper.hpp"

namespace eventship::factory {

using eventship::runtime::config::RuntimeConfig;
using google::protobuf::util::TimeUtil;
using observability::StringField;

namespace {

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& duration) {
  return std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(duration));
}

} // namespace

Application::Application()                                  = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;
Application::~Application()                                 = default;

host::HostOptions BuildHostOptions(const RuntimeConfig& config) {
  host::HostOptions options;
  options.registry_dir = config.host().registry_dir();
  options.log_dir      = config.host().log_dir();
  if (!config.host().default_log().empty()) {
    options.default_log = config.host().default_log();
  }
  return options;
}

tailing::EngineOptions BuildEngineOptions(const eventship::runtime::config::ProviderConfig& provider,
                                          const eventship::runtime::config::RetryConfig&    retry) {
  tailing::EngineOptions options;
  options.provider          = provider.name();
  options.resume            = provider.resume() == "start" ? tailing::ResumePolicy::kStart : tailing::ResumePolicy::kCheckpoint;
  options.batch.max_records = provider.batch_max_records();
  options.batch.max_bytes   = static_cast<std::uint32_t>(provider.batch_max_bytes());
  options.poll_interval     = ToMillis(provider.poll_interval());
  options.language_id       = provider.language_id();

  options.open_retry.max_attempts    = retry.max_attempts();
  options.open_retry.initial_backoff = ToMillis(retry.initial_backoff());
  options.open_retry.max_backoff     = ToMillis(retry.max_backoff());
  return options;
}

std::shared_ptr<checkpoint::CheckpointStore> BuildCheckpointStore(const eventship::runtime::config::CheckpointConfig& config) {
  if (config.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path());
    EVENTSHIP_LOG_INFO("Checkpoints in sqlite", {StringField("path", config.sqlite().path())});
    return std::make_shared<checkpoint::SqliteCheckpointStore>(std::move(sqlite_db));
  }

  EVENTSHIP_LOG_WARN("Checkpoints kept in memory; restarts replay from the start");
  return std::make_shared<checkpoint::MemoryCheckpointStore>();
}

Application Build(const RuntimeConfig& config) {
  if (config.providers().empty()) {
    throw std::runtime_error("no providers configured");
  }

  Application app;
  app.host        = std::make_shared<host::LogHost>(BuildHostOptions(config));
  app.checkpoints = BuildCheckpointStore(config.checkpoint());
  app.publisher   = std::make_shared<publish::JsonLinesPublisher>(config.output().path(), config.output().verbose());

  std::vector<std::unique_ptr<tailing::TailingEngine>> engines;
  for (const auto& provider : config.providers()) {
    engines.push_back(std::make_unique<tailing::TailingEngine>(app.host, app.checkpoints, app.publisher,
                                                               BuildEngineOptions(provider, config.open_retry())));
  }
  app.shipper = std::make_unique<runtime::Shipper>(std::move(engines));
  return app;
}

} // namespace eventship::factory
