#include "shipper.hpp"

#include "internal/observability/logging.hpp"

namespace eventship::runtime {

using observability::IntField;
using observability::StringField;

Shipper::Shipper(std::vector<std::unique_ptr<tailing::TailingEngine>> engines) : engines_(std::move(engines)) {}

Shipper::~Shipper() {
  Stop();
}

void Shipper::Start() {
  if (started_) {
    return;
  }
  started_ = true;
  for (auto& engine : engines_) {
    engine->Start();
  }
  EVENTSHIP_LOG_INFO("Shipper started", {IntField("providers", static_cast<std::int64_t>(engines_.size()))});
}

void Shipper::Stop() {
  if (!started_) {
    return;
  }
  started_ = false;

  // signal all first so engines wind down in parallel
  for (auto& engine : engines_) {
    engine->RequestStop();
  }
  for (auto& engine : engines_) {
    engine->Stop();
    const auto stats = engine->Stats();
    EVENTSHIP_LOG_INFO("Provider stopped", {StringField("provider", engine->options().provider),
                                            IntField("emitted", static_cast<std::int64_t>(stats.records_emitted)),
                                            IntField("skipped", static_cast<std::int64_t>(stats.records_skipped)),
                                            IntField("recoveries", static_cast<std::int64_t>(stats.recoveries)),
                                            IntField("last_record", stats.last_record_number)});
  }
}

bool Shipper::Running() const {
  for (const auto& engine : engines_) {
    if (!engine->FatalError()) {
      return true;
    }
  }
  return false;
}

std::vector<std::pair<std::string, std::string>> Shipper::Failures() const {
  std::vector<std::pair<std::string, std::string>> failures;
  for (const auto& engine : engines_) {
    if (auto error = engine->FatalError()) {
      failures.emplace_back(engine->options().provider, *error);
    }
  }
  return failures;
}

} // namespace eventship::runtime
