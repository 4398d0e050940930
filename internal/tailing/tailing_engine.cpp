#include "tailing_engine.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/checkpoint/checkpoint.hpp"
#include "internal/host/log_host.hpp"
#include "internal/message/message_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/publish/publisher.hpp"
#include "internal/record/record_codec.hpp"
#include "internal/util/errors.hpp"

namespace eventship::tailing {

using model::EngineState;
using observability::IntField;
using observability::StringField;

TailingEngine::TailingEngine(std::shared_ptr<const host::LogHost> host, std::shared_ptr<checkpoint::CheckpointStore> store,
                             std::shared_ptr<publish::Publisher> publisher, EngineOptions options)
    : host_(std::move(host)), store_(std::move(store)), publisher_(std::move(publisher)), options_(std::move(options)) {
  if (!host_ || !store_ || !publisher_) {
    throw std::invalid_argument("TailingEngine: missing dependency");
  }
  if (options_.provider.empty()) {
    throw std::invalid_argument("TailingEngine: provider is required");
  }
  if (options_.open_retry.max_attempts == 0) {
    options_.open_retry.max_attempts = 1;
  }
}

TailingEngine::~TailingEngine() {
  Stop();
}

void TailingEngine::Start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&TailingEngine::Run, this);
}

void TailingEngine::Stop() {
  RequestStop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void TailingEngine::RequestStop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
}

void TailingEngine::Run() {
  EVENTSHIP_LOG_INFO("Tailing engine started", {StringField("provider", options_.provider)});

  while (true) {
    if (State() == EngineState::kIdle && (StopRequested() || FatalError())) {
      break;
    }

    try {
      Step();
    } catch (const std::exception& e) {
      Fail(std::string("unexpected error in ") + model::EngineStateName(State()) + ": " + e.what());
      if (State() == EngineState::kClosing) {
        session_.reset();
        resolver_.reset();
        loaded_ = false;
        state_  = EngineState::kIdle;
      } else if (State() != EngineState::kIdle) {
        TransitionTo(EngineState::kClosing);
      }
    }
  }

  EVENTSHIP_LOG_INFO("Tailing engine stopped", {StringField("provider", options_.provider)});
}

EngineState TailingEngine::Step() {
  EngineState next = EngineState::kIdle;
  switch (State()) {
    case EngineState::kIdle:
      next = OnIdle();
      break;
    case EngineState::kOpening:
      next = OnOpening();
      break;
    case EngineState::kReading:
      next = OnReading();
      break;
    case EngineState::kWaiting:
      next = OnWaiting();
      break;
    case EngineState::kRecovering:
      next = OnRecovering();
      break;
    case EngineState::kClosing:
      next = OnClosing();
      break;
  }
  TransitionTo(next);
  return next;
}

void TailingEngine::TransitionTo(EngineState next) {
  const EngineState current = State();
  if (current == next && current == EngineState::kIdle) {
    return;
  }
  if (!model::CanTransition(current, next)) {
    throw util::InvalidState(std::string("invalid engine transition ") + model::EngineStateName(current) + " -> " +
                             model::EngineStateName(next));
  }
  if (current != next) {
    EVENTSHIP_LOG_DEBUG("Engine state", {StringField("provider", options_.provider), StringField("from", model::EngineStateName(current)),
                                         StringField("to", model::EngineStateName(next))});
  }
  state_ = next;
}

EngineStats TailingEngine::Stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

std::optional<std::string> TailingEngine::FatalError() const {
  std::lock_guard lock(mutex_);
  return fatal_;
}

bool TailingEngine::StopRequested() const {
  std::lock_guard lock(mutex_);
  return stop_requested_;
}

bool TailingEngine::WaitForStop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return stop_cv_.wait_for(lock, timeout, [this] { return stop_requested_; });
}

void TailingEngine::Fail(std::string message) {
  EVENTSHIP_LOG_ERROR("Tailing engine failed", {StringField("provider", options_.provider), StringField("error", message)});
  std::lock_guard lock(mutex_);
  if (!fatal_) {
    fatal_ = std::move(message);
  }
}

// ---------------------------------------------------------------------------
// states
// ---------------------------------------------------------------------------

EngineState TailingEngine::OnIdle() {
  if (StopRequested() || FatalError()) {
    return EngineState::kIdle;
  }
  attempts_ = 0;
  return EngineState::kOpening;
}

EngineState TailingEngine::OnOpening() {
  if (StopRequested()) {
    return EngineState::kClosing;
  }
  if (!loaded_ && !LoadCheckpoint()) {
    ++attempts_;
    if (attempts_ >= options_.open_retry.max_attempts) {
      Fail("checkpoint load failed after " + std::to_string(attempts_) + " attempts");
      return EngineState::kClosing;
    }
    return BackOff(attempts_) ? EngineState::kOpening : EngineState::kClosing;
  }

  if (!OpenSession(last_emitted_)) {
    ++attempts_;
    if (attempts_ >= options_.open_retry.max_attempts) {
      Fail("session open failed after " + std::to_string(attempts_) + " attempts");
      return EngineState::kClosing;
    }
    return BackOff(attempts_) ? EngineState::kOpening : EngineState::kClosing;
  }
  attempts_ = 0;

  const std::uint64_t creation = session_->LogCreationMicros();
  if (log_creation_us_ != 0 && creation != log_creation_us_ && last_emitted_ > 0) {
    recovery_reason_ = "log creation time differs from checkpoint";
    return EngineState::kRecovering;
  }
  log_creation_us_ = creation;
  return EngineState::kReading;
}

EngineState TailingEngine::OnReading() {
  if (StopRequested()) {
    return EngineState::kClosing;
  }

  auto batch = session_->ReadBatch();
  if (!batch) {
    if (batch.error == session::ReadError::kInvalidated) {
      recovery_reason_ = batch.message;
      return EngineState::kRecovering;
    }
    EVENTSHIP_LOG_WARN("Read failed, reopening session", {StringField("provider", options_.provider),
                                                          StringField("error", session::ReadErrorName(batch.error)),
                                                          StringField("message", batch.message)});
    session_.reset();
    return BackOff(1) ? EngineState::kOpening : EngineState::kClosing;
  }

  if (batch.records.empty()) {
    return EngineState::kWaiting;
  }

  std::vector<model::Event> events;
  events.reserve(batch.records.size());

  std::uint32_t last       = last_emitted_;
  std::uint64_t skipped    = 0;
  std::uint64_t duplicates = 0;

  for (const auto& raw : batch.records) {
    record::Record record;
    auto           decoded = record::DecodeRecord(raw.bytes, &record);
    if (!decoded) {
      ++skipped;
      EVENTSHIP_LOG_WARN("Skipping undecodable record",
                         {StringField("provider", options_.provider), IntField("offset", static_cast<std::int64_t>(raw.offset)),
                          StringField("error", record::DecodeErrorName(decoded.error)), StringField("message", decoded.message)});
      continue;
    }
    if (record.record_number <= last) {
      ++duplicates;
      continue;
    }
    last = record.record_number;
    events.push_back(BuildEvent(*resolver_, session_->registration(), options_.provider, record));
  }

  {
    std::lock_guard lock(mutex_);
    stats_.records_skipped += skipped;
    stats_.records_duplicate += duplicates;
  }

  if (events.empty()) {
    return EngineState::kReading;
  }

  if (!PublishBatch(events)) {
    return EngineState::kClosing;
  }

  last_emitted_ = last;
  {
    std::lock_guard lock(mutex_);
    stats_.records_emitted += events.size();
    stats_.batches_published += 1;
    stats_.last_record_number = last;
  }

  if (!SaveCheckpoint()) {
    Fail("checkpoint save failed");
    return EngineState::kClosing;
  }
  return EngineState::kReading;
}

EngineState TailingEngine::OnWaiting() {
  return WaitForStop(options_.poll_interval) ? EngineState::kClosing : EngineState::kReading;
}

EngineState TailingEngine::OnRecovering() {
  if (StopRequested()) {
    return EngineState::kClosing;
  }

  const std::uint32_t previous_number   = last_emitted_;
  const std::uint64_t previous_creation = log_creation_us_;

  session_.reset();
  if (!OpenSession(0)) {
    ++attempts_;
    if (attempts_ >= options_.open_retry.max_attempts) {
      Fail("session reopen failed after " + std::to_string(attempts_) + " attempts");
      return EngineState::kClosing;
    }
    return BackOff(attempts_) ? EngineState::kRecovering : EngineState::kClosing;
  }
  attempts_ = 0;

  model::Discontinuity marker;
  marker.provider                 = options_.provider;
  marker.last_record_number       = previous_number;
  marker.previous_log_creation_us = previous_creation;
  marker.log_creation_us          = session_->LogCreationMicros();
  marker.reason                   = recovery_reason_;
  marker.detected_at              = util::Now();

  EVENTSHIP_LOG_WARN("Log discontinuity, restarting from the first record",
                     {StringField("provider", options_.provider), IntField("last_record", previous_number),
                      StringField("reason", recovery_reason_)});

  if (!PublishMarker(marker)) {
    return EngineState::kClosing;
  }

  last_emitted_    = 0;
  log_creation_us_ = marker.log_creation_us;
  {
    std::lock_guard lock(mutex_);
    stats_.recoveries += 1;
    stats_.last_record_number = 0;
  }

  if (!SaveCheckpoint()) {
    Fail("checkpoint save failed");
    return EngineState::kClosing;
  }
  return EngineState::kReading;
}

EngineState TailingEngine::OnClosing() {
  if (loaded_ && log_creation_us_ != 0 && !FatalError()) {
    if (!SaveCheckpoint()) {
      Fail("checkpoint save failed at shutdown");
    }
  }

  if (session_) {
    session_->Close();
    session_.reset();
  }
  if (resolver_) {
    resolver_->ReleaseCache();
    resolver_.reset();
  }

  loaded_   = false;
  attempts_ = 0;
  return EngineState::kIdle;
}

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------

bool TailingEngine::LoadCheckpoint() {
  last_emitted_    = 0;
  log_creation_us_ = 0;

  if (options_.resume == ResumePolicy::kStart) {
    EVENTSHIP_LOG_INFO("Reading from the first record", {StringField("provider", options_.provider)});
    loaded_ = true;
    return true;
  }

  std::optional<checkpoint::Checkpoint> checkpoint;
  auto                                  result = store_->Load(options_.provider, &checkpoint);
  if (!result) {
    {
      std::lock_guard lock(mutex_);
      stats_.open_failures += 1;
    }
    EVENTSHIP_LOG_WARN("Checkpoint load failed", {StringField("provider", options_.provider),
                                                  StringField("code", util::ErrorCodeName(result.code)),
                                                  StringField("error", result.message)});
    return false;
  }

  loaded_ = true;
  if (checkpoint) {
    last_emitted_    = checkpoint->last_record_number;
    log_creation_us_ = checkpoint->log_creation_us;
    EVENTSHIP_LOG_INFO("Resuming from checkpoint", {StringField("provider", options_.provider), IntField("last_record", last_emitted_)});
  }
  return true;
}

bool TailingEngine::SaveCheckpoint() {
  checkpoint::Checkpoint checkpoint{options_.provider, last_emitted_, log_creation_us_};
  auto                   result = store_->Save(checkpoint);
  if (!result) {
    EVENTSHIP_LOG_ERROR("Checkpoint save failed", {StringField("provider", options_.provider),
                                                   StringField("code", util::ErrorCodeName(result.code)),
                                                   StringField("error", result.message)});
    return false;
  }
  return true;
}

bool TailingEngine::OpenSession(std::uint32_t resume_after) {
  resolver_ = std::make_unique<message::MessageResolver>(options_.language_id);

  auto opened = session::Session::Open(*host_, options_.provider, resume_after, options_.batch);
  if (!opened) {
    {
      std::lock_guard lock(mutex_);
      stats_.open_failures += 1;
    }
    EVENTSHIP_LOG_WARN("Session open failed", {StringField("provider", options_.provider),
                                               StringField("error", session::OpenErrorName(opened.error)),
                                               StringField("message", opened.message)});
    return false;
  }

  session_ = std::move(opened.session);
  return true;
}

bool TailingEngine::BackOff(std::uint32_t attempt) {
  auto delay = options_.open_retry.initial_backoff;
  for (std::uint32_t i = 1; i < attempt && delay < options_.open_retry.max_backoff; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, options_.open_retry.max_backoff);
  return !WaitForStop(delay);
}

bool TailingEngine::PublishBatch(const std::vector<model::Event>& events) {
  for (std::uint32_t attempt = 1;; ++attempt) {
    bool accepted = false;
    try {
      accepted = publisher_->Publish(events);
    } catch (const std::exception& e) {
      EVENTSHIP_LOG_WARN("Publisher threw", {StringField("provider", options_.provider), StringField("error", e.what())});
    }
    if (accepted) {
      return true;
    }

    {
      std::lock_guard lock(mutex_);
      stats_.publish_refusals += 1;
    }
    EVENTSHIP_LOG_WARN("Publisher refused batch", {StringField("provider", options_.provider), IntField("attempt", attempt),
                                                   IntField("first_record", events.front().record_number)});
    if (!BackOff(attempt)) {
      return false;
    }
  }
}

bool TailingEngine::PublishMarker(const model::Discontinuity& marker) {
  for (std::uint32_t attempt = 1;; ++attempt) {
    bool accepted = false;
    try {
      accepted = publisher_->PublishDiscontinuity(marker);
    } catch (const std::exception& e) {
      EVENTSHIP_LOG_WARN("Publisher threw", {StringField("provider", options_.provider), StringField("error", e.what())});
    }
    if (accepted) {
      return true;
    }

    {
      std::lock_guard lock(mutex_);
      stats_.publish_refusals += 1;
    }
    if (!BackOff(attempt)) {
      return false;
    }
  }
}

model::Event BuildEvent(message::MessageResolver& resolver, const std::optional<host::ProviderRegistration>& registration,
                        const std::string& provider, const record::Record& record) {
  const host::SourceRegistration* source = registration ? registration->FindSource(record.source_name) : nullptr;

  model::Event event;
  event.provider       = provider;
  event.record_number  = record.record_number;
  event.event_id       = record.EventId();
  event.event_type     = record.event_type;
  event.category       = record.event_category;
  event.source_name    = record.source_name;
  event.computer_name  = record.computer_name;
  event.time_generated = record.time_generated;
  event.time_written   = record.time_written;
  event.raw_data       = record.raw_data;

  if (source) {
    event.parameters    = resolver.ExpandParameterInserts(source->parameter_message_files, record.parameters);
    event.category_text = resolver.ResolveCategory(source->category_message_files, record.event_category);
  } else {
    event.parameters = record.parameters;
  }

  auto resolution  = resolver.Resolve(source ? source->event_message_files : message::MessageFileSet{}, record.source_name,
                                      record.event_code, record.qualifier, event.parameters);
  event.resolution = resolution.status;
  if (resolution.status == message::ResolutionStatus::kFallback) {
    // fallback text lists the inserts as the record carried them
    event.message = message::FallbackMessage(record.event_code, record.source_name, record.parameters);
  } else {
    event.message = std::move(resolution.text);
  }
  return event;
}

} // namespace eventship::tailing
