#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/event.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/session/session.hpp"

namespace eventship::host {
class LogHost;
}

namespace eventship::checkpoint {
class CheckpointStore;
}

namespace eventship::message {
class MessageResolver;
}

namespace eventship::publish {
class Publisher;
}

namespace eventship::record {
struct Record;
}

namespace eventship::tailing {

enum class ResumePolicy {
  kCheckpoint, // continue after the persisted checkpoint, else from the start
  kStart,      // ignore any persisted checkpoint
};

struct RetryPolicy {
  std::uint32_t             max_attempts    = 5;
  std::chrono::milliseconds initial_backoff = std::chrono::seconds(1);
  std::chrono::milliseconds max_backoff     = std::chrono::seconds(30);
};

struct EngineOptions {
  std::string               provider;
  ResumePolicy              resume = ResumePolicy::kCheckpoint;
  session::SessionOptions   batch;
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
  std::uint32_t             language_id   = 0;

  // Session opens. Publish retries reuse the backoff bounds without a cap on attempts.
  RetryPolicy open_retry;
};

struct EngineStats {
  std::uint64_t records_emitted   = 0;
  std::uint64_t records_skipped   = 0; // undecodable
  std::uint64_t records_duplicate = 0; // at or below the last emitted number
  std::uint64_t batches_published = 0;
  std::uint64_t publish_refusals  = 0;
  std::uint64_t open_failures     = 0;
  std::uint64_t recoveries        = 0;
  std::uint32_t last_record_number = 0;
};

/*
  Turns a decoded record into an event: parameter inserts expanded,
  category and message resolved through the source's registration. Sources
  without a registration get the fallback message.
*/
model::Event BuildEvent(message::MessageResolver& resolver, const std::optional<host::ProviderRegistration>& registration,
                        const std::string& provider, const record::Record& record);

/*
  Tails one provider's log: reads batches, resolves messages, publishes
  events, checkpoints.

  Events leave in strictly increasing record number order within one log
  lifetime. The checkpoint only advances after the publisher accepted the
  batch, so a restart may replay but never skip. Stop requests are honoured
  while waiting, while backing off and between batches.

  Step() drives the state machine on the caller's thread; Start() runs it on
  a worker thread until Stop() or a fatal error.
*/
class TailingEngine {
 public:
  TailingEngine(std::shared_ptr<const host::LogHost> host, std::shared_ptr<checkpoint::CheckpointStore> store,
                std::shared_ptr<publish::Publisher> publisher, EngineOptions options);
  ~TailingEngine();

  TailingEngine(const TailingEngine&)            = delete;
  TailingEngine& operator=(const TailingEngine&) = delete;

  void Start();
  void Stop();
  void RequestStop();

  // Runs until stopped or failed, leaving the engine Idle.
  void Run();

  // Executes the current state once and returns the next state.
  model::EngineState Step();

  model::EngineState State() const {
    return state_.load();
  }

  EngineStats Stats() const;

  // Set when the engine gave up; it stays Idle afterwards.
  std::optional<std::string> FatalError() const;

  const EngineOptions& options() const {
    return options_;
  }

 private:
  model::EngineState OnIdle();
  model::EngineState OnOpening();
  model::EngineState OnReading();
  model::EngineState OnWaiting();
  model::EngineState OnRecovering();
  model::EngineState OnClosing();

  void TransitionTo(model::EngineState next);

  bool LoadCheckpoint();
  bool SaveCheckpoint();
  bool OpenSession(std::uint32_t resume_after);
  bool BackOff(std::uint32_t attempt);
  bool PublishBatch(const std::vector<model::Event>& events);
  bool PublishMarker(const model::Discontinuity& marker);
  void Fail(std::string message);

  bool StopRequested() const;
  bool WaitForStop(std::chrono::milliseconds timeout);

  std::shared_ptr<const host::LogHost>         host_;
  std::shared_ptr<checkpoint::CheckpointStore> store_;
  std::shared_ptr<publish::Publisher>          publisher_;
  EngineOptions                                options_;

  std::unique_ptr<session::Session>          session_;
  std::unique_ptr<message::MessageResolver> resolver_;

  std::atomic<model::EngineState> state_{model::EngineState::kIdle};

  // resume position; owned by the engine thread
  bool          loaded_          = false;
  std::uint32_t last_emitted_    = 0;
  std::uint64_t log_creation_us_ = 0;
  std::uint32_t attempts_        = 0;
  std::string   recovery_reason_;

  mutable std::mutex         mutex_;
  std::condition_variable    stop_cv_;
  bool                       stop_requested_ = false;
  std::optional<std::string> fatal_;
  EngineStats                stats_;

  std::thread thread_;
};

} // namespace eventship::tailing
