#include "internal/tailing/tailing_engine.hpp"

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <thread>

#include "internal/checkpoint/memory_checkpoint_store.hpp"
#include "internal/host/log_file.hpp"
#include "internal/host/log_writer.hpp"
#include "internal/host/registry.hpp"
#include "internal/util/byte_order.hpp"
#include "tests/common/test_host.hpp"

namespace {

using eventship::checkpoint::Checkpoint;
using eventship::checkpoint::MemoryCheckpointStore;
using eventship::host::LogWriter;
using eventship::message::ResolutionStatus;
using eventship::model::CanTransition;
using eventship::model::EngineState;
using eventship::tailing::EngineOptions;
using eventship::tailing::ResumePolicy;
using eventship::tailing::TailingEngine;
using eventship::testing::RecordingPublisher;
using eventship::testing::StoredCheckpoint;
using eventship::testing::TestHost;

struct Fixture {
  explicit Fixture(const std::string& name) : env(name) {
    env.Install("Payroll", "Batch", env.WriteEventCreateMessages());
  }

  static EngineOptions Options(const std::string& provider = "Payroll") {
    EngineOptions options;
    options.provider                   = provider;
    options.batch.max_records          = 4;
    options.poll_interval              = std::chrono::milliseconds(5);
    options.open_retry.max_attempts    = 2;
    options.open_retry.initial_backoff = std::chrono::milliseconds(1);
    options.open_retry.max_backoff     = std::chrono::milliseconds(4);
    return options;
  }

  std::unique_ptr<TailingEngine> Engine(EngineOptions options = Options()) {
    return std::make_unique<TailingEngine>(env.host(), store, publisher, std::move(options));
  }

  void Write(int n, int first_id = 1) {
    LogWriter writer(*env.host(), "Batch");
    for (int i = 0; i < n; ++i) {
      assert(writer.Info(static_cast<std::uint32_t>(first_id + i), "event " + std::to_string(first_id + i)));
    }
  }

  std::uint64_t Creation() const {
    eventship::host::LogFile file(env.log_dir() / "Payroll.evt", eventship::host::LogFile::Mode::kRead);
    auto                     lock = file.LockShared();
    return file.ReadHeader()->creation_time_us;
  }

  TestHost                               env;
  std::shared_ptr<MemoryCheckpointStore> store     = std::make_shared<MemoryCheckpointStore>();
  std::shared_ptr<RecordingPublisher>    publisher = std::make_shared<RecordingPublisher>();
};

// Steps until `done` holds, failing after `max_steps`.
void StepUntil(TailingEngine& engine, const std::function<bool()>& done, int max_steps = 200) {
  for (int i = 0; i < max_steps; ++i) {
    if (done()) {
      return;
    }
    engine.Step();
  }
  assert(done());
}

void StepUntilState(TailingEngine& engine, EngineState state) {
  StepUntil(engine, [&] { return engine.State() == state; });
}

void TestTransitions() {
  assert(CanTransition(EngineState::kIdle, EngineState::kOpening));
  assert(CanTransition(EngineState::kReading, EngineState::kWaiting));
  assert(CanTransition(EngineState::kWaiting, EngineState::kRecovering));
  assert(CanTransition(EngineState::kOpening, EngineState::kRecovering));
  assert(CanTransition(EngineState::kRecovering, EngineState::kClosing));
  assert(CanTransition(EngineState::kClosing, EngineState::kIdle));
  assert(!CanTransition(EngineState::kIdle, EngineState::kReading));
  assert(!CanTransition(EngineState::kWaiting, EngineState::kOpening));
  assert(!CanTransition(EngineState::kIdle, EngineState::kClosing));
}

void TestEmitsInOrderAndCheckpoints() {
  Fixture f("engine_emit");
  f.Write(10);

  auto engine = f.Engine();
  assert(engine->State() == EngineState::kIdle);
  StepUntilState(*engine, EngineState::kWaiting);

  auto events = f.publisher->events();
  assert(events.size() == 10);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].record_number == i + 1);
    assert(events[i].provider == "Payroll");
    assert(events[i].resolution == ResolutionStatus::kResolved);
    assert(events[i].message == "event " + std::to_string(i + 1));
  }
  // batches of at most four
  assert(f.publisher->batches() == 3);

  auto checkpoint = StoredCheckpoint(*f.store, "Payroll");
  assert(checkpoint && checkpoint->last_record_number == 10);
  assert(checkpoint->log_creation_us == f.Creation());

  auto stats = engine->Stats();
  assert(stats.records_emitted == 10);
  assert(stats.batches_published == 3);
  assert(stats.last_record_number == 10);

  // tailing picks up new records after a wait
  f.Write(2, 11);
  StepUntil(*engine, [&] { return f.publisher->events().size() == 12; });
  assert(f.publisher->events().back().record_number == 12);

  engine->RequestStop();
  StepUntilState(*engine, EngineState::kIdle);
  assert(StoredCheckpoint(*f.store, "Payroll")->last_record_number == 12);
  assert(!engine->FatalError());
}

void TestResumesAfterCheckpoint() {
  Fixture f("engine_resume");
  f.Write(6);
  assert(f.store->Save({"Payroll", 4, f.Creation()}));

  auto engine = f.Engine();
  StepUntilState(*engine, EngineState::kWaiting);

  auto events = f.publisher->events();
  assert(events.size() == 2);
  assert(events[0].record_number == 5 && events[1].record_number == 6);
  assert(f.publisher->markers().empty());
}

void TestStartPolicyIgnoresCheckpoint() {
  Fixture f("engine_start_policy");
  f.Write(3);
  assert(f.store->Save({"Payroll", 3, f.Creation()}));

  auto options   = Fixture::Options();
  options.resume = ResumePolicy::kStart;
  auto engine    = f.Engine(options);
  StepUntilState(*engine, EngineState::kWaiting);
  assert(f.publisher->events().size() == 3);
}

void TestClearTriggersRecovery() {
  Fixture f("engine_clear");
  f.Write(5);

  auto engine = f.Engine();
  StepUntilState(*engine, EngineState::kWaiting);
  const auto old_creation = f.Creation();

  assert(f.env.host()->ClearLog("Payroll", std::nullopt));
  f.Write(2, 100);

  StepUntil(*engine, [&] { return f.publisher->events().size() == 7; });

  auto markers = f.publisher->markers();
  assert(markers.size() == 1);
  assert(markers[0].provider == "Payroll");
  assert(markers[0].last_record_number == 5);
  assert(markers[0].previous_log_creation_us == old_creation);
  assert(markers[0].log_creation_us == f.Creation());

  auto events = f.publisher->events();
  assert(events[5].record_number == 1 && events[6].record_number == 2);
  assert(events[5].message == "event 100");

  assert(engine->Stats().recoveries == 1);
  auto checkpoint = StoredCheckpoint(*f.store, "Payroll");
  assert(checkpoint->last_record_number == 2);
  assert(checkpoint->log_creation_us == f.Creation());
}

void TestStaleCheckpointRecoversInsteadOfWaiting() {
  Fixture f("engine_stale");
  f.Write(3);
  // same log lifetime, but a number the log never reached
  assert(f.store->Save({"Payroll", 500, f.Creation()}));

  auto engine = f.Engine();
  engine->Step(); // idle -> opening
  engine->Step(); // opening -> reading
  assert(engine->State() == EngineState::kReading);
  engine->Step();
  assert(engine->State() == EngineState::kRecovering);

  StepUntilState(*engine, EngineState::kWaiting);
  assert(f.publisher->markers().size() == 1);
  assert(f.publisher->markers()[0].last_record_number == 500);
  assert(f.publisher->events().size() == 3);
  assert(f.publisher->events()[0].record_number == 1);
}

void TestCheckpointFromEarlierLifetimeRecoversAtOpen() {
  Fixture f("engine_old_lifetime");
  f.Write(2);
  assert(f.store->Save({"Payroll", 1, f.Creation() - 1}));

  auto engine = f.Engine();
  engine->Step();
  engine->Step();
  assert(engine->State() == EngineState::kRecovering);

  StepUntilState(*engine, EngineState::kWaiting);
  assert(f.publisher->events().size() == 2);
  assert(f.publisher->markers().size() == 1);
}

void TestRefusedBatchIsRetriedBeforeCheckpoint() {
  Fixture f("engine_refused");
  f.Write(3);
  f.publisher->RefuseNext(2);

  auto engine = f.Engine();
  StepUntilState(*engine, EngineState::kWaiting);

  assert(f.publisher->calls() == 3);
  assert(f.publisher->events().size() == 3);
  assert(engine->Stats().publish_refusals == 2);
  assert(StoredCheckpoint(*f.store, "Payroll")->last_record_number == 3);
}

void TestStopWhileRefusedKeepsCheckpoint() {
  Fixture f("engine_refused_stop");
  f.Write(3);
  assert(f.store->Save({"Payroll", 1, f.Creation()}));
  f.publisher->RefuseNext(1000000);

  auto options                       = Fixture::Options();
  options.open_retry.initial_backoff = std::chrono::milliseconds(2);
  auto engine                        = f.Engine(options);
  engine->Start();
  while (f.publisher->calls() < 3) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  engine->Stop();

  assert(engine->State() == EngineState::kIdle);
  assert(f.publisher->events().empty());
  assert(StoredCheckpoint(*f.store, "Payroll")->last_record_number == 1);
}

void TestCorruptRecordIsSkippedAndCounted() {
  Fixture f("engine_corrupt");
  f.Write(3);
  {
    eventship::host::LogFile file(f.env.log_dir() / "Payroll.evt", eventship::host::LogFile::Mode::kReadWrite);
    auto                     lock   = file.LockExclusive();
    auto                     header = file.ReadHeader();
    const auto               first  = file.ReadAt(header->start_offset, 4);
    const std::uint32_t      len    = eventship::util::LoadLE32(first.data());
    std::vector<std::uint8_t> junk(4, 0xEE);
    file.WriteAt(header->start_offset + len - 4, junk);
  }

  auto engine = f.Engine();
  StepUntilState(*engine, EngineState::kWaiting);

  auto events = f.publisher->events();
  assert(events.size() == 2);
  assert(events[0].record_number == 2);
  assert(engine->Stats().records_skipped == 1);
}

void TestUnknownProviderReadsDefaultLogWithFallback() {
  Fixture f("engine_default_log");
  {
    LogWriter writer(*f.env.host(), "Loose Source");
    assert(writer.Info(42, "loose"));
  }

  auto engine = f.Engine(Fixture::Options("Not Registered"));
  StepUntilState(*engine, EngineState::kWaiting);

  auto events = f.publisher->events();
  assert(events.size() == 1);
  assert(events[0].provider == "Not Registered");
  assert(events[0].source_name == "Loose Source");
  assert(events[0].resolution == ResolutionStatus::kFallback);
  assert(events[0].message.find("loose") != std::string::npos);
}

void TestFallbackKeepsRecordInserts() {
  TestHost   env("engine_fallback_inserts");
  const auto params = env.WriteMessages("params.msg", {{1500, "Access Denied"}});
  const auto events = env.WriteMessages("events.msg", {{1, "known %1"}});
  env.Install("Security", "Auditor", events, params);

  auto registration = eventship::host::Registry(env.registry_dir()).FindProvider("Security");
  assert(registration);

  eventship::record::Record record;
  record.source_name = "Auditor";
  record.parameters  = {"%%1500", "bob"};

  eventship::message::MessageResolver resolver;

  record.event_code = 4625;
  auto unknown      = eventship::tailing::BuildEvent(resolver, registration, "Security", record);
  assert(unknown.resolution == ResolutionStatus::kFallback);
  assert(unknown.message == eventship::message::FallbackMessage(4625, "Auditor", {"%%1500", "bob"}));
  assert(unknown.message.find("Access Denied") == std::string::npos);
  assert(unknown.parameters[0] == "Access Denied");

  record.event_code = 1;
  auto known        = eventship::tailing::BuildEvent(resolver, registration, "Security", record);
  assert(known.resolution == ResolutionStatus::kResolved);
  assert(known.message == "known Access Denied");
}

void TestOpenFailureBecomesFatal() {
  Fixture f("engine_open_fatal");
  auto    engine = f.Engine(Fixture::Options("bad/name"));
  engine->Run();

  assert(engine->State() == EngineState::kIdle);
  assert(engine->FatalError());
  assert(engine->Stats().open_failures == 2);
}

class FailingStore final : public eventship::checkpoint::CheckpointStore {
 public:
  eventship::util::Result Load(std::string_view, std::optional<Checkpoint>* out) override {
    out->reset();
    return eventship::util::Result::Ok();
  }
  eventship::util::Result Save(const Checkpoint&) override {
    return eventship::util::Result::Err(eventship::util::ErrorCode::IOError, "disk full");
  }
};

void TestCheckpointSaveFailureIsFatal() {
  Fixture f("engine_save_fatal");
  f.Write(2);

  TailingEngine engine(f.env.host(), std::make_shared<FailingStore>(), f.publisher, Fixture::Options());
  engine.Run();

  assert(engine.FatalError());
  // the batch went out before the save failed; nothing after it
  assert(f.publisher->events().size() == 2);
  assert(f.publisher->batches() == 1);
}

// Memory store whose first `failures` loads report a read error.
class UnreadableStore final : public eventship::checkpoint::CheckpointStore {
 public:
  explicit UnreadableStore(int failures) : failures_(failures) {
  }

  eventship::util::Result Load(std::string_view provider, std::optional<Checkpoint>* out) override {
    ++loads_;
    if (failures_ > 0) {
      --failures_;
      return eventship::util::Result::Err(eventship::util::ErrorCode::IOError, "database is locked");
    }
    return inner_.Load(provider, out);
  }

  eventship::util::Result Save(const Checkpoint& checkpoint) override {
    return inner_.Save(checkpoint);
  }

  int loads() const {
    return loads_;
  }

 private:
  MemoryCheckpointStore inner_;
  int                   failures_ = 0;
  int                   loads_    = 0;
};

void TestCheckpointReadErrorIsRetriedWithoutReplay() {
  Fixture f("engine_load_retry");
  f.Write(5);

  auto store = std::make_shared<UnreadableStore>(1);
  assert(store->Save({"Payroll", 3, f.Creation()}));

  auto options                    = Fixture::Options();
  options.open_retry.max_attempts = 3;
  TailingEngine engine(f.env.host(), store, f.publisher, options);
  StepUntilState(engine, EngineState::kWaiting);

  assert(!engine.FatalError());
  assert(store->loads() == 2);
  assert(engine.Stats().open_failures == 1);

  // nothing at or below the stored record number goes out again
  auto events = f.publisher->events();
  assert(events.size() == 2);
  assert(events[0].record_number == 4);
  assert(events[1].record_number == 5);
  assert(f.publisher->markers().empty());
}

void TestCheckpointReadErrorBecomesFatal() {
  Fixture f("engine_load_fatal");
  f.Write(2);

  auto          store = std::make_shared<UnreadableStore>(100);
  TailingEngine engine(f.env.host(), store, f.publisher, Fixture::Options());
  engine.Run();

  assert(engine.FatalError());
  assert(engine.FatalError()->find("checkpoint load") != std::string::npos);
  assert(store->loads() == 2);
  assert(f.publisher->events().empty());
}

void TestStopDuringWaitFlushesCheckpoint() {
  Fixture f("engine_stop_wait");
  f.Write(2);

  auto options          = Fixture::Options();
  options.poll_interval = std::chrono::seconds(30);
  auto engine           = f.Engine(options);
  engine->Start();
  while (f.publisher->events().size() < 2) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  const auto started = std::chrono::steady_clock::now();
  engine->Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
  assert(engine->State() == EngineState::kIdle);
  assert(StoredCheckpoint(*f.store, "Payroll")->last_record_number == 2);
}

} // namespace

int main() {
  TestTransitions();
  TestEmitsInOrderAndCheckpoints();
  TestResumesAfterCheckpoint();
  TestStartPolicyIgnoresCheckpoint();
  TestClearTriggersRecovery();
  TestStaleCheckpointRecoversInsteadOfWaiting();
  TestCheckpointFromEarlierLifetimeRecoversAtOpen();
  TestRefusedBatchIsRetriedBeforeCheckpoint();
  TestStopWhileRefusedKeepsCheckpoint();
  TestCorruptRecordIsSkippedAndCounted();
  TestUnknownProviderReadsDefaultLogWithFallback();
  TestFallbackKeepsRecordInserts();
  TestOpenFailureBecomesFatal();
  TestCheckpointSaveFailureIsFatal();
  TestCheckpointReadErrorIsRetriedWithoutReplay();
  TestCheckpointReadErrorBecomesFatal();
  TestStopDuringWaitFlushesCheckpoint();

  std::cout << "eventship_unit_tailing_engine: pass\n";
  return 0;
}
