#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "eventship/v1/event.pb.h"
#include "internal/checkpoint/memory_checkpoint_store.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/host/log_writer.hpp"
#include "internal/message/message_resolver.hpp"
#include "internal/record/record_codec.hpp"
#include "internal/runtime/shipper.hpp"
#include "internal/session/session.hpp"
#include "internal/tailing/tailing_engine.hpp"
#include "tests/common/test_host.hpp"

namespace {

using eventship::host::LogWriter;
using eventship::message::MessageResolver;
using eventship::record::EventType;
using eventship::session::Session;
using eventship::testing::TestHost;

constexpr char kProvider[] = "Eventship";
constexpr char kSource[]   = "Integration Test";

constexpr std::uint32_t kServiceStateChanged = 1073748860u; // qualifiers 16384, id 7036

const std::map<std::uint32_t, std::pair<EventType, std::string>> kMessages = {
    {1, {EventType::kInformation, "Hmmmm."}},
    {2, {EventType::kSuccess, "I am so blue I'm greener than purple."}},
    {3, {EventType::kWarning, "I stepped on a Corn Flake, now I'm a Cereal Killer."}},
    {4, {EventType::kError, "The quick brown fox jumps over the lazy dog."}},
    {5, {EventType::kAuditSuccess, "Where do random thoughts come from?"}},
    {6, {EventType::kAuditFailure, "Login failure for user xyz!"}},
};

/*
  Registers the test source with message files referenced through an
  environment variable, the way system registrations reference
  %SystemRoot%.
*/
class Installed {
 public:
  Installed(const std::string& name, const std::string& event_files) : env_(name) {
    env_.WriteEventCreateMessages();
    env_.WriteMessages("services.msg", {{kServiceStateChanged, "The %1 service entered the %2 state.%n"}});
    ::setenv("EVENTSHIP_MESSAGE_DIR", env_.message_dir().c_str(), 1);
    env_.Install(kProvider, kSource, event_files);
  }

  ~Installed() {
    (void)env_.host()->ClearLog(kProvider, std::nullopt);
    env_.Uninstall(kProvider);
  }

  TestHost& env() {
    return env_;
  }

 private:
  TestHost env_;
};

const std::string kEventCreate = "%EVENTSHIP_MESSAGE_DIR%/eventcreate.msg";
const std::string kServices    = "%EVENTSHIP_MESSAGE_DIR%/services.msg";

std::vector<eventship::model::Event> ReadAll(const TestHost& env, const std::string& provider) {
  auto opened = Session::Open(*env.host(), provider, 0);
  assert(opened);

  MessageResolver                      resolver;
  std::vector<eventship::model::Event> events;
  for (;;) {
    auto batch = opened.session->ReadBatch();
    assert(batch);
    if (batch.records.empty()) {
      break;
    }
    for (const auto& raw : batch.records) {
      eventship::record::Record record;
      assert(eventship::record::DecodeRecord(raw.bytes, &record));
      events.push_back(eventship::tailing::BuildEvent(resolver, opened.session->registration(), provider, record));
    }
  }
  opened.session->Close();
  return events;
}

void TestReadAllEventTypes() {
  Installed installed("it_read", kEventCreate);
  auto&     env = installed.env();

  {
    LogWriter writer(*env.host(), kSource);
    for (const auto& [id, message] : kMessages) {
      assert(writer.Report(message.first, id, {message.second}));
    }
  }

  auto events = ReadAll(env, kProvider);
  assert(events.size() == kMessages.size());
  for (const auto& event : events) {
    auto it = kMessages.find(event.event_id);
    assert(it != kMessages.end());
    assert(event.event_type == it->second.first);
    assert(event.message == it->second.second);
    assert(event.source_name == kSource);
  }

  std::uint32_t count = 0;
  assert(env.host()->RecordCount(kProvider, &count));
  assert(count == kMessages.size());
}

void TestReadUnknownEventId() {
  Installed installed("it_unknown_id", kServices);
  auto&     env = installed.env();
  {
    LogWriter writer(*env.host(), kSource);
    assert(writer.Success(1000, "Test Message"));
  }

  auto events = ReadAll(env, kProvider);
  assert(events.size() == 1);
  assert(events[0].event_id == 1000);
  assert(events[0].resolution == eventship::message::ResolutionStatus::kFallback);
  assert(events[0].message == eventship::message::FallbackMessage(1000, kSource, {"Test Message"}));
}

void TestReadTriesMultipleEventMessageFiles() {
  Installed installed("it_multi_files", kServices + ";" + kEventCreate);
  auto&     env = installed.env();
  {
    LogWriter writer(*env.host(), kSource);
    assert(writer.Success(1000, "Test Message"));
  }

  auto events = ReadAll(env, kProvider);
  assert(events.size() == 1);
  assert(events[0].event_id == 1000);
  assert(events[0].message == "Test Message");
}

void TestReadMultiParameterMessage() {
  Installed installed("it_multi_param", kServices);
  auto&     env = installed.env();
  {
    LogWriter writer(*env.host(), kSource);
    assert(writer.Report(EventType::kInformation, kServiceStateChanged, {"Windows Update", "running"}));
  }

  auto events = ReadAll(env, kProvider);
  assert(events.size() == 1);
  assert(events[0].event_id == kServiceStateChanged);
  assert(events[0].message == "The Windows Update service entered the running state.");
  assert(eventship::model::ToString(events[0]) ==
         "EventID=1073748860 Type=Information Source=Integration Test Message=The Windows Update service entered the running state.");
}

void TestOpenInvalidProviderReadsApplication() {
  TestHost env("it_invalid_provider");
  auto     opened = Session::Open(*env.host(), "nonExistentProvider", 0);
  assert(opened);
  assert(opened.session->UsedDefaultLog());
  auto batch = opened.session->ReadBatch();
  assert(batch);
}

void TestClearResumesFromStart() {
  Installed installed("it_clear", kEventCreate);
  auto&     env       = installed.env();
  auto      store     = std::make_shared<eventship::checkpoint::MemoryCheckpointStore>();
  auto      publisher = std::make_shared<eventship::testing::RecordingPublisher>();

  eventship::tailing::EngineOptions options;
  options.provider      = kProvider;
  options.poll_interval = std::chrono::milliseconds(5);

  {
    LogWriter writer(*env.host(), kSource);
    for (std::uint32_t id = 1; id <= 5; ++id) {
      assert(writer.Info(id, "before " + std::to_string(id)));
    }
  }

  {
    eventship::tailing::TailingEngine engine(env.host(), store, publisher, options);
    engine.Start();
    while (publisher->events().size() < 5) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    engine.Stop();
  }
  assert(eventship::testing::StoredCheckpoint(*store, kProvider)->last_record_number == 5);

  // cleared while nobody is reading; the stale checkpoint must not stall the next run
  assert(env.host()->ClearLog(kProvider, env.root() / "before-clear.evt"));
  {
    LogWriter writer(*env.host(), kSource);
    assert(writer.Info(7, "after"));
  }

  {
    eventship::tailing::TailingEngine engine(env.host(), store, publisher, options);
    engine.Start();
    while (publisher->events().size() < 6) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    engine.Stop();
    assert(engine.Stats().recoveries == 1);
  }

  auto events = publisher->events();
  assert(events[5].record_number == 1);
  assert(events[5].message == "after");
  assert(publisher->markers().size() == 1);
  assert(publisher->markers()[0].last_record_number == 5);
}

void TestDaemonPipelineWritesJsonLines() {
  Installed installed("it_daemon", kServices);
  auto&     env    = installed.env();
  auto      output = env.root() / "events.jsonl";

  auto config = eventship::config::ConfigLoader::ParseYaml("host:\n  registry_dir: \"" + env.registry_dir().string() +
                                                           "\"\n  log_dir: \"" + env.log_dir().string() +
                                                           "\"\ncheckpoint:\n  sqlite:\n    path: \"" + (env.root() / "cp.sqlite").string() +
                                                           "\"\noutput:\n  path: \"" + output.string() +
                                                           "\"\nproviders:\n  - name: " + kProvider + "\n    poll_interval: \"0.01s\"\n");

  {
    LogWriter writer(*env.host(), kSource);
    assert(writer.Report(EventType::kInformation, kServiceStateChanged, {"Windows Update", "running"}));
    assert(writer.Report(EventType::kInformation, kServiceStateChanged, {"Print Spooler", "stopped"}));
  }

  {
    auto app = eventship::factory::Build(config);
    app.shipper->Start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    while (app.shipper->engines()[0]->Stats().records_emitted < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    app.shipper->Stop();
    assert(app.shipper->Failures().empty());
  }

  std::ifstream             in(output);
  std::string               line;
  std::vector<std::string>  messages;
  while (std::getline(in, line)) {
    eventship::v1::StreamItem item;
    auto                      status = google::protobuf::util::JsonStringToMessage(line, &item);
    assert(status.ok());
    assert(item.has_event());
    assert(item.event().event_type() == eventship::v1::EVENT_TYPE_INFORMATION);
    messages.push_back(item.event().message());
  }
  assert(messages.size() == 2);
  assert(messages[1] == "The Print Spooler service entered the stopped state.");

  // a restart resumes from the sqlite checkpoint and emits nothing twice
  {
    auto app = eventship::factory::Build(config);
    app.shipper->Start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    app.shipper->Stop();
    assert(app.shipper->engines()[0]->Stats().records_emitted == 0);
  }
}

} // namespace

int main() {
  TestReadAllEventTypes();
  TestReadUnknownEventId();
  TestReadTriesMultipleEventMessageFiles();
  TestReadMultiParameterMessage();
  TestOpenInvalidProviderReadsApplication();
  TestClearResumesFromStart();
  TestDaemonPipelineWritesJsonLines();

  std::cout << "eventship_integration_eventlog: pass\n";
  return 0;
}
