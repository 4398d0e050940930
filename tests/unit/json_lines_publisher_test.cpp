#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "eventship/v1/event.pb.h"
#include "internal/publish/json_lines_publisher.hpp"
#include "internal/util/errors.hpp"

namespace {

using eventship::publish::JsonLinesPublisher;

std::vector<eventship::v1::StreamItem> ParseLines(const std::string& text) {
  std::vector<eventship::v1::StreamItem> items;
  std::istringstream                     in(text);
  std::string                            line;
  while (std::getline(in, line)) {
    eventship::v1::StreamItem item;
    auto                      status = google::protobuf::util::JsonStringToMessage(line, &item);
    assert(status.ok());
    items.push_back(item);
  }
  return items;
}

eventship::model::Event MakeEvent(std::uint32_t number) {
  eventship::model::Event event;
  event.provider       = "System";
  event.record_number  = number;
  event.event_id       = 7036;
  event.event_type     = eventship::record::EventType::kWarning;
  event.source_name    = "Service Control Manager";
  event.computer_name  = "host-1";
  event.time_generated = eventship::util::FromUnixSeconds(1700000000);
  event.time_written   = eventship::util::FromUnixSeconds(1700000001);
  event.message        = "The Print Spooler service entered the stopped state.";
  event.resolution     = eventship::message::ResolutionStatus::kResolved;
  event.parameters     = {"Print Spooler", "stopped"};
  event.raw_data       = {0x01, 0xff};
  return event;
}

void TestEventsBecomeOneLineEach() {
  std::ostringstream out;
  JsonLinesPublisher publisher(out, false);

  assert(publisher.Publish({MakeEvent(1), MakeEvent(2)}));

  auto items = ParseLines(out.str());
  assert(items.size() == 2);
  const auto& event = items[1].event();
  assert(items[1].has_event());
  assert(event.record_number() == 2);
  assert(event.event_type() == eventship::v1::EVENT_TYPE_WARNING);
  assert(event.resolution() == eventship::v1::RESOLUTION_RESOLVED);
  assert(eventship::util::FromProto(event.time_written()) == eventship::util::FromUnixSeconds(1700000001));
  assert(event.parameters_size() == 2);
  assert(event.raw_data() == std::string("\x01\xff", 2));

  // field names stay snake_case on the wire
  assert(out.str().find("\"record_number\"") != std::string::npos);
}

void TestDiscontinuityMarker() {
  std::ostringstream out;
  JsonLinesPublisher publisher(out, true);

  eventship::model::Discontinuity marker;
  marker.provider                 = "Application";
  marker.last_record_number       = 42;
  marker.previous_log_creation_us = 100;
  marker.log_creation_us          = 200;
  marker.reason                   = "log cleared";
  marker.detected_at              = eventship::util::FromUnixSeconds(1700000100);
  assert(publisher.PublishDiscontinuity(marker));

  auto items = ParseLines(out.str());
  assert(items.size() == 1);
  assert(items[0].has_discontinuity());
  assert(items[0].discontinuity().last_record_number() == 42);
  assert(items[0].discontinuity().log_creation_us() == 200);
  assert(items[0].discontinuity().reason() == "log cleared");
}

void TestFailedStreamRefusesBatch() {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  JsonLinesPublisher publisher(out, false);
  assert(!publisher.Publish({MakeEvent(1)}));
}

void TestUnopenableOutputThrows() {
  bool threw = false;
  try {
    JsonLinesPublisher publisher("/nonexistent-dir/eventship/out.jsonl");
  } catch (const eventship::util::IoError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEventsBecomeOneLineEach();
  TestDiscontinuityMarker();
  TestFailedStreamRefusesBatch();
  TestUnopenableOutputThrows();

  std::cout << "eventship_unit_json_lines_publisher: pass\n";
  return 0;
}
