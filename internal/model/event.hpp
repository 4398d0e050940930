#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/message/message_resolver.hpp"
#include "internal/record/record.hpp"
#include "internal/util/time.hpp"

namespace eventship::model {

/*
  A resolved log record, ready for the downstream pipeline.

  Built once by the tailing engine and never modified afterwards.
*/
struct Event {
  std::string   provider;
  std::uint32_t record_number = 0;
  std::uint32_t event_id      = 0;

  record::EventType event_type = record::EventType::kInformation;
  std::uint16_t     category   = 0;
  std::string       category_text;

  std::string source_name;
  std::string computer_name;

  util::TimePoint time_generated;
  util::TimePoint time_written;

  std::string               message;
  message::ResolutionStatus resolution = message::ResolutionStatus::kFallback;

  std::vector<std::string>  parameters;
  std::vector<std::uint8_t> raw_data;
};

/*
  Marker sent downstream when the log was cleared or rotated and reading
  restarted from the beginning. Numbering before and after it is unrelated.
*/
struct Discontinuity {
  std::string     provider;
  std::uint32_t   last_record_number = 0; // last number emitted before the break
  std::uint64_t   previous_log_creation_us = 0;
  std::uint64_t   log_creation_us = 0;
  std::string     reason;
  util::TimePoint detected_at;
};

// EventID=<id> Type=<type> Source=<name> Message=<text>
std::string ToString(const Event& event);

} // namespace eventship::model
