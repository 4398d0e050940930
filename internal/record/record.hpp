#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace eventship::record {

/*
  Severity of a log record. Values match the host log's on-disk encoding.
*/
enum class EventType : std::uint16_t {
  kSuccess      = 0x0000,
  kError        = 0x0001,
  kWarning      = 0x0002,
  kInformation  = 0x0004,
  kAuditSuccess = 0x0008,
  kAuditFailure = 0x0010,
};

const char* EventTypeName(EventType type);

constexpr std::uint32_t MakeEventId(std::uint16_t qualifier, std::uint16_t event_code) {
  return (static_cast<std::uint32_t>(qualifier) << 16) | event_code;
}

constexpr std::uint16_t EventCodeOf(std::uint32_t event_id) {
  return static_cast<std::uint16_t>(event_id & 0xFFFF);
}

constexpr std::uint16_t QualifierOf(std::uint32_t event_id) {
  return static_cast<std::uint16_t>(event_id >> 16);
}

/*
  One decoded entry of a host log.

  record_number is assigned by the log, strictly increasing within one log
  lifetime and restarting at 1 after a clear.
*/
struct Record {
  std::uint32_t record_number = 0;
  std::uint16_t event_code    = 0;
  std::uint16_t qualifier     = 0;
  EventType     event_type    = EventType::kInformation;
  std::uint16_t event_category = 0;

  std::string source_name;
  std::string computer_name;

  util::TimePoint time_generated;
  util::TimePoint time_written;

  std::vector<std::string>  parameters;
  std::vector<std::uint8_t> user_sid;
  std::vector<std::uint8_t> raw_data;

  std::uint32_t EventId() const {
    return MakeEventId(qualifier, event_code);
  }
};

} // namespace eventship::record
