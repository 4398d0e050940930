#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace eventship::util {

/*
  Time utilities. The clock source is chosen here only.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Record timestamps are whole seconds; log creation times are microseconds.
uint32_t  ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(uint32_t seconds);

uint64_t  ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(uint64_t micros);

} // namespace eventship::util
