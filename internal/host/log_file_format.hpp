#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace eventship::host {

/*
  Fixed header at the start of every log file.

     0  HeaderSize (64)        32  MaxSize (0 = unbounded)
     4  Signature "LfLe"       36  Reserved
     8  MajorVersion (1)       40  CreationTime (u64, microseconds)
    12  MinorVersion (1)       48  Reserved x 3
    16  StartOffset            60  EndHeaderSize (64)
    20  EndOffset
    24  NextRecordNumber
    28  OldestRecordNumber

  EndOffset only advances after the record bytes are on disk, so a reader
  holding the shared lock never observes a partial record. CreationTime
  identifies one lifetime of the log; a clear or rotation changes it.
*/

inline constexpr std::size_t   kLogHeaderSize     = 64;
inline constexpr std::uint32_t kLogSignature      = 0x654c664c; // "LfLe"
inline constexpr std::uint32_t kLogMajorVersion   = 1;
inline constexpr std::uint32_t kLogMinorVersion   = 1;

struct LogHeader {
  std::uint32_t start_offset         = kLogHeaderSize;
  std::uint32_t end_offset           = kLogHeaderSize;
  std::uint32_t next_record_number   = 1;
  std::uint32_t oldest_record_number = 1;
  std::uint32_t max_size             = 0;
  std::uint64_t creation_time_us     = 0;

  std::uint32_t RecordCount() const {
    return next_record_number - oldest_record_number;
  }

  // Newest record number, 0 when the log is empty.
  std::uint32_t NewestRecordNumber() const {
    return RecordCount() == 0 ? 0 : next_record_number - 1;
  }
};

std::vector<std::uint8_t> EncodeLogHeader(const LogHeader& header);

// nullopt when the bytes are not a valid version 1.1 header.
std::optional<LogHeader> DecodeLogHeader(std::span<const std::uint8_t> bytes);

} // namespace eventship::host
