#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "internal/record/record.hpp"

namespace eventship::record {

/*
  Fixed-layout binary record, little endian, DWORD padded.

     0  Length               28 EventCategory u16
     4  Signature "LfLe"     30 ReservedFlags u16
     8  RecordNumber         32 ClosingRecordNumber
    12  TimeGenerated        36 StringOffset
    16  TimeWritten          40 UserSidLength
    20  EventID              44 UserSidOffset
    24  EventType u16        48 DataLength
    26  NumStrings u16       52 DataOffset
    56  SourceName\0 ComputerName\0 [UserSid] [Strings\0...] [Data] pad
    Length-4  Length (trailer)

  The trailing length lets a reader detect a torn or corrupted record and
  walk the log backwards. Both times are whole seconds since the epoch;
  sub-second parts are dropped on encode.
*/

inline constexpr std::uint32_t kRecordSignature = 0x654c664c; // "LfLe"

inline constexpr std::size_t kRecordHeaderSize  = 56;
inline constexpr std::size_t kRecordTrailerSize = 4;
inline constexpr std::size_t kMinRecordSize     = kRecordHeaderSize + kRecordTrailerSize;

namespace offset {
inline constexpr std::size_t kLength         = 0;
inline constexpr std::size_t kSignature      = 4;
inline constexpr std::size_t kRecordNumber   = 8;
inline constexpr std::size_t kTimeGenerated  = 12;
inline constexpr std::size_t kTimeWritten    = 16;
inline constexpr std::size_t kEventId        = 20;
inline constexpr std::size_t kEventType      = 24;
inline constexpr std::size_t kNumStrings     = 26;
inline constexpr std::size_t kEventCategory  = 28;
inline constexpr std::size_t kReservedFlags  = 30;
inline constexpr std::size_t kClosingNumber  = 32;
inline constexpr std::size_t kStringOffset   = 36;
inline constexpr std::size_t kUserSidLength  = 40;
inline constexpr std::size_t kUserSidOffset  = 44;
inline constexpr std::size_t kDataLength     = 48;
inline constexpr std::size_t kDataOffset     = 52;
} // namespace offset

enum class DecodeError {
  kNone = 0,
  kTruncated, // a field points outside the buffer or the buffer is short
  kMalformed, // framing markers disagree; the record is corrupt
};

const char* DecodeErrorName(DecodeError error);

struct DecodeResult {
  DecodeError error = DecodeError::kNone;
  std::string message;

  static DecodeResult Ok() {
    return {};
  }

  static DecodeResult Err(DecodeError e, std::string msg) {
    return {e, std::move(msg)};
  }

  explicit operator bool() const {
    return error == DecodeError::kNone;
  }
};

/*
  Decodes exactly one record from the start of `buffer`.

  Pure: no I/O, no shared state. On failure `out` is left untouched and no
  field of the record may be trusted.
*/
DecodeResult DecodeRecord(std::span<const std::uint8_t> buffer, Record* out);

/*
  Encodes a record in the on-disk layout. Used by the log writer.

  Strings are NUL terminated on disk, so names and insert strings holding
  a NUL byte are rejected with std::invalid_argument, as are more than
  65535 insert strings.
*/
std::vector<std::uint8_t> EncodeRecord(const Record& record);

// Framing peeks. Both return nullopt unless the buffer starts with a
// plausible record header (enough bytes and the signature in place).
std::optional<std::uint32_t> PeekRecordLength(std::span<const std::uint8_t> buffer);
std::optional<std::uint32_t> PeekRecordNumber(std::span<const std::uint8_t> buffer);

} // namespace eventship::record
