#include "record_codec.hpp"

#include <cstring>
#include <stdexcept>

#include "internal/util/byte_order.hpp"

namespace eventship::record {

using util::AlignUp4;
using util::LoadLE16;
using util::LoadLE32;
using util::StoreLE16;
using util::StoreLE32;

namespace {

// Reads a NUL-terminated string starting at `pos`, which must lie before
// `end`. Advances `pos` past the terminator.
bool ReadTerminated(std::span<const std::uint8_t> buffer, std::size_t& pos, std::size_t end, std::string* out) {
  if (pos >= end) {
    return false;
  }
  const auto* begin = buffer.data() + pos;
  const auto* nul   = static_cast<const std::uint8_t*>(std::memchr(begin, 0, end - pos));
  if (!nul) {
    return false;
  }
  out->assign(reinterpret_cast<const char*>(begin), static_cast<std::size_t>(nul - begin));
  pos += static_cast<std::size_t>(nul - begin) + 1;
  return true;
}

// [offset, offset + length) must lie within the record body.
bool WithinBody(std::uint64_t offset, std::uint64_t length, std::size_t body_end) {
  return offset >= kRecordHeaderSize && offset + length <= body_end;
}

bool HasNul(const std::string& s) {
  return s.find('\0') != std::string::npos;
}

void AppendBytes(std::vector<std::uint8_t>& out, const std::string& s) {
  out.insert(out.end(), s.begin(), s.end());
  out.push_back(0);
}

} // namespace

const char* DecodeErrorName(DecodeError error) {
  switch (error) {
    case DecodeError::kNone:
      return "none";
    case DecodeError::kTruncated:
      return "truncated";
    case DecodeError::kMalformed:
      return "malformed";
  }
  return "unknown";
}

DecodeResult DecodeRecord(std::span<const std::uint8_t> buffer, Record* out) {
  if (buffer.size() < 4) {
    return DecodeResult::Err(DecodeError::kTruncated, "buffer shorter than the length field");
  }

  const std::uint32_t length = LoadLE32(buffer.data() + offset::kLength);
  if (length < kMinRecordSize) {
    return DecodeResult::Err(DecodeError::kMalformed, "declared length " + std::to_string(length) + " below minimum record size");
  }
  if (buffer.size() < length) {
    return DecodeResult::Err(DecodeError::kTruncated,
                             "buffer of " + std::to_string(buffer.size()) + " bytes shorter than declared length " + std::to_string(length));
  }
  if (LoadLE32(buffer.data() + offset::kSignature) != kRecordSignature) {
    return DecodeResult::Err(DecodeError::kMalformed, "bad record signature");
  }

  const std::uint32_t trailer = LoadLE32(buffer.data() + length - kRecordTrailerSize);
  if (trailer != length) {
    return DecodeResult::Err(DecodeError::kMalformed,
                             "trailing length " + std::to_string(trailer) + " disagrees with leading length " + std::to_string(length));
  }

  const std::size_t body_end = length - kRecordTrailerSize;
  const auto*       p        = buffer.data();

  Record record;
  record.record_number  = LoadLE32(p + offset::kRecordNumber);
  record.time_generated = util::FromUnixSeconds(LoadLE32(p + offset::kTimeGenerated));
  record.time_written   = util::FromUnixSeconds(LoadLE32(p + offset::kTimeWritten));

  const std::uint32_t event_id = LoadLE32(p + offset::kEventId);
  record.event_code            = EventCodeOf(event_id);
  record.qualifier             = QualifierOf(event_id);
  record.event_type            = static_cast<EventType>(LoadLE16(p + offset::kEventType));
  record.event_category        = LoadLE16(p + offset::kEventCategory);

  std::size_t pos = kRecordHeaderSize;
  if (!ReadTerminated(buffer, pos, body_end, &record.source_name)) {
    return DecodeResult::Err(DecodeError::kTruncated, "source name runs past the record body");
  }
  if (!ReadTerminated(buffer, pos, body_end, &record.computer_name)) {
    return DecodeResult::Err(DecodeError::kTruncated, "computer name runs past the record body");
  }

  const std::uint32_t sid_length = LoadLE32(p + offset::kUserSidLength);
  const std::uint32_t sid_offset = LoadLE32(p + offset::kUserSidOffset);
  if (sid_length > 0) {
    if (!WithinBody(sid_offset, sid_length, body_end)) {
      return DecodeResult::Err(DecodeError::kTruncated, "user sid outside the record body");
    }
    record.user_sid.assign(p + sid_offset, p + sid_offset + sid_length);
  }

  const std::uint16_t num_strings   = LoadLE16(p + offset::kNumStrings);
  const std::uint32_t string_offset = LoadLE32(p + offset::kStringOffset);
  if (num_strings > 0) {
    if (!WithinBody(string_offset, 0, body_end)) {
      return DecodeResult::Err(DecodeError::kTruncated, "string table offset outside the record body");
    }
    std::size_t str_pos = string_offset;
    record.parameters.reserve(num_strings);
    for (std::uint16_t i = 0; i < num_strings; ++i) {
      std::string value;
      if (!ReadTerminated(buffer, str_pos, body_end, &value)) {
        return DecodeResult::Err(DecodeError::kTruncated, "insert string " + std::to_string(i + 1) + " runs past the record body");
      }
      record.parameters.push_back(std::move(value));
    }
  }

  const std::uint32_t data_length = LoadLE32(p + offset::kDataLength);
  const std::uint32_t data_offset = LoadLE32(p + offset::kDataOffset);
  if (data_length > 0) {
    if (!WithinBody(data_offset, data_length, body_end)) {
      return DecodeResult::Err(DecodeError::kTruncated, "raw data outside the record body");
    }
    record.raw_data.assign(p + data_offset, p + data_offset + data_length);
  }

  *out = std::move(record);
  return DecodeResult::Ok();
}

std::vector<std::uint8_t> EncodeRecord(const Record& record) {
  if (record.parameters.size() > 0xFFFF) {
    throw std::invalid_argument("too many insert strings");
  }
  if (HasNul(record.source_name) || HasNul(record.computer_name)) {
    throw std::invalid_argument("source or computer name contains a NUL byte");
  }
  for (const auto& param : record.parameters) {
    if (HasNul(param)) {
      throw std::invalid_argument("insert string contains a NUL byte");
    }
  }

  std::vector<std::uint8_t> out(kRecordHeaderSize, 0);
  AppendBytes(out, record.source_name);
  AppendBytes(out, record.computer_name);

  out.resize(AlignUp4(out.size()), 0);
  const auto sid_offset = static_cast<std::uint32_t>(out.size());
  out.insert(out.end(), record.user_sid.begin(), record.user_sid.end());

  const auto string_offset = static_cast<std::uint32_t>(out.size());
  for (const auto& param : record.parameters) {
    AppendBytes(out, param);
  }

  const auto data_offset = static_cast<std::uint32_t>(out.size());
  out.insert(out.end(), record.raw_data.begin(), record.raw_data.end());

  out.resize(AlignUp4(out.size()) + kRecordTrailerSize, 0);
  const auto length = static_cast<std::uint32_t>(out.size());

  auto* p = out.data();
  StoreLE32(p + offset::kLength, length);
  StoreLE32(p + offset::kSignature, kRecordSignature);
  StoreLE32(p + offset::kRecordNumber, record.record_number);
  StoreLE32(p + offset::kTimeGenerated, util::ToUnixSeconds(record.time_generated));
  StoreLE32(p + offset::kTimeWritten, util::ToUnixSeconds(record.time_written));
  StoreLE32(p + offset::kEventId, record.EventId());
  StoreLE16(p + offset::kEventType, static_cast<std::uint16_t>(record.event_type));
  StoreLE16(p + offset::kNumStrings, static_cast<std::uint16_t>(record.parameters.size()));
  StoreLE16(p + offset::kEventCategory, record.event_category);
  StoreLE16(p + offset::kReservedFlags, 0);
  StoreLE32(p + offset::kClosingNumber, 0);
  StoreLE32(p + offset::kStringOffset, string_offset);
  StoreLE32(p + offset::kUserSidLength, static_cast<std::uint32_t>(record.user_sid.size()));
  StoreLE32(p + offset::kUserSidOffset, record.user_sid.empty() ? 0 : sid_offset);
  StoreLE32(p + offset::kDataLength, static_cast<std::uint32_t>(record.raw_data.size()));
  StoreLE32(p + offset::kDataOffset, data_offset);
  StoreLE32(p + length - kRecordTrailerSize, length);

  return out;
}

std::optional<std::uint32_t> PeekRecordLength(std::span<const std::uint8_t> buffer) {
  if (buffer.size() < offset::kRecordNumber + 4) {
    return std::nullopt;
  }
  if (LoadLE32(buffer.data() + offset::kSignature) != kRecordSignature) {
    return std::nullopt;
  }
  return LoadLE32(buffer.data() + offset::kLength);
}

std::optional<std::uint32_t> PeekRecordNumber(std::span<const std::uint8_t> buffer) {
  if (!PeekRecordLength(buffer)) {
    return std::nullopt;
  }
  return LoadLE32(buffer.data() + offset::kRecordNumber);
}

} // namespace eventship::record
