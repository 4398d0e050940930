#include "log_file_format.hpp"

#include "internal/util/byte_order.hpp"

namespace eventship::host {

using util::LoadLE32;
using util::LoadLE64;
using util::StoreLE32;
using util::StoreLE64;

std::vector<std::uint8_t> EncodeLogHeader(const LogHeader& header) {
  std::vector<std::uint8_t> out(kLogHeaderSize, 0);
  auto*                     p = out.data();
  StoreLE32(p + 0, kLogHeaderSize);
  StoreLE32(p + 4, kLogSignature);
  StoreLE32(p + 8, kLogMajorVersion);
  StoreLE32(p + 12, kLogMinorVersion);
  StoreLE32(p + 16, header.start_offset);
  StoreLE32(p + 20, header.end_offset);
  StoreLE32(p + 24, header.next_record_number);
  StoreLE32(p + 28, header.oldest_record_number);
  StoreLE32(p + 32, header.max_size);
  StoreLE64(p + 40, header.creation_time_us);
  StoreLE32(p + 60, kLogHeaderSize);
  return out;
}

std::optional<LogHeader> DecodeLogHeader(std::span<const std::uint8_t> bytes) {
  if (bytes.size() < kLogHeaderSize) {
    return std::nullopt;
  }
  const auto* p = bytes.data();
  if (LoadLE32(p + 0) != kLogHeaderSize || LoadLE32(p + 60) != kLogHeaderSize || LoadLE32(p + 4) != kLogSignature) {
    return std::nullopt;
  }
  if (LoadLE32(p + 8) != kLogMajorVersion || LoadLE32(p + 12) != kLogMinorVersion) {
    return std::nullopt;
  }

  LogHeader header;
  header.start_offset         = LoadLE32(p + 16);
  header.end_offset           = LoadLE32(p + 20);
  header.next_record_number   = LoadLE32(p + 24);
  header.oldest_record_number = LoadLE32(p + 28);
  header.max_size             = LoadLE32(p + 32);
  header.creation_time_us     = LoadLE64(p + 40);

  if (header.start_offset < kLogHeaderSize || header.end_offset < header.start_offset ||
      header.next_record_number < header.oldest_record_number) {
    return std::nullopt;
  }
  return header;
}

} // namespace eventship::host
