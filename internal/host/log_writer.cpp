#include "log_writer.hpp"

#include <unistd.h>

#include <exception>

#include "internal/host/log_file.hpp"
#include "internal/record/record_codec.hpp"
#include "internal/util/byte_order.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace eventship::host {

namespace {

std::string HostName() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) {
    return "localhost";
  }
  return buf;
}

std::filesystem::path RotationPath(const std::filesystem::path& path, std::uint64_t creation_time_us) {
  return path.parent_path() / (path.stem().string() + "-" + std::to_string(creation_time_us) + path.extension().string());
}

} // namespace

LogWriter::LogWriter(const LogHost& host, std::string source_name)
    : host_(host), source_name_(std::move(source_name)), computer_name_(HostName()) {
  target_ = host_.ResolveSourceLog(source_name_);
  Reopen();
}

LogWriter::~LogWriter() = default;

void LogWriter::Reopen() {
  host_.EnsureLog(target_);
  file_ = std::make_unique<LogFile>(target_.path, LogFile::Mode::kReadWrite);
}

void LogWriter::Close() {
  file_.reset();
}

util::Result LogWriter::Report(record::EventType type, std::uint32_t event_id, const std::vector<std::string>& strings,
                               std::span<const std::uint8_t> data, std::uint16_t category) {
  record::Record rec;
  rec.event_code     = record::EventCodeOf(event_id);
  rec.qualifier      = record::QualifierOf(event_id);
  rec.event_type     = type;
  rec.event_category = category;
  rec.source_name    = source_name_;
  rec.computer_name  = computer_name_;
  rec.time_generated = util::Now();
  rec.time_written   = rec.time_generated;
  rec.parameters     = strings;
  rec.raw_data.assign(data.begin(), data.end());

  try {
    return Append(record::EncodeRecord(rec), rec);
  } catch (const util::IoError& e) {
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  } catch (const std::invalid_argument& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
}

util::Result LogWriter::Append(const std::vector<std::uint8_t>& encoded, record::Record& rec) {
  if (!file_) {
    Reopen();
  }

  for (;;) {
    {
      auto lock = file_->LockExclusive();
      // A clear or rotation replaced the file; follow the path to the new one.
      if (file_->IsCurrent()) {
        auto header = file_->ReadHeader();
        if (!header) {
          return util::Result::Err(util::ErrorCode::Corruption, "bad log header in " + target_.path.string());
        }

        const std::uint32_t max_size = target_.registration ? target_.registration->max_size_bytes : header->max_size;
        if (max_size > 0 && header->RecordCount() > 0 && header->end_offset + encoded.size() > max_size) {
          auto result = ReplaceWithEmptyLog(*file_, RotationPath(target_.path, header->creation_time_us));
          if (!result) {
            return result;
          }
        } else {
          // The record number is assigned under the lock, patch it into the bytes.
          rec.record_number = header->next_record_number;
          auto bytes        = encoded;
          util::StoreLE32(bytes.data() + record::offset::kRecordNumber, rec.record_number);

          file_->WriteAt(header->end_offset, bytes);
          if (sync_) {
            file_->Sync();
          }

          header->end_offset += static_cast<std::uint32_t>(bytes.size());
          header->next_record_number += 1;
          file_->WriteHeader(*header);
          if (sync_) {
            file_->Sync();
          }
          return util::Result::Ok();
        }
      }
    }
    Reopen();
  }
}

util::Result LogWriter::Info(std::uint32_t event_id, std::string_view message) {
  return Report(record::EventType::kInformation, event_id, {std::string(message)});
}

util::Result LogWriter::Warning(std::uint32_t event_id, std::string_view message) {
  return Report(record::EventType::kWarning, event_id, {std::string(message)});
}

util::Result LogWriter::Error(std::uint32_t event_id, std::string_view message) {
  return Report(record::EventType::kError, event_id, {std::string(message)});
}

util::Result LogWriter::Success(std::uint32_t event_id, std::string_view message) {
  return Report(record::EventType::kSuccess, event_id, {std::string(message)});
}

} // namespace eventship::host
