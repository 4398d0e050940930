#include "session.hpp"

#include <algorithm>
#include <exception>

#include "internal/host/log_file.hpp"
#include "internal/observability/logging.hpp"
#include "internal/record/record_codec.hpp"
#include "internal/util/byte_order.hpp"
#include "internal/util/errors.hpp"

namespace eventship::session {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kScanChunk = 64 * 1024;

struct Frame {
  std::size_t offset = 0;
  std::size_t length = 0;
};

// First 4-aligned position at or after `from` that carries a plausible
// record header. `*stop` receives the first position not examined.
std::optional<std::size_t> FindNextHeader(std::span<const std::uint8_t> chunk, std::size_t from, std::size_t* stop) {
  std::size_t p = util::AlignUp4(from);
  for (; p + 8 <= chunk.size(); p += 4) {
    if (util::LoadLE32(chunk.data() + p + 4) == record::kRecordSignature &&
        util::LoadLE32(chunk.data() + p) >= record::kMinRecordSize) {
      return p;
    }
  }
  *stop = p;
  return std::nullopt;
}

/*
  Splits a chunk that starts on a record boundary into frames. `at_end`
  says the chunk ends where the log's written data ends. Returns the
  number of bytes consumed; a record cut off by the chunk end is left for
  the next read.
*/
std::size_t SplitFrames(std::span<const std::uint8_t> chunk, bool at_end, std::size_t max_frames, std::vector<Frame>* frames) {
  std::size_t off = 0;
  while (off < chunk.size() && frames->size() < max_frames) {
    const auto rest   = chunk.subspan(off);
    const auto length = record::PeekRecordLength(rest);

    if (length && *length >= record::kMinRecordSize && *length % 4 == 0) {
      if (*length <= rest.size()) {
        frames->push_back({off, *length});
        off += *length;
        continue;
      }
      if (!at_end) {
        break;
      }
    } else if (!length && rest.size() < 8 && !at_end) {
      break;
    }

    // Unframeable bytes: resynchronise on the next header.
    std::size_t stop = chunk.size();
    auto        next = FindNextHeader(chunk, off + 4, &stop);
    std::size_t end  = next ? *next : (at_end ? chunk.size() : stop);
    frames->push_back({off, end - off});
    off = end;
  }
  return off;
}

/*
  Reads up to `max_bytes` at `pos` and frames it. When the first record is
  bigger than `max_bytes` it is read whole.
*/
std::size_t ReadFrames(const host::LogFile& file, std::uint64_t pos, std::uint64_t end, std::size_t max_bytes,
                       std::size_t max_frames, std::vector<std::uint8_t>* chunk, std::vector<Frame>* frames) {
  std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(end - pos, max_bytes));
  for (;;) {
    *chunk = file.ReadAt(pos, want);
    if (chunk->size() < want) {
      throw util::IoError("short read from " + file.path().string());
    }

    const bool  at_end   = pos + chunk->size() == end;
    std::size_t consumed = SplitFrames(*chunk, at_end, max_frames, frames);
    if (!frames->empty() || at_end) {
      return consumed;
    }

    auto length = record::PeekRecordLength(*chunk);
    if (!length || *length <= want) {
      return consumed;
    }
    want = static_cast<std::size_t>(std::min<std::uint64_t>(end - pos, *length));
  }
}

} // namespace

const char* OpenErrorName(OpenError error) {
  switch (error) {
    case OpenError::kNone:
      return "none";
    case OpenError::kInvalidArgument:
      return "invalid_argument";
    case OpenError::kIo:
      return "io";
    case OpenError::kCorrupt:
      return "corrupt";
  }
  return "unknown";
}

const char* ReadErrorName(ReadError error) {
  switch (error) {
    case ReadError::kNone:
      return "none";
    case ReadError::kInvalidated:
      return "invalidated";
    case ReadError::kIo:
      return "io";
    case ReadError::kClosed:
      return "closed";
  }
  return "unknown";
}

Session::Session(host::LogTarget target, SessionOptions options) : target_(std::move(target)), options_(options) {
  options_.max_records = std::max<std::uint32_t>(options_.max_records, 1);
  options_.max_bytes   = std::max<std::uint32_t>(options_.max_bytes, record::kMinRecordSize);
}

Session::~Session() {
  Close();
}

OpenResult Session::Open(const host::LogHost& host, const std::string& provider, std::uint32_t resume_after, SessionOptions options) {
  OpenResult result;

  host::LogTarget target;
  try {
    target = host.ResolveLog(provider);
  } catch (const std::invalid_argument& e) {
    result.error   = OpenError::kInvalidArgument;
    result.message = e.what();
    return result;
  } catch (const std::exception& e) {
    result.error   = OpenError::kIo;
    result.message = e.what();
    return result;
  }

  if (target.used_default) {
    EVENTSHIP_LOG_INFO("Provider not registered, opening default log",
                       {StringField("provider", provider), StringField("log", target.log_name)});
  }

  std::unique_ptr<Session> session(new Session(std::move(target), options));

  try {
    host.EnsureLog(session->target_);
  } catch (const util::IoError& e) {
    result.error   = OpenError::kIo;
    result.message = e.what();
    return result;
  }

  std::string message;
  auto        err = session->Attach(&message);
  if (err == ReadError::kNone) {
    err = session->SeekAfter(resume_after, &message);
  }
  if (err != ReadError::kNone) {
    result.error   = err == ReadError::kInvalidated ? OpenError::kCorrupt : OpenError::kIo;
    result.message = message;
    return result;
  }

  EVENTSHIP_LOG_DEBUG("Session opened", {StringField("provider", provider), StringField("log", session->log_name()),
                                         IntField("resume_after", resume_after), IntField("position", static_cast<std::int64_t>(session->position_))});
  result.session = std::move(session);
  return result;
}

ReadError Session::Attach(std::string* message) {
  try {
    auto file   = std::make_unique<host::LogFile>(target_.path, host::LogFile::Mode::kRead);
    auto lock   = file->LockShared();
    auto header = file->ReadHeader();
    if (!header) {
      *message = "bad log header in " + target_.path.string();
      return ReadError::kInvalidated;
    }
    creation_time_us_ = header->creation_time_us;
    position_         = header->start_offset;
    stale_resume_     = false;
    file_             = std::move(file);
    return ReadError::kNone;
  } catch (const util::IoError& e) {
    *message = e.what();
    return ReadError::kIo;
  }
}

ReadError Session::SeekAfter(std::uint32_t resume_after, std::string* message) {
  if (resume_after == 0) {
    return ReadError::kNone;
  }

  try {
    auto lock   = file_->LockShared();
    auto header = file_->ReadHeader();
    if (!header) {
      *message = "bad log header in " + target_.path.string();
      return ReadError::kInvalidated;
    }

    if (resume_after > header->NewestRecordNumber()) {
      stale_resume_ = true;
      position_     = header->end_offset;
      return ReadError::kNone;
    }
    if (resume_after < header->oldest_record_number) {
      return ReadError::kNone;
    }

    std::uint64_t pos = header->start_offset;
    while (pos < header->end_offset) {
      std::vector<std::uint8_t> chunk;
      std::vector<Frame>        frames;
      const std::size_t consumed = ReadFrames(*file_, pos, header->end_offset, kScanChunk, SIZE_MAX, &chunk, &frames);
      if (consumed == 0) {
        break;
      }
      for (const auto& frame : frames) {
        auto number = record::PeekRecordNumber(std::span<const std::uint8_t>(chunk).subspan(frame.offset, frame.length));
        if (!number) {
          continue;
        }
        if (*number > resume_after) {
          return ReadError::kNone;
        }
        position_ = pos + frame.offset + frame.length;
      }
      pos += consumed;
    }
    return ReadError::kNone;
  } catch (const util::IoError& e) {
    *message = e.what();
    return ReadError::kIo;
  }
}

ReadError Session::CheckIdentity(std::string* message) const {
  if (!file_->IsCurrent()) {
    *message = "log file " + target_.path.string() + " was replaced";
    return ReadError::kInvalidated;
  }
  return ReadError::kNone;
}

ReadResult Session::ReadBatch() {
  ReadResult result;
  if (!file_) {
    result.error   = ReadError::kClosed;
    result.message = "session closed";
    return result;
  }

  try {
    result.error = CheckIdentity(&result.message);
    if (result.error != ReadError::kNone) {
      return result;
    }

    auto lock   = file_->LockShared();
    auto header = file_->ReadHeader();
    if (!header) {
      result.error   = ReadError::kIo;
      result.message = "bad log header in " + target_.path.string();
      return result;
    }
    if (header->creation_time_us != creation_time_us_) {
      result.error   = ReadError::kInvalidated;
      result.message = "log was cleared";
      return result;
    }
    if (stale_resume_) {
      result.error   = ReadError::kInvalidated;
      result.message = "resume point is past the newest record";
      return result;
    }
    if (header->end_offset < position_) {
      result.error   = ReadError::kInvalidated;
      result.message = "log shrank below the read position";
      return result;
    }
    if (position_ == header->end_offset) {
      return result;
    }

    std::vector<std::uint8_t> chunk;
    std::vector<Frame>        frames;
    const std::size_t consumed = ReadFrames(*file_, position_, header->end_offset, options_.max_bytes, options_.max_records, &chunk, &frames);

    result.records.reserve(frames.size());
    for (const auto& frame : frames) {
      RawRecord raw;
      raw.offset = position_ + frame.offset;
      raw.bytes.assign(chunk.begin() + static_cast<std::ptrdiff_t>(frame.offset),
                       chunk.begin() + static_cast<std::ptrdiff_t>(frame.offset + frame.length));
      result.records.push_back(std::move(raw));
    }
    position_ += consumed;
  } catch (const util::IoError& e) {
    result.error   = ReadError::kIo;
    result.message = e.what();
    result.records.clear();
  }
  return result;
}

std::uint32_t Session::RecordCount() const {
  if (!file_) {
    throw util::InvalidState("session closed");
  }
  auto lock   = file_->LockShared();
  auto header = file_->ReadHeader();
  if (!header) {
    throw util::IoError("bad log header in " + target_.path.string());
  }
  return header->RecordCount();
}

util::Result Session::Clear(const std::optional<std::filesystem::path>& backup_path) {
  if (!file_) {
    return util::Result::Err(util::ErrorCode::InternalError, "session closed");
  }

  try {
    util::Result result;
    for (;;) {
      host::LogFile writer(target_.path, host::LogFile::Mode::kReadWrite);
      auto          lock = writer.LockExclusive();
      if (!writer.IsCurrent()) {
        continue;
      }
      result = host::ReplaceWithEmptyLog(writer, backup_path);
      break;
    }
    if (!result) {
      return result;
    }
  } catch (const util::IoError& e) {
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  }

  std::string message;
  if (Attach(&message) != ReadError::kNone) {
    return util::Result::Err(util::ErrorCode::IOError, message);
  }
  EVENTSHIP_LOG_INFO("Log cleared", {StringField("log", log_name()), BoolField("backup", backup_path.has_value())});
  return util::Result::Ok();
}

void Session::Close() {
  file_.reset();
}

} // namespace eventship::session
