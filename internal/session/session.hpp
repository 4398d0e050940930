#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/host/log_host.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace eventship::host {
class LogFile;
}

namespace eventship::session {

struct SessionOptions {
  std::uint32_t max_records = 100;
  std::uint32_t max_bytes   = 64 * 1024;
};

enum class OpenError {
  kNone = 0,
  kInvalidArgument, // provider name cannot name a log
  kIo,              // transient: the log could not be opened or read
  kCorrupt,         // the log header is unreadable
};

enum class ReadError {
  kNone = 0,
  kInvalidated, // the log was cleared or rotated, or the resume point is gone
  kIo,
  kClosed,
};

const char* OpenErrorName(OpenError error);
const char* ReadErrorName(ReadError error);

/*
  Raw bytes of one record as framed in the log. Framing only trusts the
  leading length and signature; the decoder validates the rest. Bytes that
  could not be framed are handed out as one raw record too, so the caller
  sees and counts the corruption.
*/
struct RawRecord {
  std::uint64_t             offset = 0;
  std::vector<std::uint8_t> bytes;
};

struct ReadResult {
  ReadError              error = ReadError::kNone;
  std::string            message;
  std::vector<RawRecord> records;

  explicit operator bool() const {
    return error == ReadError::kNone;
  }
};

class Session;

struct OpenResult {
  std::unique_ptr<Session> session;
  OpenError                error = OpenError::kNone;
  std::string              message;

  explicit operator bool() const {
    return error == OpenError::kNone;
  }
};

/*
  An open read handle on one provider's log.

  Exclusively owned; the file handle is released on Close() or destruction.
  A session never heals itself: once the log is replaced underneath it,
  every ReadBatch returns kInvalidated until the owner opens a new one.
*/
class Session {
 public:
  /*
    Opens `provider` positioned after `resume_after` (0 = oldest record).

    Unknown providers open the default log. A resume point past the newest
    record is accepted here and reported as kInvalidated by the first read.
  */
  static OpenResult Open(const host::LogHost& host, const std::string& provider, std::uint32_t resume_after,
                         SessionOptions options = {});

  ~Session();

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  // Bounded batch after the current position. Empty means caught up.
  ReadResult ReadBatch();

  // Records currently in the log. Throws util::IoError.
  std::uint32_t RecordCount() const;

  // Empties the log and reattaches this session at its start.
  util::Result Clear(const std::optional<std::filesystem::path>& backup_path = std::nullopt);

  void Close();

  bool IsOpen() const {
    return file_ != nullptr;
  }

  const std::string& provider() const {
    return target_.requested;
  }

  const std::string& log_name() const {
    return target_.log_name;
  }

  bool UsedDefaultLog() const {
    return target_.used_default;
  }

  // Registration snapshot taken at open; fixed for the session's lifetime.
  const std::optional<host::ProviderRegistration>& registration() const {
    return target_.registration;
  }

  std::uint64_t LogCreationMicros() const {
    return creation_time_us_;
  }

  util::TimePoint LogCreationTime() const {
    return util::FromUnixMicros(creation_time_us_);
  }

 private:
  Session(host::LogTarget target, SessionOptions options);

  ReadError Attach(std::string* message);
  ReadError SeekAfter(std::uint32_t resume_after, std::string* message);
  ReadError CheckIdentity(std::string* message) const;

  host::LogTarget                target_;
  SessionOptions                 options_;
  std::unique_ptr<host::LogFile> file_;

  std::uint64_t creation_time_us_ = 0;
  std::uint64_t position_         = 0;
  bool          stale_resume_     = false;
};

} // namespace eventship::session
