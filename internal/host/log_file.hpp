#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "internal/host/log_file_format.hpp"
#include "internal/util/result.hpp"

namespace eventship::host {

/*
  RAII wrapper around one open log file descriptor.

  Readers and writers coordinate through flock(2): appends hold the
  exclusive lock, reads hold the shared lock. A clear or rotation replaces
  the file by rename, so a holder detects replacement by comparing the
  inode of its descriptor with the inode currently at the path.
*/
class LogFile {
 public:
  enum class Mode { kRead, kReadWrite };

  // Opens the log at `path`, creating an empty log first when it is missing.
  // Throws util::IoError.
  LogFile(std::filesystem::path path, Mode mode);
  ~LogFile();

  LogFile(const LogFile&)            = delete;
  LogFile& operator=(const LogFile&) = delete;

  class Lock {
   public:
    Lock(int fd, bool exclusive);
    ~Lock();

    Lock(const Lock&)            = delete;
    Lock& operator=(const Lock&) = delete;

   private:
    int fd_;
  };

  Lock LockShared() const;
  Lock LockExclusive() const;

  // Header and data access. Callers hold a lock. Throws util::IoError.
  std::optional<LogHeader>  ReadHeader() const;
  void                      WriteHeader(const LogHeader& header);
  std::vector<std::uint8_t> ReadAt(std::uint64_t offset, std::size_t size) const;
  void                      WriteAt(std::uint64_t offset, std::span<const std::uint8_t> bytes);
  void                      Sync();

  // False once the file at path() is no longer the one this descriptor has open.
  bool IsCurrent() const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
  int                   fd_ = -1;
  dev_t                 dev_{};
  ino_t                 ino_{};
};

// Creates an empty log at `path` unless one already exists.
void CreateLogIfMissing(const std::filesystem::path& path, std::uint32_t max_size);

/*
  Replaces the log behind `locked` (whose exclusive lock the caller holds)
  with an empty one: numbering restarts at 1 and the creation time moves
  forward. When `backup_path` is set the old file is copied there first;
  an existing backup is not overwritten.
*/
util::Result ReplaceWithEmptyLog(const LogFile& locked, const std::optional<std::filesystem::path>& backup_path);

} // namespace eventship::host
