#include "log_file.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace eventship::host {

namespace {

std::string ErrnoMessage(const std::string& what, const std::filesystem::path& path) {
  return what + " " + path.string() + ": " + std::strerror(errno);
}

void WriteFully(int fd, std::uint64_t offset, std::span<const std::uint8_t> bytes, const std::filesystem::path& path) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::pwrite(fd, bytes.data() + written, bytes.size() - written, static_cast<off_t>(offset + written));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw util::IoError(ErrnoMessage("write", path));
    }
    written += static_cast<std::size_t>(n);
  }
}

void WriteEmptyLog(const std::filesystem::path& path, std::uint32_t max_size, std::uint64_t creation_time_us) {
  LogHeader header;
  header.max_size         = max_size;
  header.creation_time_us = creation_time_us;
  const auto bytes        = EncodeLogHeader(header);

  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw util::IoError(ErrnoMessage("create", path));
  }
  try {
    WriteFully(fd, 0, bytes, path);
    if (::fsync(fd) != 0) {
      throw util::IoError(ErrnoMessage("fsync", path));
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  ::close(fd);
}

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
  return path.string() + ".tmp." + std::to_string(::getpid());
}

} // namespace

// ------------------------------------------------------------
// Lock
// ------------------------------------------------------------

LogFile::Lock::Lock(int fd, bool exclusive) : fd_(fd) {
  while (::flock(fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
    if (errno != EINTR) {
      throw util::IoError(std::string("flock: ") + std::strerror(errno));
    }
  }
}

LogFile::Lock::~Lock() {
  ::flock(fd_, LOCK_UN);
}

// ------------------------------------------------------------
// LogFile
// ------------------------------------------------------------

LogFile::LogFile(std::filesystem::path path, Mode mode) : path_(std::move(path)) {
  CreateLogIfMissing(path_, 0);

  fd_ = ::open(path_.c_str(), (mode == Mode::kReadWrite ? O_RDWR : O_RDONLY) | O_CLOEXEC);
  if (fd_ < 0) {
    throw util::IoError(ErrnoMessage("open", path_));
  }

  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    const auto msg = ErrnoMessage("fstat", path_);
    ::close(fd_);
    fd_ = -1;
    throw util::IoError(msg);
  }
  dev_ = st.st_dev;
  ino_ = st.st_ino;
}

LogFile::~LogFile() {
  if (fd_ >= 0) ::close(fd_);
}

LogFile::Lock LogFile::LockShared() const {
  return Lock(fd_, false);
}

LogFile::Lock LogFile::LockExclusive() const {
  return Lock(fd_, true);
}

std::optional<LogHeader> LogFile::ReadHeader() const {
  auto bytes = ReadAt(0, kLogHeaderSize);
  return DecodeLogHeader(bytes);
}

void LogFile::WriteHeader(const LogHeader& header) {
  WriteAt(0, EncodeLogHeader(header));
}

std::vector<std::uint8_t> LogFile::ReadAt(std::uint64_t offset, std::size_t size) const {
  std::vector<std::uint8_t> out(size);
  std::size_t               got = 0;
  while (got < size) {
    const ssize_t n = ::pread(fd_, out.data() + got, size - got, static_cast<off_t>(offset + got));
    if (n < 0) {
      if (errno == EINTR) continue;
      throw util::IoError(ErrnoMessage("read", path_));
    }
    if (n == 0) break;
    got += static_cast<std::size_t>(n);
  }
  out.resize(got);
  return out;
}

void LogFile::WriteAt(std::uint64_t offset, std::span<const std::uint8_t> bytes) {
  WriteFully(fd_, offset, bytes, path_);
}

void LogFile::Sync() {
  if (::fdatasync(fd_) != 0) {
    throw util::IoError(ErrnoMessage("fdatasync", path_));
  }
}

bool LogFile::IsCurrent() const {
  struct stat st {};
  if (::stat(path_.c_str(), &st) != 0) {
    return false;
  }
  return st.st_dev == dev_ && st.st_ino == ino_;
}

// ------------------------------------------------------------
// Whole-file operations
// ------------------------------------------------------------

void CreateLogIfMissing(const std::filesystem::path& path, std::uint32_t max_size) {
  if (std::filesystem::exists(path)) {
    return;
  }
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  // link(2) does not clobber, so a concurrent creator wins cleanly.
  const auto tmp = TempPathFor(path);
  WriteEmptyLog(tmp, max_size, util::ToUnixMicros(util::Now()));
  if (::link(tmp.c_str(), path.c_str()) != 0 && errno != EEXIST) {
    const auto msg = ErrnoMessage("link", path);
    std::filesystem::remove(tmp);
    throw util::IoError(msg);
  }
  std::filesystem::remove(tmp);
}

util::Result ReplaceWithEmptyLog(const LogFile& locked, const std::optional<std::filesystem::path>& backup_path) {
  std::optional<LogHeader> old;
  try {
    old = locked.ReadHeader();
  } catch (const util::IoError& e) {
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  }

  if (backup_path) {
    std::error_code ec;
    if (std::filesystem::exists(*backup_path, ec)) {
      return util::Result::Err(util::ErrorCode::AlreadyExists, "backup file exists: " + backup_path->string());
    }
    std::filesystem::copy_file(locked.path(), *backup_path, ec);
    if (ec) {
      return util::Result::Err(util::ErrorCode::IOError, "backup to " + backup_path->string() + " failed: " + ec.message());
    }
  }

  // The creation time is the log's identity; it must change even when two
  // clears land in the same microsecond.
  std::uint64_t creation = util::ToUnixMicros(util::Now());
  if (old) {
    creation = std::max(creation, old->creation_time_us + 1);
  }

  const auto tmp = TempPathFor(locked.path());
  try {
    WriteEmptyLog(tmp, old ? old->max_size : 0, creation);
  } catch (const util::IoError& e) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, locked.path(), ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return util::Result::Err(util::ErrorCode::IOError, "replace " + locked.path().string() + " failed: " + ec.message());
  }
  return util::Result::Ok();
}

} // namespace eventship::host
