#include "log_host.hpp"

#include <exception>

#include "internal/host/log_file.hpp"
#include "internal/util/errors.hpp"

namespace eventship::host {

LogHost::LogHost(HostOptions options) : options_(std::move(options)), registry_(options_.registry_dir) {
}

LogTarget LogHost::ResolveLog(std::string_view provider) const {
  ValidateName("provider", provider);

  LogTarget target;
  target.requested    = std::string(provider);
  target.registration = registry_.FindProvider(provider);
  target.log_name     = target.requested;

  if (!target.registration) {
    target.used_default = true;
    target.log_name     = options_.default_log;
    target.registration = registry_.FindProvider(options_.default_log);
  }

  const std::string file = target.registration ? target.registration->log_file : target.log_name + ".evt";
  target.path            = options_.log_dir / file;
  return target;
}

LogTarget LogHost::ResolveSourceLog(std::string_view source) const {
  auto provider = registry_.ProviderForSource(source);
  return ResolveLog(provider ? *provider : options_.default_log);
}

void LogHost::EnsureLog(const LogTarget& target) const {
  CreateLogIfMissing(target.path, target.registration ? target.registration->max_size_bytes : 0);
}

util::Result LogHost::ClearLog(std::string_view provider, const std::optional<std::filesystem::path>& backup_path) const {
  try {
    const auto target = ResolveLog(provider);
    EnsureLog(target);

    // Retry when another clear replaced the file between open and lock.
    for (;;) {
      LogFile file(target.path, LogFile::Mode::kReadWrite);
      auto    lock = file.LockExclusive();
      if (!file.IsCurrent()) {
        continue;
      }
      return ReplaceWithEmptyLog(file, backup_path);
    }
  } catch (const util::IoError& e) {
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
}

util::Result LogHost::RecordCount(std::string_view provider, std::uint32_t* count) const {
  try {
    const auto target = ResolveLog(provider);
    EnsureLog(target);

    LogFile file(target.path, LogFile::Mode::kRead);
    auto    lock   = file.LockShared();
    auto    header = file.ReadHeader();
    if (!header) {
      return util::Result::Err(util::ErrorCode::Corruption, "bad log header in " + target.path.string());
    }
    *count = header->RecordCount();
    return util::Result::Ok();
  } catch (const util::IoError& e) {
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
}

} // namespace eventship::host
