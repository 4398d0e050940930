#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "internal/host/registry.hpp"
#include "internal/util/result.hpp"

namespace eventship::host {

inline constexpr char kDefaultLogName[] = "Application";

struct HostOptions {
  std::filesystem::path registry_dir;
  std::filesystem::path log_dir;
  std::string           default_log = kDefaultLogName;
};

/*
  Where a provider name leads.

  An unregistered provider resolves to the default log, the way the host
  platform opens the Application log for names it does not know.
*/
struct LogTarget {
  std::string           requested;
  std::string           log_name;
  std::filesystem::path path;
  bool                  used_default = false;

  // Snapshot of the registration; nullopt when even the default log has none.
  std::optional<ProviderRegistration> registration;
};

/*
  The host log service: provider registry plus the log directory.
*/
class LogHost {
 public:
  explicit LogHost(HostOptions options);

  // Throws std::invalid_argument for names that cannot be log names,
  // std::runtime_error for unreadable registrations.
  LogTarget ResolveLog(std::string_view provider) const;

  // Log the source writes to: the provider that registered it, else the default log.
  LogTarget ResolveSourceLog(std::string_view source) const;

  // Creates the target's log file when missing. Throws util::IoError.
  void EnsureLog(const LogTarget& target) const;

  util::Result ClearLog(std::string_view provider, const std::optional<std::filesystem::path>& backup_path) const;

  util::Result RecordCount(std::string_view provider, std::uint32_t* count) const;

  const Registry& registry() const {
    return registry_;
  }

  const HostOptions& options() const {
    return options_;
  }

 private:
  HostOptions options_;
  Registry    registry_;
};

} // namespace eventship::host
