#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/message/message_resolver.hpp"

namespace eventship::host {

inline constexpr std::uint32_t kTypesAll = 0x001F;

struct SourceRegistration {
  std::string provider;
  std::string source;

  message::MessageFileSet event_message_files;
  message::MessageFileSet parameter_message_files;
  message::MessageFileSet category_message_files;

  std::uint32_t category_count  = 0;
  std::uint32_t types_supported = 0;
};

struct ProviderRegistration {
  std::string   name;
  std::string   log_file;       // file name inside the log directory
  std::uint32_t max_size_bytes = 0;

  std::map<std::string, SourceRegistration, std::less<>> sources;

  const SourceRegistration* FindSource(std::string_view source) const;
};

/*
  Read-only view of provider registrations.

  One YAML document per provider, <root>/<provider>.yaml:

    log_file: Application.evt
    max_size_bytes: 0
    sources:
      "Integration Test":
        event_message_file: "/usr/share/eventship/a.msg;/opt/b.msg"
        parameter_message_file: ""
        category_message_file: ""
        category_count: 0
        types_supported: 31

  Every lookup reads the registration from disk, so a snapshot taken when a
  session opens stays fixed for that session.
*/
class Registry {
 public:
  explicit Registry(std::filesystem::path root);

  std::optional<ProviderRegistration> FindProvider(std::string_view provider) const;

  // Provider that owns `source`, searching every registration.
  std::optional<std::string> ProviderForSource(std::string_view source) const;

  std::vector<std::string> Providers() const;

  std::filesystem::path ProviderPath(std::string_view provider) const;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

// Provider and source names become file names and YAML keys.
void ValidateName(std::string_view kind, std::string_view name);

// Throws std::runtime_error on malformed YAML.
ProviderRegistration LoadProviderRegistration(const std::filesystem::path& path, std::string_view provider);

} // namespace eventship::host
