#pragma once

#include <filesystem>
#include <string_view>

#include "internal/host/registry.hpp"
#include "internal/util/result.hpp"

namespace eventship::host {

/*
  Writes provider registrations.

  Administrative setup/teardown only: used by eventshipctl and the test
  harness. The shipper itself only reads through Registry.
*/
class RegistryInstaller {
 public:
  explicit RegistryInstaller(std::filesystem::path root);

  // Registers a source under its provider, creating the provider when
  // missing. AlreadyExists when the source is registered already.
  util::Result Install(const SourceRegistration& source);

  util::Result RemoveSource(std::string_view provider, std::string_view source);

  // Drops the provider registration. The log file itself is left in place.
  util::Result RemoveProvider(std::string_view provider);

  util::Result SetMaxSize(std::string_view provider, std::uint32_t max_size_bytes);

 private:
  util::Result Save(const ProviderRegistration& provider);

  Registry registry_;
};

} // namespace eventship::host
