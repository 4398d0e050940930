#include "registry.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>


namespace eventship::host {

namespace {

constexpr char kRegistrationSuffix[] = ".yaml";

template <typename T>
T Scalar(const YAML::Node& node, const char* key, T fallback) {
  const auto value = node[key];
  if (!value || value.IsNull()) {
    return fallback;
  }
  return value.as<T>();
}

} // namespace

const SourceRegistration* ProviderRegistration::FindSource(std::string_view source) const {
  auto it = sources.find(source);
  return it == sources.end() ? nullptr : &it->second;
}

void ValidateName(std::string_view kind, std::string_view name) {
  if (name.empty()) {
    throw std::invalid_argument(std::string(kind) + " name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(kind) + " name contains invalid character");
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument(std::string(kind) + " name must not be a relative path component");
  }
}

ProviderRegistration LoadProviderRegistration(const std::filesystem::path& path, std::string_view provider) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path.string());
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load registration " + path.string() + ": " + e.what());
  }

  ProviderRegistration reg;
  reg.name = std::string(provider);
  try {
    reg.log_file       = Scalar<std::string>(doc, "log_file", reg.name + ".evt");
    reg.max_size_bytes = Scalar<std::uint32_t>(doc, "max_size_bytes", 0);

    const auto sources = doc["sources"];
    if (sources && sources.IsMap()) {
      for (const auto& item : sources) {
        SourceRegistration src;
        src.provider                = reg.name;
        src.source                  = item.first.as<std::string>();
        const auto& node            = item.second;
        src.event_message_files     = message::MessageFileSet::Parse(Scalar<std::string>(node, "event_message_file", ""));
        src.parameter_message_files = message::MessageFileSet::Parse(Scalar<std::string>(node, "parameter_message_file", ""));
        src.category_message_files  = message::MessageFileSet::Parse(Scalar<std::string>(node, "category_message_file", ""));
        src.category_count          = Scalar<std::uint32_t>(node, "category_count", 0);
        src.types_supported         = Scalar<std::uint32_t>(node, "types_supported", 0);
        reg.sources.emplace(src.source, std::move(src));
      }
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Invalid registration " + path.string() + ": " + e.what());
  }

  ValidateName("log file", reg.log_file);
  return reg;
}

// ------------------------------------------------------------
// Registry
// ------------------------------------------------------------

Registry::Registry(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path Registry::ProviderPath(std::string_view provider) const {
  ValidateName("provider", provider);
  return root_ / (std::string(provider) + kRegistrationSuffix);
}

std::optional<ProviderRegistration> Registry::FindProvider(std::string_view provider) const {
  const auto path = ProviderPath(provider);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  return LoadProviderRegistration(path, provider);
}

std::optional<std::string> Registry::ProviderForSource(std::string_view source) const {
  for (const auto& provider : Providers()) {
    auto reg = FindProvider(provider);
    if (reg && reg->FindSource(source)) {
      return provider;
    }
  }
  return std::nullopt;
}

std::vector<std::string> Registry::Providers() const {
  std::vector<std::string> names;
  std::error_code          ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    return names;
  }
  for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != kRegistrationSuffix) {
      continue;
    }
    names.push_back(entry.path().stem().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace eventship::host
