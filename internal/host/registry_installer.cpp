#include "registry_installer.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <system_error>

namespace eventship::host {

namespace {

void EmitSource(YAML::Emitter& out, const SourceRegistration& source) {
  out << YAML::Key << source.source << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "event_message_file" << YAML::Value << YAML::DoubleQuoted << source.event_message_files.ToString();
  out << YAML::Key << "parameter_message_file" << YAML::Value << YAML::DoubleQuoted << source.parameter_message_files.ToString();
  out << YAML::Key << "category_message_file" << YAML::Value << YAML::DoubleQuoted << source.category_message_files.ToString();
  out << YAML::Key << "category_count" << YAML::Value << source.category_count;
  out << YAML::Key << "types_supported" << YAML::Value << source.types_supported;
  out << YAML::EndMap;
}

} // namespace

RegistryInstaller::RegistryInstaller(std::filesystem::path root) : registry_(std::move(root)) {
}

util::Result RegistryInstaller::Install(const SourceRegistration& source) {
  try {
    ValidateName("provider", source.provider);
    ValidateName("source", source.source);

    auto provider = registry_.FindProvider(source.provider);
    if (!provider) {
      provider           = ProviderRegistration{};
      provider->name     = source.provider;
      provider->log_file = source.provider + ".evt";
    }
    if (provider->FindSource(source.source)) {
      return util::Result::Err(util::ErrorCode::AlreadyExists, "source " + source.source + " already registered under " + source.provider);
    }
    provider->sources.emplace(source.source, source);
    return Save(*provider);
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
}

util::Result RegistryInstaller::RemoveSource(std::string_view provider_name, std::string_view source) {
  try {
    auto provider = registry_.FindProvider(provider_name);
    if (!provider) {
      return util::Result::Err(util::ErrorCode::NotFound, "provider " + std::string(provider_name) + " not registered");
    }
    auto it = provider->sources.find(source);
    if (it == provider->sources.end()) {
      return util::Result::Err(util::ErrorCode::NotFound, "source " + std::string(source) + " not registered");
    }
    provider->sources.erase(it);
    return Save(*provider);
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
}

util::Result RegistryInstaller::RemoveProvider(std::string_view provider) {
  std::error_code ec;
  std::filesystem::path path;
  try {
    path = registry_.ProviderPath(provider);
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
  if (!std::filesystem::remove(path, ec)) {
    if (ec) {
      return util::Result::Err(util::ErrorCode::IOError, "remove " + path.string() + ": " + ec.message());
    }
    return util::Result::Err(util::ErrorCode::NotFound, "provider " + std::string(provider) + " not registered");
  }
  return util::Result::Ok();
}

util::Result RegistryInstaller::SetMaxSize(std::string_view provider_name, std::uint32_t max_size_bytes) {
  try {
    auto provider = registry_.FindProvider(provider_name);
    if (!provider) {
      return util::Result::Err(util::ErrorCode::NotFound, "provider " + std::string(provider_name) + " not registered");
    }
    provider->max_size_bytes = max_size_bytes;
    return Save(*provider);
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, e.what());
  }
}

util::Result RegistryInstaller::Save(const ProviderRegistration& provider) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "log_file" << YAML::Value << provider.log_file;
  out << YAML::Key << "max_size_bytes" << YAML::Value << provider.max_size_bytes;
  out << YAML::Key << "sources" << YAML::Value << YAML::BeginMap;
  for (const auto& [name, source] : provider.sources) {
    EmitSource(out, source);
  }
  out << YAML::EndMap;
  out << YAML::EndMap;

  std::error_code ec;
  std::filesystem::create_directories(registry_.root(), ec);
  if (ec) {
    return util::Result::Err(util::ErrorCode::IOError, "create " + registry_.root().string() + ": " + ec.message());
  }

  const auto path = registry_.ProviderPath(provider.name);
  const auto tmp  = path.string() + ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    file << out.c_str() << '\n';
    if (!file) {
      return util::Result::Err(util::ErrorCode::IOError, "write " + tmp + " failed");
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    return util::Result::Err(util::ErrorCode::IOError, "rename " + tmp + ": " + ec.message());
  }
  return util::Result::Ok();
}

} // namespace eventship::host
