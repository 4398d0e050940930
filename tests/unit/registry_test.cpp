#include "internal/host/registry.hpp"

#include <cassert>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "internal/host/registry_installer.hpp"
#include "tests/common/test_host.hpp"

namespace {

using eventship::host::Registry;
using eventship::host::RegistryInstaller;
using eventship::host::SourceRegistration;
using eventship::testing::TestHost;
using eventship::util::ErrorCode;

void TestInstallThenFind() {
  TestHost env("registry_install");
  env.Install("Payroll", "Payroll Batch", "/opt/a.msg;/opt/b.msg", "/opt/params.msg");

  Registry registry(env.registry_dir());
  auto     provider = registry.FindProvider("Payroll");
  assert(provider);
  assert(provider->log_file == "Payroll.evt");
  assert(provider->max_size_bytes == 0);

  const auto* source = provider->FindSource("Payroll Batch");
  assert(source);
  assert(source->event_message_files.paths().size() == 2);
  assert(source->event_message_files.paths()[1] == "/opt/b.msg");
  assert(source->parameter_message_files.paths().size() == 1);
  assert(source->category_message_files.empty());
  assert(source->types_supported == eventship::host::kTypesAll);

  assert(!provider->FindSource("Other"));
  assert(registry.ProviderForSource("Payroll Batch") == std::string("Payroll"));
  assert(!registry.ProviderForSource("Nobody"));
}

void TestDuplicateSourceIsRejected() {
  TestHost env("registry_duplicate");
  env.Install("Payroll", "Batch", "/opt/a.msg");

  SourceRegistration again;
  again.provider = "Payroll";
  again.source   = "Batch";

  RegistryInstaller installer(env.registry_dir());
  auto              result = installer.Install(again);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
}

void TestRemoveSourceAndProvider() {
  TestHost env("registry_remove");
  env.Install("Payroll", "A", "/opt/a.msg");
  env.Install("Payroll", "B", "/opt/b.msg");

  RegistryInstaller installer(env.registry_dir());
  assert(installer.RemoveSource("Payroll", "A"));
  assert(installer.RemoveSource("Payroll", "A").code == ErrorCode::NotFound);

  Registry registry(env.registry_dir());
  auto     provider = registry.FindProvider("Payroll");
  assert(provider && provider->sources.size() == 1);

  assert(installer.RemoveProvider("Payroll"));
  assert(!registry.FindProvider("Payroll"));
  assert(installer.RemoveProvider("Payroll").code == ErrorCode::NotFound);
}

void TestSetMaxSize() {
  TestHost env("registry_max_size");
  env.Install("Payroll", "A", "/opt/a.msg");

  RegistryInstaller installer(env.registry_dir());
  assert(installer.SetMaxSize("Payroll", 4096));
  assert(installer.SetMaxSize("Missing", 1).code == ErrorCode::NotFound);

  Registry registry(env.registry_dir());
  assert(registry.FindProvider("Payroll")->max_size_bytes == 4096);
}

void TestHandWrittenRegistration() {
  TestHost env("registry_yaml");
  {
    std::ofstream out(env.registry_dir() / "System.yaml");
    out << "log_file: system.evt\n"
        << "sources:\n"
        << "  \"Service Control Manager\":\n"
        << "    event_message_file: \"/opt/services.msg\"\n"
        << "    category_count: 4\n";
  }

  Registry registry(env.registry_dir());
  auto     provider = registry.FindProvider("System");
  assert(provider->log_file == "system.evt");
  const auto* source = provider->FindSource("Service Control Manager");
  assert(source->category_count == 4);
  assert(source->types_supported == 0);

  auto providers = registry.Providers();
  assert(providers.size() == 1 && providers[0] == "System");
}

void TestInvalidNames() {
  TestHost env("registry_names");
  Registry registry(env.registry_dir());

  for (const char* name : {"", "..", "a/b"}) {
    bool threw = false;
    try {
      (void)registry.FindProvider(name);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestLogFileMustStayInLogDir() {
  TestHost env("registry_log_file");
  Registry registry(env.registry_dir());

  for (const char* log_file : {"/etc/passwd", "../outside.evt", "..", "sub/dir.evt"}) {
    {
      std::ofstream out(env.registry_dir() / "Escape.yaml", std::ios::trunc);
      out << "log_file: \"" << log_file << "\"\n";
    }
    bool threw = false;
    try {
      (void)registry.FindProvider("Escape");
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestInstallThenFind();
  TestDuplicateSourceIsRejected();
  TestRemoveSourceAndProvider();
  TestSetMaxSize();
  TestHandWrittenRegistration();
  TestInvalidNames();
  TestLogFileMustStayInLogDir();

  std::cout << "eventship_unit_registry: pass\n";
  return 0;
}
