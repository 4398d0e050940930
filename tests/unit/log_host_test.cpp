#include "internal/host/log_host.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/host/log_file.hpp"
#include "internal/host/log_writer.hpp"
#include "internal/host/registry_installer.hpp"
#include "tests/common/test_host.hpp"

namespace {

using eventship::host::LogFile;
using eventship::host::LogWriter;
using eventship::testing::TestHost;
using eventship::util::ErrorCode;

std::uint32_t Count(const TestHost& env, const std::string& provider) {
  std::uint32_t count  = 0;
  auto          result = env.host()->RecordCount(provider, &count);
  assert(result);
  return count;
}

std::uint64_t CreationTime(const std::filesystem::path& path) {
  LogFile file(path, LogFile::Mode::kRead);
  auto    lock = file.LockShared();
  return file.ReadHeader()->creation_time_us;
}

void TestUnknownProviderResolvesToDefaultLog() {
  TestHost env("host_default");
  auto     target = env.host()->ResolveLog("No Such Provider");
  assert(target.used_default);
  assert(target.log_name == "Application");
  assert(target.path == env.log_dir() / "Application.evt");

  env.Install("Payroll", "Batch", "/opt/a.msg");
  auto registered = env.host()->ResolveLog("Payroll");
  assert(!registered.used_default);
  assert(registered.path == env.log_dir() / "Payroll.evt");
}

void TestWriterAppendsToItsProvidersLog() {
  TestHost env("host_writer");
  env.Install("Payroll", "Batch", "/opt/a.msg");

  LogWriter batch(*env.host(), "Batch");
  assert(batch.log_name() == "Payroll");
  assert(batch.Info(1, "one"));
  assert(batch.Warning(2, "two"));

  // unregistered sources land in the default log
  LogWriter stray(*env.host(), "Stray Source");
  assert(stray.log_name() == "Application");
  assert(stray.Error(3, "three"));

  assert(Count(env, "Payroll") == 2);
  assert(Count(env, "Application") == 1);

  // NUL bytes cannot survive the on-disk string table
  auto rejected = batch.Report(eventship::record::EventType::kInformation, 4, {std::string("a\0b", 3), "c"});
  assert(!rejected);
  assert(rejected.code == ErrorCode::InvalidArgument);
  assert(Count(env, "Payroll") == 2);
}

void TestClearRestartsNumberingAndKeepsBackup() {
  TestHost env("host_clear");
  env.Install("Payroll", "Batch", "/opt/a.msg");

  LogWriter writer(*env.host(), "Batch");
  for (int i = 0; i < 5; ++i) {
    assert(writer.Info(1, "x"));
  }

  const auto path    = env.log_dir() / "Payroll.evt";
  const auto before  = CreationTime(path);
  const auto backup  = env.root() / "payroll-backup.evt";
  assert(env.host()->ClearLog("Payroll", backup));
  assert(std::filesystem::exists(backup));
  assert(Count(env, "Payroll") == 0);
  assert(CreationTime(path) > before);

  // an existing backup is never overwritten
  auto again = env.host()->ClearLog("Payroll", backup);
  assert(!again);
  assert(again.code == ErrorCode::AlreadyExists);

  // the writer follows the replaced file
  assert(writer.Info(1, "after clear"));
  assert(Count(env, "Payroll") == 1);
}

void TestRotationOnMaxSize() {
  TestHost env("host_rotation");
  env.Install("Payroll", "Batch", "/opt/a.msg");
  eventship::host::RegistryInstaller installer(env.registry_dir());
  assert(installer.SetMaxSize("Payroll", 1024));

  LogWriter writer(*env.host(), "Batch");
  for (int i = 0; i < 40; ++i) {
    assert(writer.Info(1, "a message long enough to fill the log quickly"));
  }

  std::size_t rotated = 0;
  for (const auto& entry : std::filesystem::directory_iterator(env.log_dir())) {
    const auto name = entry.path().filename().string();
    if (name.rfind("Payroll-", 0) == 0) {
      ++rotated;
    }
  }
  assert(rotated >= 1);
  assert(Count(env, "Payroll") < 40);
}

} // namespace

int main() {
  TestUnknownProviderResolvesToDefaultLog();
  TestWriterAppendsToItsProvidersLog();
  TestClearRestartsNumberingAndKeepsBackup();
  TestRotationOnMaxSize();

  std::cout << "eventship_unit_log_host: pass\n";
  return 0;
}
