#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/host/log_host.hpp"
#include "internal/host/log_writer.hpp"
#include "internal/host/registry_installer.hpp"
#include "internal/message/message_file.hpp"
#include "internal/message/message_resolver.hpp"
#include "internal/record/record_codec.hpp"
#include "internal/session/session.hpp"
#include "internal/tailing/tailing_engine.hpp"

using namespace eventship;

static void Usage() {
  std::cout << "Usage:\n"
            << "  eventshipctl <config> install <provider> <source> <event_files> [parameter_files] [category_files]\n"
            << "  eventshipctl <config> uninstall <provider> [source]\n"
            << "  eventshipctl <config> set-max-size <provider> <bytes>\n"
            << "  eventshipctl <config> report <source> <type=info|warning|error|success|audit-success|audit-failure> <event_id> [strings...]\n"
            << "  eventshipctl <config> clear <provider> [backup_path]\n"
            << "  eventshipctl <config> count <provider>\n"
            << "  eventshipctl <config> read <provider> [resume_after] [max_records] [language_id]\n"
            << "  eventshipctl compile-messages <input.yaml> <output>\n";
}

static std::optional<record::EventType> ParseType(const std::string& value) {
  if (value == "info") return record::EventType::kInformation;
  if (value == "warning") return record::EventType::kWarning;
  if (value == "error") return record::EventType::kError;
  if (value == "success") return record::EventType::kSuccess;
  if (value == "audit-success") return record::EventType::kAuditSuccess;
  if (value == "audit-failure") return record::EventType::kAuditFailure;
  return std::nullopt;
}

static int Report(const util::Result& result) {
  if (!result) {
    std::cerr << util::ErrorCodeName(result.code) << ": " << result.message << "\n";
    return 2;
  }
  return 0;
}

/*
  Input:

    messages:
      - id: 1000
        language: 1033   # optional, 0 = neutral
        text: "The %1 service entered the %2 state."
*/
static int CompileMessages(const std::string& input, const std::string& output) {
  YAML::Node root = YAML::LoadFile(input);
  if (!root["messages"] || !root["messages"].IsSequence()) {
    std::cerr << "compile-messages: 'messages' sequence required\n";
    return 1;
  }

  message::MessageFileWriter writer;
  std::size_t                count = 0;
  for (const auto& entry : root["messages"]) {
    const auto language = entry["language"] ? entry["language"].as<std::uint32_t>() : message::kLanguageNeutral;
    writer.Add(language, entry["id"].as<std::uint32_t>(), entry["text"].as<std::string>());
    ++count;
  }
  writer.WriteTo(output);
  std::cout << "compiled " << count << " messages into " << output << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    if (std::string(argv[1]) == "compile-messages") {
      if (argc < 4) return 1;
      return CompileMessages(argv[2], argv[3]);
    }

    auto        config = config::ConfigLoader::LoadFromYaml(argv[1]);
    std::string cmd    = argv[2];

    host::LogHost           host(factory::BuildHostOptions(config));
    host::RegistryInstaller installer(config.host().registry_dir());

    // ------------------------------------------------------------

    if (cmd == "install") {
      if (argc < 6) return 1;

      host::SourceRegistration source;
      source.provider                = argv[3];
      source.source                  = argv[4];
      source.event_message_files     = message::MessageFileSet::Parse(argv[5]);
      source.parameter_message_files = argc > 6 ? message::MessageFileSet::Parse(argv[6]) : message::MessageFileSet{};
      source.category_message_files  = argc > 7 ? message::MessageFileSet::Parse(argv[7]) : message::MessageFileSet{};
      source.types_supported         = host::kTypesAll;
      return Report(installer.Install(source));
    }

    // ------------------------------------------------------------

    if (cmd == "uninstall") {
      if (argc < 4) return 1;
      if (argc > 4) {
        return Report(installer.RemoveSource(argv[3], argv[4]));
      }
      return Report(installer.RemoveProvider(argv[3]));
    }

    // ------------------------------------------------------------

    if (cmd == "set-max-size") {
      if (argc < 5) return 1;
      return Report(installer.SetMaxSize(argv[3], static_cast<std::uint32_t>(std::stoul(argv[4]))));
    }

    // ------------------------------------------------------------

    if (cmd == "report") {
      if (argc < 6) return 1;

      auto type = ParseType(argv[4]);
      if (!type) {
        std::cerr << "unsupported type: " << argv[4] << "\n";
        return 1;
      }

      std::vector<std::string> strings(argv + 6, argv + argc);
      host::LogWriter          writer(host, argv[3]);
      return Report(writer.Report(*type, static_cast<std::uint32_t>(std::stoul(argv[5])), strings));
    }

    // ------------------------------------------------------------

    if (cmd == "clear") {
      if (argc < 4) return 1;

      std::optional<std::filesystem::path> backup;
      if (argc > 4) backup = argv[4];
      return Report(host.ClearLog(argv[3], backup));
    }

    // ------------------------------------------------------------

    if (cmd == "count") {
      if (argc < 4) return 1;

      std::uint32_t count  = 0;
      auto          result = host.RecordCount(argv[3], &count);
      if (result) std::cout << count << "\n";
      return Report(result);
    }

    // ------------------------------------------------------------

    if (cmd == "read") {
      if (argc < 4) return 1;

      const std::uint32_t resume_after = argc > 4 ? static_cast<std::uint32_t>(std::stoul(argv[4])) : 0;
      const std::uint64_t max_records  = argc > 5 ? std::stoull(argv[5]) : UINT64_MAX;

      auto opened = session::Session::Open(host, argv[3], resume_after);
      if (!opened) {
        std::cerr << session::OpenErrorName(opened.error) << ": " << opened.message << "\n";
        return 2;
      }

      message::MessageResolver resolver(argc > 6 ? static_cast<std::uint32_t>(std::stoul(argv[6])) : 0);
      std::uint64_t            printed = 0;
      while (printed < max_records) {
        auto batch = opened.session->ReadBatch();
        if (!batch) {
          std::cerr << session::ReadErrorName(batch.error) << ": " << batch.message << "\n";
          return 2;
        }
        if (batch.records.empty()) break;

        for (const auto& raw : batch.records) {
          record::Record rec;
          auto           decoded = record::DecodeRecord(raw.bytes, &rec);
          if (!decoded) {
            std::cerr << "offset " << raw.offset << ": " << decoded.message << "\n";
            continue;
          }
          auto event = tailing::BuildEvent(resolver, opened.session->registration(), argv[3], rec);
          std::cout << event.record_number << " " << model::ToString(event) << "\n";
          if (++printed >= max_records) break;
        }
      }
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
