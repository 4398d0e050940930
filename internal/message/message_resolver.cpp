#include "message_resolver.hpp"

#include <exception>
#include <mutex>

#include "internal/message/message_template.hpp"
#include "internal/observability/logging.hpp"
#include "internal/record/record.hpp"
#include "internal/util/env.hpp"

namespace eventship::message {

using observability::IntField;
using observability::StringField;

namespace {

constexpr char kFallbackFormat[] =
    "The description for Event ID (%1) in Source (%2) cannot be found. The local computer may not have the necessary "
    "registry information or message files to display messages from a remote computer. The following information is "
    "part of the event: %3";

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

// "%%1234" -> 1234
std::optional<std::uint32_t> ParameterReference(std::string_view insert) {
  if (insert.size() < 3 || insert.size() > 12 || insert[0] != '%' || insert[1] != '%') {
    return std::nullopt;
  }
  std::uint64_t id = 0;
  for (char c : insert.substr(2)) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    id = id * 10 + static_cast<std::uint64_t>(c - '0');
  }
  if (id > 0xFFFFFFFF) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(id);
}

} // namespace

// ------------------------------------------------------------
// MessageFileSet
// ------------------------------------------------------------

MessageFileSet::MessageFileSet(std::vector<std::string> paths) : paths_(std::move(paths)) {
}

MessageFileSet MessageFileSet::Parse(std::string_view value) {
  std::vector<std::string> paths;
  while (!value.empty()) {
    const auto sep  = value.find(';');
    const auto item = Trim(value.substr(0, sep));
    if (!item.empty()) {
      paths.push_back(util::ExpandEnvironmentStrings(item));
    }
    if (sep == std::string_view::npos) {
      break;
    }
    value.remove_prefix(sep + 1);
  }
  return MessageFileSet(std::move(paths));
}

std::string MessageFileSet::ToString() const {
  std::string out;
  for (const auto& path : paths_) {
    if (!out.empty()) {
      out.push_back(';');
    }
    out += path;
  }
  return out;
}

std::string FallbackMessage(std::uint16_t event_code, std::string_view source_name, const std::vector<std::string>& parameters) {
  std::string joined;
  for (const auto& param : parameters) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += param;
  }
  return RenderTemplate(kFallbackFormat, {std::to_string(event_code), std::string(source_name), joined});
}

// ------------------------------------------------------------
// MessageResolver
// ------------------------------------------------------------

MessageResolver::MessageResolver(std::uint32_t language_id) : language_id_(language_id) {
}

std::shared_ptr<const MessageFile> MessageResolver::Table(const std::string& path) {
  {
    std::shared_lock lock(mutex_);
    auto             it = cache_.find(path);
    if (it != cache_.end()) {
      return it->second;
    }
  }

  std::unique_lock lock(mutex_);
  auto             it = cache_.find(path);
  if (it != cache_.end()) {
    return it->second;
  }

  std::shared_ptr<const MessageFile> file;
  try {
    file = std::make_shared<const MessageFile>(MessageFile::Load(path));
    EVENTSHIP_LOG_DEBUG("Loaded message file", {StringField("path", path), IntField("messages", static_cast<std::int64_t>(file->MessageCount()))});
  } catch (const std::exception& e) {
    EVENTSHIP_LOG_WARN("Message file unavailable", {StringField("path", path), StringField("error", e.what())});
  }
  cache_.emplace(path, file);
  return file;
}

std::optional<std::string> MessageResolver::Lookup(const MessageFileSet& files, std::uint32_t message_id) {
  for (const auto& path : files.paths()) {
    auto table = Table(path);
    if (!table) {
      continue;
    }
    if (auto text = table->Find(message_id, language_id_)) {
      return std::string(*text);
    }
  }
  return std::nullopt;
}

Resolution MessageResolver::Resolve(const MessageFileSet& files, std::string_view source_name, std::uint16_t event_code,
                                    std::uint16_t qualifier, const std::vector<std::string>& parameters) {
  const std::uint32_t event_id = record::MakeEventId(qualifier, event_code);

  for (const auto& path : files.paths()) {
    auto table = Table(path);
    if (!table) {
      continue;
    }
    auto format = table->Find(event_id, language_id_);
    if (!format) {
      continue;
    }

    Resolution resolution;
    resolution.text         = std::string(TrimLineBreaks(RenderTemplate(*format, parameters)));
    resolution.status       = ResolutionStatus::kResolved;
    resolution.message_file = path;
    return resolution;
  }

  Resolution resolution;
  resolution.text   = FallbackMessage(event_code, source_name, parameters);
  resolution.status = ResolutionStatus::kFallback;
  return resolution;
}

std::vector<std::string> MessageResolver::ExpandParameterInserts(const MessageFileSet& parameter_files, std::vector<std::string> parameters) {
  if (parameter_files.empty()) {
    return parameters;
  }
  for (auto& param : parameters) {
    auto id = ParameterReference(param);
    if (!id) {
      continue;
    }
    if (auto text = Lookup(parameter_files, *id)) {
      param = std::string(TrimLineBreaks(*text));
    }
  }
  return parameters;
}

std::string MessageResolver::ResolveCategory(const MessageFileSet& category_files, std::uint16_t category) {
  if (category == 0 || category_files.empty()) {
    return {};
  }
  auto text = Lookup(category_files, category);
  if (!text) {
    return {};
  }
  return std::string(TrimLineBreaks(RenderTemplate(*text, {})));
}

std::size_t MessageResolver::CachedFileCount() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

void MessageResolver::ReleaseCache() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

} // namespace eventship::message
