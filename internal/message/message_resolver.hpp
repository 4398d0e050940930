#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/message/message_file.hpp"

namespace eventship::message {

/*
  Ordered list of message file paths registered for one source.

  Order is significant: the first file that knows a message id wins.
*/
class MessageFileSet {
 public:
  MessageFileSet() = default;
  explicit MessageFileSet(std::vector<std::string> paths);

  // Parses a registration value: ';' separated, whitespace trimmed,
  // %VAR% references expanded, empty items dropped.
  static MessageFileSet Parse(std::string_view value);

  const std::vector<std::string>& paths() const {
    return paths_;
  }

  bool empty() const {
    return paths_.empty();
  }

  std::string ToString() const;

 private:
  std::vector<std::string> paths_;
};

enum class ResolutionStatus {
  kResolved,
  kFallback, // no message file knows the event id
};

struct Resolution {
  std::string      text;
  ResolutionStatus status = ResolutionStatus::kFallback;
  std::string      message_file; // file that produced the template, empty on fallback
};

/*
  Text used when no message file yields a template for an event id.
*/
std::string FallbackMessage(std::uint16_t event_code, std::string_view source_name, const std::vector<std::string>& parameters);

/*
  Resolves event ids into rendered text by searching message file sets.

  Parsed files are cached by path for the lifetime of the instance; files
  that fail to load are cached as absent. Lookups take a shared lock, a
  cache miss loads under the exclusive lock so each file is parsed once.
  One resolver belongs to one engine session.
*/
class MessageResolver {
 public:
  explicit MessageResolver(std::uint32_t language_id = kLanguageNeutral);

  Resolution Resolve(const MessageFileSet& files, std::string_view source_name, std::uint16_t event_code,
                     std::uint16_t qualifier, const std::vector<std::string>& parameters);

  // Pure ordered search; nullopt when every file in the set lacks the id.
  std::optional<std::string> Lookup(const MessageFileSet& files, std::uint32_t message_id);

  // Replaces "%%<n>" inserts with message <n> from the parameter files.
  std::vector<std::string> ExpandParameterInserts(const MessageFileSet& parameter_files, std::vector<std::string> parameters);

  // Category text, empty when unknown.
  std::string ResolveCategory(const MessageFileSet& category_files, std::uint16_t category);

  std::size_t CachedFileCount() const;
  void        ReleaseCache();

 private:
  std::shared_ptr<const MessageFile> Table(const std::string& path);

  std::uint32_t language_id_;

  mutable std::shared_mutex                                            mutex_;
  std::unordered_map<std::string, std::shared_ptr<const MessageFile>> cache_;
};

} // namespace eventship::message
