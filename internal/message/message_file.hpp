#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eventship::message {

/*
  Binary message resource file.

  Layout (little endian):

    header      magic "WEMT" u32, version u16, reserved u16,
                language_count u32, reserved u32
    directory   language_count x { language_id, section_offset, section_size }
    section     number_of_blocks u32,
                blocks x { low_id, high_id, offset_to_entries },
                entries x { length u16, flags u16, UTF-8 text, NUL padding }

  A section is the classic message-table resource: every id in
  [low_id, high_id] has exactly one entry, laid out consecutively from
  offset_to_entries (relative to the section start). Entry length includes
  its 4-byte header and is DWORD aligned.
*/

inline constexpr std::uint32_t kMessageFileMagic   = 0x544d4557; // "WEMT"
inline constexpr std::uint16_t kMessageFileVersion = 1;
inline constexpr std::uint16_t kEntryFlagUtf8      = 0x0000;

inline constexpr std::uint32_t kLanguageNeutral = 0x0000;
inline constexpr std::uint32_t kLanguageEnUs    = 0x0409;

using MessageTable = std::unordered_map<std::uint32_t, std::string>;

class MessageFile {
 public:
  // Throws std::runtime_error when the bytes are not a well-formed message file.
  static MessageFile Parse(std::span<const std::uint8_t> bytes);
  static MessageFile Load(const std::filesystem::path& path);

  /*
    Looks up a message by id.

    Language preference: `language_id`, then language neutral, then the
    first language section in the file.
  */
  std::optional<std::string_view> Find(std::uint32_t message_id, std::uint32_t language_id) const;

  std::vector<std::uint32_t> Languages() const;
  std::size_t                MessageCount() const;

 private:
  const MessageTable* Table(std::uint32_t language_id) const;

  std::vector<std::pair<std::uint32_t, MessageTable>> languages_;
};

/*
  Builds message files. Used by the message compiler and by tests.
*/
class MessageFileWriter {
 public:
  void Add(std::uint32_t language_id, std::uint32_t message_id, std::string text);

  std::vector<std::uint8_t> Build() const;

  // write tmp -> rename
  void WriteTo(const std::filesystem::path& path) const;

 private:
  std::map<std::uint32_t, std::map<std::uint32_t, std::string>> languages_;
};

} // namespace eventship::message
