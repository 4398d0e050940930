#include "message_file.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "internal/util/byte_order.hpp"

namespace eventship::message {

using util::AlignUp4;
using util::AppendLE16;
using util::AppendLE32;
using util::LoadLE16;
using util::LoadLE32;
using util::StoreLE32;

namespace {

constexpr std::size_t kFileHeaderSize = 16;
constexpr std::size_t kDirEntrySize   = 12;
constexpr std::size_t kBlockSize      = 12;
constexpr std::size_t kEntryHeader    = 4;

[[noreturn]] void Malformed(const std::string& what) {
  throw std::runtime_error("malformed message file: " + what);
}

bool InRange(std::uint64_t offset, std::uint64_t length, std::uint64_t size) {
  return offset <= size && length <= size - offset;
}

MessageTable ParseSection(std::span<const std::uint8_t> section) {
  if (section.size() < 4) {
    Malformed("section shorter than block count");
  }

  const std::uint32_t block_count = LoadLE32(section.data());
  if (!InRange(4, static_cast<std::uint64_t>(block_count) * kBlockSize, section.size())) {
    Malformed("block table runs past the section");
  }

  MessageTable table;
  for (std::uint32_t b = 0; b < block_count; ++b) {
    const auto*         block   = section.data() + 4 + b * kBlockSize;
    const std::uint32_t low_id  = LoadLE32(block);
    const std::uint32_t high_id = LoadLE32(block + 4);
    std::size_t         pos     = LoadLE32(block + 8);

    if (high_id < low_id) {
      Malformed("block with high id below low id");
    }

    for (std::uint64_t id = low_id; id <= high_id; ++id) {
      if (!InRange(pos, kEntryHeader, section.size())) {
        Malformed("entry header past the section");
      }
      const std::uint16_t length = LoadLE16(section.data() + pos);
      const std::uint16_t flags  = LoadLE16(section.data() + pos + 2);
      if (length < kEntryHeader || !InRange(pos, length, section.size())) {
        Malformed("entry length out of range for message " + std::to_string(id));
      }
      if (flags != kEntryFlagUtf8) {
        Malformed("unsupported entry encoding for message " + std::to_string(id));
      }

      const auto* text = reinterpret_cast<const char*>(section.data() + pos + kEntryHeader);
      std::string value(text, length - kEntryHeader);
      const auto  nul = value.find('\0');
      if (nul != std::string::npos) {
        value.resize(nul);
      }
      table.emplace(static_cast<std::uint32_t>(id), std::move(value));
      pos += length;
    }
  }
  return table;
}

} // namespace

MessageFile MessageFile::Parse(std::span<const std::uint8_t> bytes) {
  if (bytes.size() < kFileHeaderSize) {
    Malformed("file shorter than header");
  }
  if (LoadLE32(bytes.data()) != kMessageFileMagic) {
    Malformed("bad magic");
  }
  if (LoadLE16(bytes.data() + 4) != kMessageFileVersion) {
    Malformed("unsupported version " + std::to_string(LoadLE16(bytes.data() + 4)));
  }

  const std::uint32_t language_count = LoadLE32(bytes.data() + 8);
  if (!InRange(kFileHeaderSize, static_cast<std::uint64_t>(language_count) * kDirEntrySize, bytes.size())) {
    Malformed("language directory runs past the file");
  }

  MessageFile file;
  file.languages_.reserve(language_count);
  for (std::uint32_t i = 0; i < language_count; ++i) {
    const auto*         entry       = bytes.data() + kFileHeaderSize + i * kDirEntrySize;
    const std::uint32_t language_id = LoadLE32(entry);
    const std::uint32_t offset      = LoadLE32(entry + 4);
    const std::uint32_t size        = LoadLE32(entry + 8);
    if (!InRange(offset, size, bytes.size())) {
      Malformed("language section runs past the file");
    }
    file.languages_.emplace_back(language_id, ParseSection(bytes.subspan(offset, size)));
  }
  return file;
}

MessageFile MessageFile::Load(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open message file " + path.string());
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  try {
    return Parse(bytes);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(path.string() + ": " + e.what());
  }
}

const MessageTable* MessageFile::Table(std::uint32_t language_id) const {
  for (const auto& [id, table] : languages_) {
    if (id == language_id) {
      return &table;
    }
  }
  return nullptr;
}

std::optional<std::string_view> MessageFile::Find(std::uint32_t message_id, std::uint32_t language_id) const {
  const MessageTable* candidates[] = {
      language_id != kLanguageNeutral ? Table(language_id) : nullptr,
      Table(kLanguageNeutral),
      languages_.empty() ? nullptr : &languages_.front().second,
  };

  for (const auto* table : candidates) {
    if (!table) {
      continue;
    }
    auto it = table->find(message_id);
    if (it != table->end()) {
      return std::string_view(it->second);
    }
  }
  return std::nullopt;
}

std::vector<std::uint32_t> MessageFile::Languages() const {
  std::vector<std::uint32_t> ids;
  ids.reserve(languages_.size());
  for (const auto& entry : languages_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::size_t MessageFile::MessageCount() const {
  std::size_t count = 0;
  for (const auto& entry : languages_) {
    count += entry.second.size();
  }
  return count;
}

// ------------------------------------------------------------
// Writer
// ------------------------------------------------------------

void MessageFileWriter::Add(std::uint32_t language_id, std::uint32_t message_id, std::string text) {
  languages_[language_id][message_id] = std::move(text);
}

std::vector<std::uint8_t> MessageFileWriter::Build() const {
  std::vector<std::vector<std::uint8_t>> sections;
  sections.reserve(languages_.size());

  for (const auto& [language_id, messages] : languages_) {
    // Group consecutive ids into blocks.
    std::vector<std::pair<std::uint32_t, std::uint32_t>> blocks;
    for (const auto& [id, text] : messages) {
      if (!blocks.empty() && blocks.back().second != 0xFFFFFFFF && blocks.back().second + 1 == id) {
        blocks.back().second = id;
      } else {
        blocks.emplace_back(id, id);
      }
    }

    std::vector<std::uint8_t> entries;
    std::vector<std::uint32_t> block_offsets;
    const std::size_t          entries_start = 4 + blocks.size() * kBlockSize;
    for (const auto& [low, high] : blocks) {
      block_offsets.push_back(static_cast<std::uint32_t>(entries_start + entries.size()));
      for (std::uint64_t id = low; id <= high; ++id) {
        const auto&       text   = messages.at(static_cast<std::uint32_t>(id));
        const std::size_t length = AlignUp4(kEntryHeader + text.size() + 1);
        if (length > 0xFFFF) {
          throw std::invalid_argument("message " + std::to_string(id) + " is too long");
        }
        AppendLE16(entries, static_cast<std::uint16_t>(length));
        AppendLE16(entries, kEntryFlagUtf8);
        entries.insert(entries.end(), text.begin(), text.end());
        entries.resize(entries.size() + (length - kEntryHeader - text.size()), 0);
      }
    }

    std::vector<std::uint8_t> section;
    AppendLE32(section, static_cast<std::uint32_t>(blocks.size()));
    for (std::size_t i = 0; i < blocks.size(); ++i) {
      AppendLE32(section, blocks[i].first);
      AppendLE32(section, blocks[i].second);
      AppendLE32(section, block_offsets[i]);
    }
    section.insert(section.end(), entries.begin(), entries.end());
    sections.push_back(std::move(section));
  }

  std::vector<std::uint8_t> out;
  AppendLE32(out, kMessageFileMagic);
  AppendLE16(out, kMessageFileVersion);
  AppendLE16(out, 0);
  AppendLE32(out, static_cast<std::uint32_t>(languages_.size()));
  AppendLE32(out, 0);

  const std::size_t directory_at = out.size();
  out.resize(directory_at + languages_.size() * kDirEntrySize, 0);

  std::size_t i = 0;
  for (const auto& [language_id, messages] : languages_) {
    const auto& section = sections[i];
    auto*       entry   = out.data() + directory_at + i * kDirEntrySize;
    StoreLE32(entry, language_id);
    StoreLE32(entry + 4, static_cast<std::uint32_t>(out.size()));
    StoreLE32(entry + 8, static_cast<std::uint32_t>(section.size()));
    out.insert(out.end(), section.begin(), section.end());
    ++i;
  }
  return out;
}

void MessageFileWriter::WriteTo(const std::filesystem::path& path) const {
  const auto bytes    = Build();
  const auto tmp_path = path.string() + ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot create message file " + tmp_path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw std::runtime_error("failed writing message file " + tmp_path);
    }
  }

  std::filesystem::rename(tmp_path, path);
}

} // namespace eventship::message
