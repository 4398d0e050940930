#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "internal/host/log_host.hpp"
#include "internal/record/record.hpp"
#include "internal/util/result.hpp"

namespace eventship::host {

class LogFile;

/*
  Appends records to the log a source is registered under.

  Each Report takes the exclusive file lock, assigns the next record
  number, writes the record and only then advances the header. When the
  provider has a max size and the record would not fit, the log is rotated
  first: the old file is kept as <log>-<creation time>.evt beside it and
  numbering restarts at 1.
*/
class LogWriter {
 public:
  LogWriter(const LogHost& host, std::string source_name);
  ~LogWriter();

  LogWriter(const LogWriter&)            = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  util::Result Report(record::EventType type, std::uint32_t event_id, const std::vector<std::string>& strings,
                      std::span<const std::uint8_t> data = {}, std::uint16_t category = 0);

  util::Result Info(std::uint32_t event_id, std::string_view message);
  util::Result Warning(std::uint32_t event_id, std::string_view message);
  util::Result Error(std::uint32_t event_id, std::string_view message);
  util::Result Success(std::uint32_t event_id, std::string_view message);

  // Makes every Report durable before it returns.
  void SetSync(bool sync) {
    sync_ = sync;
  }

  const std::string& log_name() const {
    return target_.log_name;
  }

  void Close();

 private:
  util::Result Append(const std::vector<std::uint8_t>& encoded, record::Record& rec);
  void         Reopen();

  const LogHost&           host_;
  std::string              source_name_;
  std::string              computer_name_;
  LogTarget                target_;
  std::unique_ptr<LogFile> file_;
  bool                     sync_ = false;
};

} // namespace eventship::host
