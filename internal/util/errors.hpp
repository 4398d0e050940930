#pragma once

#include <stdexcept>
#include <string>

namespace eventship::util {

/*
  Central error types.

  Thrown for setup/configuration failures. Per-record and per-read
  failures are reported through result structs instead.
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace eventship::util
