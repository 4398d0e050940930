#pragma once

#include <string>
#include <utility>

namespace eventship::util {

/*
  Portable result codes for operations whose failure is an expected branch
  (store writes, host administration).

  Backends translate their native errors (errno, sqlite) into these.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  IOError,
  Corruption,

  InvalidArgument,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ErrorCodeName(ErrorCode code);

} // namespace eventship::util
