#pragma once

#include <string>
#include <utility>

namespace impact::inventory {

/*
  Portable inventory result codes.

  Inventory sources translate backend errors into these; the analysis
  layers never see backend error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  ConstraintViolation,

  IOError,
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

} // namespace impact::inventory
