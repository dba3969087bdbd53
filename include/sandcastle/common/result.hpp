#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sandcastle::common {

enum class ErrorCode {
  Internal,
  Config,
  UnknownRuntime,
  NotFound,
  Backend,
  Bootstrap,
  InvalidArgument,
};

[[nodiscard]] inline const char *error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Internal:
    return "internal";
  case ErrorCode::Config:
    return "config";
  case ErrorCode::UnknownRuntime:
    return "unknown_runtime";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Backend:
    return "backend";
  case ErrorCode::Bootstrap:
    return "bootstrap";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  }
  return "internal";
}

class Status {
public:
  static Status success() { return Status(true, "", ErrorCode::Internal); }
  static Status error(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Status(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), "", ErrorCode::Internal);
  }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Result(false, std::nullopt, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorCode code)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorCode code_;
};

} // namespace sandcastle::common
