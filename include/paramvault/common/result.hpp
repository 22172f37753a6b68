#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace paramvault::common {

enum class ErrorCode {
  Internal,
  InvalidArgument,
  NotInitialized,
  AlreadyInitialized,
  InputMismatch,
  AuthenticationFailed,
  NotFound,
  PermissionDenied,
  InvalidMethod,
  StorageError,
  DeviceUnavailable,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Internal:
    return "Internal";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::InputMismatch:
    return "InputMismatch";
  case ErrorCode::AuthenticationFailed:
    return "AuthenticationFailed";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::InvalidMethod:
    return "InvalidMethod";
  case ErrorCode::StorageError:
    return "StorageError";
  case ErrorCode::DeviceUnavailable:
    return "DeviceUnavailable";
  }
  return "Unknown";
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

template <> class Result<void> {
public:
  static Result success() { return Result(true, "", ErrorCode::Internal); }
  static Result failure(std::string message, ErrorCode code = ErrorCode::Internal) {
    return Result(false, std::move(message), code);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Result(bool ok, std::string error, ErrorCode code)
      : ok_(ok), error_(std::move(error)), code_(code) {}

  bool ok_;
  std::string error_;
  ErrorCode code_;
};

} // namespace paramvault::common
