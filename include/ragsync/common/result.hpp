#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ragsync::common {

enum class ErrorCode {
  Internal,
  InvalidArgument,
  EncodingError,
  DimensionMismatch,
  LengthMismatch,
  IndexAbsent,
  NoMatch,
  GenerationError,
  SourceUnavailable,
  IoError,
  ConfigError,
};

[[nodiscard]] constexpr std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Internal:
    return "internal";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::EncodingError:
    return "encoding_error";
  case ErrorCode::DimensionMismatch:
    return "dimension_mismatch";
  case ErrorCode::LengthMismatch:
    return "length_mismatch";
  case ErrorCode::IndexAbsent:
    return "index_absent";
  case ErrorCode::NoMatch:
    return "no_match";
  case ErrorCode::GenerationError:
    return "generation_error";
  case ErrorCode::SourceUnavailable:
    return "source_unavailable";
  case ErrorCode::IoError:
    return "io_error";
  case ErrorCode::ConfigError:
    return "config_error";
  }
  return "unknown";
}

/// Errors caused by the caller's input rather than by the service.
[[nodiscard]] constexpr bool is_client_error(const ErrorCode code) {
  return code == ErrorCode::EncodingError || code == ErrorCode::DimensionMismatch ||
         code == ErrorCode::LengthMismatch || code == ErrorCode::InvalidArgument;
}

class Status {
public:
  static Status success() { return Status(true, ErrorCode::Internal, ""); }
  static Status error(std::string message) {
    return Status(false, ErrorCode::Internal, std::move(message));
  }
  static Status error(const ErrorCode code, std::string message) {
    return Status(false, code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorCode code() const { return code_; }

private:
  Status(bool ok, ErrorCode code, std::string error)
      : ok_(ok), code_(code), error_(std::move(error)) {}

  bool ok_;
  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), ErrorCode::Internal, "");
  }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, ErrorCode::Internal, std::move(message));
  }
  static Result failure(const ErrorCode code, std::string message) {
    return Result(false, std::nullopt, code, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(false, std::nullopt, status.code(), status.error());
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

  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(code_, error_);
  }

  /// Re-wraps this failure for a different value type.
  template <typename U> [[nodiscard]] Result<U> forward_failure() const {
    return Result<U>::failure(code_, error_);
  }

private:
  Result(bool ok, std::optional<T> value, ErrorCode code, std::string error)
      : ok_(ok), value_(std::move(value)), code_(code), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  ErrorCode code_;
  std::string error_;
};

} // namespace ragsync::common
