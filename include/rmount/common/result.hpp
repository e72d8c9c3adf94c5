#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rmount::common {

enum class ErrorCode {
  None,
  AlreadyMounted,
  MountpointReserved,
  Launch,
  ReadinessTimeout,
  ProcessCrashed,
  MountLost,
  RestartsExhausted,
  UnmountTimeout,
  Cancelled,
  InvalidArgument,
  Io,
  Config,
  Internal,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code);

class Status {
public:
  static Status success() { return Status(ErrorCode::None, ""); }
  static Status error(std::string message) {
    return Status(ErrorCode::Internal, std::move(message));
  }
  static Status error(ErrorCode code, std::string message) {
    return Status(code, std::move(message));
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorCode code, std::string error) : code_(code), error_(std::move(error)) {}

  ErrorCode code_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorCode::None, std::move(value), ""); }
  static Result failure(std::string message) {
    return Result(ErrorCode::Internal, std::nullopt, std::move(message));
  }
  static Result failure(ErrorCode code, std::string message) {
    return Result(code, std::nullopt, std::move(message));
  }
  static Result failure(const Status &status) {
    return Result(status.code(), std::nullopt, status.error());
  }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::None; }
  [[nodiscard]] ErrorCode code() const { return code_; }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] Status status() const {
    return ok() ? Status::success() : Status::error(code_, error_);
  }

private:
  Result(ErrorCode code, std::optional<T> value, std::string error)
      : code_(code), value_(std::move(value)), error_(std::move(error)) {}

  ErrorCode code_;
  std::optional<T> value_;
  std::string error_;
};

inline std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::AlreadyMounted:
    return "already_mounted";
  case ErrorCode::MountpointReserved:
    return "mountpoint_reserved";
  case ErrorCode::Launch:
    return "launch_error";
  case ErrorCode::ReadinessTimeout:
    return "readiness_timeout";
  case ErrorCode::ProcessCrashed:
    return "process_crashed";
  case ErrorCode::MountLost:
    return "mount_lost";
  case ErrorCode::RestartsExhausted:
    return "restarts_exhausted";
  case ErrorCode::UnmountTimeout:
    return "unmount_timeout";
  case ErrorCode::Cancelled:
    return "cancelled";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Io:
    return "io_error";
  case ErrorCode::Config:
    return "config_error";
  case ErrorCode::Internal:
    return "internal_error";
  }
  return "unknown";
}

} // namespace rmount::common
