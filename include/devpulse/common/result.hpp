#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace devpulse::common {

enum class ErrorKind {
  None,
  Validation,
  Transport,
  NotFound,
  Cancelled,
  Internal,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::Transport:
    return "transport";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

class Status {
public:
  static Status success() { return Status(ErrorKind::None, ""); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Status(kind == ErrorKind::None ? ErrorKind::Internal : kind, std::move(message));
  }
  static Status validation(std::string message) {
    return Status(ErrorKind::Validation, std::move(message));
  }
  static Status not_found(std::string message) {
    return Status(ErrorKind::NotFound, std::move(message));
  }
  static Status cancelled(std::string message) {
    return Status(ErrorKind::Cancelled, std::move(message));
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }
  [[nodiscard]] bool is(ErrorKind kind) const { return kind_ == kind; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(ErrorKind kind, std::string error) : kind_(kind), error_(std::move(error)) {}

  ErrorKind kind_;
  std::string error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(ErrorKind::None, std::move(value), ""); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::Internal) {
    return Result(kind == ErrorKind::None ? ErrorKind::Internal : kind, std::nullopt,
                  std::move(message));
  }
  static Result failure(const Status &status) {
    return failure(status.error(), status.kind());
  }

  [[nodiscard]] bool ok() const { return kind_ == ErrorKind::None; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

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
    return ok() ? Status::success() : Status::error(error_, kind_);
  }

private:
  Result(ErrorKind kind, std::optional<T> value, std::string error)
      : kind_(kind), value_(std::move(value)), error_(std::move(error)) {}

  ErrorKind kind_;
  std::optional<T> value_;
  std::string error_;
};

} // namespace devpulse::common
