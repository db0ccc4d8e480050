#pragma once

#include "distill/common/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace distill::common {

class Status {
public:
  static Status success() { return Status(true, "", std::nullopt); }
  static Status error(std::string message) {
    return Status(false, std::move(message), std::nullopt);
  }
  static Status error(const DistillError &err) { return Status(false, err.to_string(), err.kind); }
  /// Rebuilds a failure from already-rendered text, keeping its kind.
  static Status error(std::string message, std::optional<ErrorKind> kind) {
    return Status(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  /// Set when the failure was raised through the error taxonomy.
  [[nodiscard]] std::optional<ErrorKind> kind() const { return kind_; }

private:
  Status(bool ok, std::string error, std::optional<ErrorKind> kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  std::optional<ErrorKind> kind_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), "", std::nullopt); }
  static Result failure(std::string message) {
    return Result(false, std::nullopt, std::move(message), std::nullopt);
  }
  static Result failure(const DistillError &err) {
    return Result(false, std::nullopt, err.to_string(), err.kind);
  }
  static Result failure(const Status &status) {
    return Result(false, std::nullopt, status.error(), status.kind());
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
  [[nodiscard]] std::optional<ErrorKind> kind() const { return kind_; }
  [[nodiscard]] Status status() const {
    return ok_ ? Status::success() : Status::error(error_, kind_);
  }

private:
  Result(bool ok, std::optional<T> value, std::string error, std::optional<ErrorKind> kind)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  std::optional<ErrorKind> kind_;
};

} // namespace distill::common
