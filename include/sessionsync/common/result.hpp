#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sessionsync::common {

namespace detail {

inline std::string describe_error(const std::string &error) { return error; }

template <typename E> std::string describe_error(const E &error) { return error.to_string(); }

} // namespace detail

class Status {
public:
  static Status success() { return Status(true, ""); }
  static Status error(std::string message) { return Status(false, std::move(message)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status(bool ok, std::string error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  std::string error_;
};

/// Value-or-error. E defaults to a plain message; subsystems that need
/// classifiable failures pass their own error type (which must provide to_string()).
template <typename T, typename E = std::string> class Result {
public:
  static Result success(T value) { return Result(std::move(value), std::nullopt); }
  static Result failure(E error) { return Result(std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + detail::describe_error(*error_));
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok()) {
      throw std::logic_error("Result has no value: " + detail::describe_error(*error_));
    }
    return *value_;
  }

  [[nodiscard]] const E &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  Result(std::optional<T> value, std::optional<E> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<E> error_;
};

template <typename E> class Result<void, E> {
public:
  static Result success() { return Result(std::nullopt); }
  static Result failure(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool ok() const { return !error_.has_value(); }

  [[nodiscard]] const E &error() const {
    if (ok()) {
      throw std::logic_error("Result has no error");
    }
    return *error_;
  }

private:
  explicit Result(std::optional<E> error) : error_(std::move(error)) {}

  std::optional<E> error_;
};

} // namespace sessionsync::common
