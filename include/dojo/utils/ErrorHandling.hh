#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace dojo {

/**
 * @brief Exception raised for programming errors (bad transitions, bad config values)
 */
class DojoException : public std::exception {
public:
  explicit DojoException(const std::string &message);
  const char *what() const noexcept override;

private:
  std::string message;
};

// Logs at error level, then throws DojoException.
[[noreturn]] void throwError(const std::string &message);

// Error code for fallible I/O (config files, recordings)
enum class ErrorCode : uint16_t {
  Ok = 0,
  InvalidState,
  NotFound,
  ParseError,
  OutOfRange,
  IoError,
  Internal
};

std::string_view errorCodeToString(ErrorCode code);

// Result type combining value + error. Move-only.
template <typename T>
class Result {
public:
  static Result ok(T value) { return Result(std::move(value)); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

  T &value() {
    if (isError())
      throwError("Result contains error: " + message_);
    return *value_;
  }

  const T &value() const {
    if (isError())
      throwError("Result contains error: " + message_);
    return *value_;
  }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  explicit Result(T value)
      : code_(ErrorCode::Ok), value_(std::move(value)) {}

  Result(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code_;
  std::string message_;
  std::optional<T> value_;
};

template <>
class Result<void> {
public:
  static Result ok() { return Result(); }

  static Result error(ErrorCode code, std::string message = "") {
    return Result(code, std::move(message));
  }

  bool isOk() const { return code_ == ErrorCode::Ok; }
  bool isError() const { return code_ != ErrorCode::Ok; }
  ErrorCode code() const { return code_; }
  const std::string &message() const { return message_; }

  Result(Result &&) = default;
  Result &operator=(Result &&) = default;
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;

private:
  Result() : code_(ErrorCode::Ok) {}

  Result(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code_;
  std::string message_;
};

} // namespace dojo
