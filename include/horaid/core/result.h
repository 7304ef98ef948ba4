#pragma once

#include <string_view>
#include <utility>
#include <variant>

namespace horaid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Each vocabulary has a to_string returning a stable, lower-case reason phrase.

// ClockError: the wall clock cannot be used to stamp an identifier.
enum class ClockError {
  kBeforeReferenceEpoch,
};

// FormatError: textual identifier input is malformed.
enum class FormatError {
  kWrongLength,
  kInvalidHex,
};

// GenerateError: a generator could not issue an identifier.
// kSequenceExhausted and kRetryBudgetExhausted are capacity errors: the current
// time bucket cannot hold another unique identifier.
enum class GenerateError {
  kClockBeforeEpoch,
  kSequenceExhausted,
  kRetryBudgetExhausted,
};

[[nodiscard]] inline std::string_view to_string(ClockError e) {
  switch (e) {
    case ClockError::kBeforeReferenceEpoch:
      return "clock reads before reference epoch";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

[[nodiscard]] inline std::string_view to_string(FormatError e) {
  switch (e) {
    case FormatError::kWrongLength:
      return "wrong length";
    case FormatError::kInvalidHex:
      return "invalid hex";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

[[nodiscard]] inline std::string_view to_string(GenerateError e) {
  switch (e) {
    case GenerateError::kClockBeforeEpoch:
      return "clock reads before reference epoch";
    case GenerateError::kSequenceExhausted:
      return "sequence exhausted for current time bucket";
    case GenerateError::kRetryBudgetExhausted:
      return "dedup retry budget exhausted for current time bucket";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace horaid::core
