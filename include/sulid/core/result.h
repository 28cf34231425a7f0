#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace sulid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// DecodeError is returned when text cannot be parsed as an identifier.
enum class DecodeError {
  kInvalidLength,  // not exactly the fixed encoded length
  kInvalidChar,    // character outside the Base32 alphabet
};

// EncodeError is returned when a caller-provided buffer cannot hold the encoding.
enum class EncodeError {
  kBufferTooSmall,
};

[[nodiscard]] std::string to_string(DecodeError error);
[[nodiscard]] std::string to_string(EncodeError error);

// PreconditionViolation signals a caller bug: an identity field out of range at
// generator construction, or any out-of-range part when strict assertions are on.
// It is not meant to be caught and retried.
class PreconditionViolation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// require throws PreconditionViolation with `message` when `condition` is false.
inline void require(const bool condition, const char* message) {
  if (!condition) {
    throw PreconditionViolation(message);
  }
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace sulid::core
