#ifndef LOOPMUX_RESULT_H
#define LOOPMUX_RESULT_H

#include <cstddef>
#include <variant>

#include "loopmux/json.h"

namespace loopmux {

// Value or Error
template <typename T>
using Result = std::variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
bool is_success(const Result<T>& result) {
  return std::holds_alternative<T>(result);
}

template <typename T>
bool is_error(const Result<T>& result) {
  return std::holds_alternative<Error>(result);
}

template <typename T>
const T* get_value(const Result<T>& result) {
  return std::get_if<T>(&result);
}

template <typename T>
const Error* get_error(const Result<T>& result) {
  return std::get_if<Error>(&result);
}

}  // namespace loopmux

#endif  // LOOPMUX_RESULT_H
