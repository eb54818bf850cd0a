#ifndef LOOPMUX_IO_RESULT_H
#define LOOPMUX_IO_RESULT_H

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>

namespace loopmux {

struct SystemError {
  int error_code;
  std::string message;

  SystemError(int code, const std::string& msg)
      : error_code(code), message(msg) {}
};

/**
 * Result of a system call: a value or the errno it failed with.
 * Socket code never throws; callers test ok() or wouldBlock().
 */
template <typename T>
struct IoResult {
  std::optional<T> value;
  std::optional<SystemError> error_info;

  bool ok() const { return value.has_value(); }
  explicit operator bool() const { return ok(); }

  T& operator*() { return *value; }
  const T& operator*() const { return *value; }
  T* operator->() { return &(*value); }
  const T* operator->() const { return &(*value); }

  static IoResult success(T val) {
    IoResult result;
    result.value = std::move(val);
    return result;
  }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg);
    return result;
  }

  static IoResult from_errno(int err) { return error(err, std::strerror(err)); }

  bool wouldBlock() const {
    if (!error_info)
      return false;
    return error_info->error_code == EAGAIN ||
           error_info->error_code == EWOULDBLOCK;
  }

  int error_code() const { return error_info ? error_info->error_code : 0; }

  std::string error_message() const {
    return error_info ? error_info->message : std::string();
  }
};

template <>
struct IoResult<std::nullptr_t> {
  std::optional<SystemError> error_info;

  bool ok() const { return !error_info.has_value(); }
  explicit operator bool() const { return ok(); }

  static IoResult success() { return IoResult(); }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg);
    return result;
  }

  static IoResult from_errno(int err) { return error(err, std::strerror(err)); }

  bool wouldBlock() const {
    if (!error_info)
      return false;
    return error_info->error_code == EAGAIN ||
           error_info->error_code == EWOULDBLOCK;
  }

  int error_code() const { return error_info ? error_info->error_code : 0; }

  std::string error_message() const {
    return error_info ? error_info->message : std::string();
  }
};

using IoCallResult = IoResult<size_t>;
using IoVoidResult = IoResult<std::nullptr_t>;

}  // namespace loopmux

#endif  // LOOPMUX_IO_RESULT_H
