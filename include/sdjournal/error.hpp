#ifndef SDJOURNAL_ERROR_HPP
#define SDJOURNAL_ERROR_HPP

#include <cerrno>
#include <string>

namespace sdjournal {

/**
 * @brief the kind of failure reported by an sdjournal operation.
 */
enum class ErrorKind {
  SUCCESS = 0,
  // caller-supplied data violated a local precondition. No I/O happened.
  VALIDATION_ERROR = 1,
  // a libsystemd call returned a negative errno-style status.
  IO_ERROR = 2,
  // a value could not be converted without losing range.
  OVERFLOW_ERROR = 3,
};

/**
 * @brief result of every fallible sdjournal operation. `code` is a positive errno value.
 */
struct Error {
  ErrorKind kind = ErrorKind::SUCCESS;
  int code = 0;

  bool ok() const { return kind == ErrorKind::SUCCESS; }

  static Error success() { return Error{}; }
  static Error validation(int code) { return Error{ErrorKind::VALIDATION_ERROR, code}; }
  static Error io(int code) { return Error{ErrorKind::IO_ERROR, code}; }
  static Error overflow() { return Error{ErrorKind::OVERFLOW_ERROR, EOVERFLOW}; }

  /**
   * @brief wraps a libsystemd return value. Negative values become IO_ERROR{-ret}, everything
   * else is success.
   */
  static Error from_return(int ret);
};

inline bool operator==(const Error &a, const Error &b) {
  return a.kind == b.kind && a.code == b.code;
}

/**
 * @brief provides the name for an ErrorKind as a static C string.
 */
const char *name_for_error_kind(ErrorKind kind);

/**
 * @brief renders an error as "<kind>: <strerror(code)>".
 */
std::string describe(const Error &err);

} // namespace sdjournal

#endif
