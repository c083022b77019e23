#include <cstring>

#include "sdjournal/error.hpp"

namespace sdjournal {

Error Error::from_return(int ret) {
  if (ret < 0) {
    return Error::io(-ret);
  }
  return Error::success();
}

const char *name_for_error_kind(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SUCCESS:
    return "success";
  case ErrorKind::VALIDATION_ERROR:
    return "validation error";
  case ErrorKind::IO_ERROR:
    return "io error";
  case ErrorKind::OVERFLOW_ERROR:
    return "overflow error";
  default:
    return "unknown error";
  }
}

std::string describe(const Error &err) {
  if (err.ok()) {
    return name_for_error_kind(err.kind);
  }
  std::string out = name_for_error_kind(err.kind);
  out += ": ";
  out += strerror(err.code);
  return out;
}

} // namespace sdjournal
