#ifndef SDJOURNAL_API_LOADER_HPP
#define SDJOURNAL_API_LOADER_HPP

#include <functional>
#include <mutex>
#include <utility>

#include "sdjournal/api.hpp"
#include "sdjournal/error.hpp"

namespace sdjournal {

inline constexpr const char *LIBSYSTEMD_SONAME = "libsystemd.so.0";

/**
 * @brief fills an Api table once and hands out the cached outcome.
 *
 * The load function runs on the first call to get only, even when several threads call get at
 * once. If it fails, its error is returned by every later call and it is never run again.
 */
class ApiLoader {
public:
  using LoadFn = std::function<Error(Api *out)>;

  explicit ApiLoader(LoadFn load) : load_(std::move(load)) {}

  ApiLoader(const ApiLoader &) = delete;
  ApiLoader &operator=(const ApiLoader &) = delete;

  Error get(const Api **out);

private:
  std::once_flag once_;
  LoadFn load_;
  Api api_;
  Error err_;
};

/**
 * @brief loads the shared library `soname` with dlopen and resolves every Api entry point from
 * it. `*out` is only written if all of them resolve.
 *
 * @returns IO_ERROR{ENOSYS} if the library can't be loaded or lacks a symbol. The reason is
 * printed to stderr.
 */
Error load_library_api(const char *soname, Api *out);

} // namespace sdjournal

#endif
