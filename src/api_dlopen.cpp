#include "sdjournal/api_loader.hpp"

namespace sdjournal {

Error load_api(const Api **out) {
  static ApiLoader loader([](Api *api) { return load_library_api(LIBSYSTEMD_SONAME, api); });
  return loader.get(out);
}

} // namespace sdjournal
