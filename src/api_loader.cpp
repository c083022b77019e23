#include <cstdio>

#include <dlfcn.h>

#include "sdjournal/api_loader.hpp"

namespace sdjournal {

namespace {

template <typename Fn> bool resolve(void *handle, const char *soname, const char *symbol, Fn *out) {
  void *sym = dlsym(handle, symbol);
  if (sym == NULL) {
    fprintf(stderr, "sdjournal: %s is missing from %s\n", symbol, soname);
    return false;
  }
  *out = reinterpret_cast<Fn>(sym);
  return true;
}

} // namespace

Error ApiLoader::get(const Api **out) {
  std::call_once(once_, [this] {
    Api api;
    err_ = load_(&api);
    if (err_.ok()) {
      api_ = api;
    }
  });
  if (!err_.ok()) {
    return err_;
  }
  *out = &api_;
  return Error::success();
}

Error load_library_api(const char *soname, Api *out) {
  // on success the handle stays open for the life of the process.
  void *handle = dlopen(soname, RTLD_NOW | RTLD_LOCAL);
  if (handle == NULL) {
    fprintf(stderr, "sdjournal: failed to load %s: %s\n", soname, dlerror());
    return Error::io(ENOSYS);
  }
  Api api;
  bool ok = resolve(handle, soname, "sd_journal_sendv", &api.sendv) &&
            resolve(handle, soname, "sd_journal_open", &api.open) &&
            resolve(handle, soname, "sd_journal_open_namespace", &api.open_namespace) &&
            resolve(handle, soname, "sd_journal_close", &api.close) &&
            resolve(handle, soname, "sd_journal_set_data_threshold", &api.set_data_threshold) &&
            resolve(handle, soname, "sd_journal_next", &api.next) &&
            resolve(handle, soname, "sd_journal_previous", &api.previous) &&
            resolve(handle, soname, "sd_journal_seek_head", &api.seek_head) &&
            resolve(handle, soname, "sd_journal_seek_tail", &api.seek_tail) &&
            resolve(handle, soname, "sd_journal_seek_cursor", &api.seek_cursor) &&
            resolve(handle, soname, "sd_journal_seek_realtime_usec", &api.seek_realtime_usec) &&
            resolve(handle, soname, "sd_journal_get_cursor", &api.get_cursor) &&
            resolve(handle, soname, "sd_journal_test_cursor", &api.test_cursor) &&
            resolve(handle, soname, "sd_journal_get_realtime_usec", &api.get_realtime_usec) &&
            resolve(handle, soname, "sd_journal_get_monotonic_usec", &api.get_monotonic_usec) &&
            resolve(handle, soname, "sd_journal_restart_data", &api.restart_data) &&
            resolve(handle, soname, "sd_journal_enumerate_data", &api.enumerate_data) &&
            resolve(handle, soname, "sd_journal_add_match", &api.add_match) &&
            resolve(handle, soname, "sd_journal_add_disjunction", &api.add_disjunction) &&
            resolve(handle, soname, "sd_journal_wait", &api.wait);
  if (!ok) {
    dlclose(handle);
    return Error::io(ENOSYS);
  }
  *out = api;
  return Error::success();
}

} // namespace sdjournal
