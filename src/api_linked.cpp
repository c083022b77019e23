#include "sdjournal/api.hpp"

namespace sdjournal {

namespace {

Api make_linked_api() {
  Api api;
  api.sendv = &::sd_journal_sendv;
  api.open = &::sd_journal_open;
  api.open_namespace = &::sd_journal_open_namespace;
  api.close = &::sd_journal_close;
  api.set_data_threshold = &::sd_journal_set_data_threshold;
  api.next = &::sd_journal_next;
  api.previous = &::sd_journal_previous;
  api.seek_head = &::sd_journal_seek_head;
  api.seek_tail = &::sd_journal_seek_tail;
  api.seek_cursor = &::sd_journal_seek_cursor;
  api.seek_realtime_usec = &::sd_journal_seek_realtime_usec;
  api.get_cursor = &::sd_journal_get_cursor;
  api.test_cursor = &::sd_journal_test_cursor;
  api.get_realtime_usec = &::sd_journal_get_realtime_usec;
  api.get_monotonic_usec = &::sd_journal_get_monotonic_usec;
  api.restart_data = &::sd_journal_restart_data;
  api.enumerate_data = &::sd_journal_enumerate_data;
  api.add_match = &::sd_journal_add_match;
  api.add_disjunction = &::sd_journal_add_disjunction;
  api.wait = &::sd_journal_wait;
  return api;
}

} // namespace

Error load_api(const Api **out) {
  static const Api linked_api = make_linked_api();
  *out = &linked_api;
  return Error::success();
}

} // namespace sdjournal
