#ifndef SDJOURNAL_API_HPP
#define SDJOURNAL_API_HPP

#include <systemd/sd-journal.h>

#include "sdjournal/error.hpp"

namespace sdjournal {

/**
 * @brief the libsystemd journal entry points used by sdjournal.
 *
 * The table is filled either from the symbols linked into the program, or from a copy of
 * libsystemd loaded at run time with dlopen (build with SDJOURNAL_DLOPEN). Callers never need
 * to know which; every call into libsystemd goes through this table.
 */
struct Api {
  decltype(&::sd_journal_sendv) sendv = nullptr;
  decltype(&::sd_journal_open) open = nullptr;
  decltype(&::sd_journal_open_namespace) open_namespace = nullptr;
  decltype(&::sd_journal_close) close = nullptr;
  decltype(&::sd_journal_set_data_threshold) set_data_threshold = nullptr;
  decltype(&::sd_journal_next) next = nullptr;
  decltype(&::sd_journal_previous) previous = nullptr;
  decltype(&::sd_journal_seek_head) seek_head = nullptr;
  decltype(&::sd_journal_seek_tail) seek_tail = nullptr;
  decltype(&::sd_journal_seek_cursor) seek_cursor = nullptr;
  decltype(&::sd_journal_seek_realtime_usec) seek_realtime_usec = nullptr;
  decltype(&::sd_journal_get_cursor) get_cursor = nullptr;
  decltype(&::sd_journal_test_cursor) test_cursor = nullptr;
  decltype(&::sd_journal_get_realtime_usec) get_realtime_usec = nullptr;
  decltype(&::sd_journal_get_monotonic_usec) get_monotonic_usec = nullptr;
  decltype(&::sd_journal_restart_data) restart_data = nullptr;
  decltype(&::sd_journal_enumerate_data) enumerate_data = nullptr;
  decltype(&::sd_journal_add_match) add_match = nullptr;
  decltype(&::sd_journal_add_disjunction) add_disjunction = nullptr;
  decltype(&::sd_journal_wait) wait = nullptr;
};

/**
 * @brief gets the process-wide Api table.
 *
 * For the dlopen backend the library is loaded on the first call only. Whatever the outcome of
 * that attempt, it is cached: later calls return the same table or the same error without
 * trying again.
 *
 * @returns IO_ERROR{ENOSYS} if libsystemd could not be loaded.
 */
Error load_api(const Api **out);

} // namespace sdjournal

#endif
