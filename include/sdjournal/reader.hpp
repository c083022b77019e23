#ifndef SDJOURNAL_READER_HPP
#define SDJOURNAL_READER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <systemd/sd-journal.h>

#include "sdjournal/api.hpp"
#include "sdjournal/entry.hpp"
#include "sdjournal/error.hpp"

namespace sdjournal {

/**
 * @brief the set of journal files to read.
 */
enum class Files {
  // both the system-wide journal and the current user's journal.
  ALL,
  SYSTEM,
  CURRENT_USER,
};

struct ReaderConfig {
  Files files = Files::ALL;
  // open only volatile journal files, excluding those stored on persistent storage.
  bool only_volatile = false;
  // open only journal files generated on the local machine.
  bool only_local = false;
  // read from all namespaces. Only used by Reader::open_namespace.
  bool all_namespaces = false;
  // read from the given namespace and the default namespace. Only used by
  // Reader::open_namespace.
  bool include_default_namespace = false;
};

/**
 * @brief why a wait on the journal returned.
 */
enum WakeupType {
  WAKEUP_NOP = SD_JOURNAL_NOP,
  WAKEUP_APPEND = SD_JOURNAL_APPEND,
  WAKEUP_INVALIDATE = SD_JOURNAL_INVALIDATE,
};

/**
 * @brief a position to seek the journal to.
 */
class Seek {
public:
  enum Kind {
    // before the first entry.
    HEAD,
    // after the last entry.
    TAIL,
    // the entry identified by a cursor token, which must still be in the journal.
    CURSOR,
    // the entry identified by a cursor token or, if it has been pruned or is excluded by the
    // reader's filters, the closest entry after it.
    CLOSEST_CURSOR,
    // the first entry at or after a wall clock time.
    REALTIME,
  };

  static Seek head() { return Seek(HEAD); }
  static Seek tail() { return Seek(TAIL); }
  static Seek cursor(std::string token) {
    Seek seek(CURSOR);
    seek.cursor_ = std::move(token);
    return seek;
  }
  static Seek closest_to_cursor(std::string token) {
    Seek seek(CLOSEST_CURSOR);
    seek.cursor_ = std::move(token);
    return seek;
  }
  static Seek realtime(uint64_t usec) {
    Seek seek(REALTIME);
    seek.realtime_usec_ = usec;
    return seek;
  }

  Kind kind() const { return kind_; }
  const std::string &cursor_token() const { return cursor_; }
  uint64_t realtime_usec() const { return realtime_usec_; }

private:
  explicit Seek(Kind kind) : kind_(kind) {}

  Kind kind_;
  std::string cursor_;
  uint64_t realtime_usec_ = 0;
};

/**
 * @brief converts `timeout` to a count of microseconds.
 *
 * @returns OVERFLOW_ERROR if the timeout is negative or does not fit in 64 unsigned bits.
 */
template <class Rep, class Period>
Error duration_to_usec(std::chrono::duration<Rep, Period> timeout, uint64_t *out) {
  using FloatMicros = std::chrono::duration<long double, std::micro>;
  // 2^64, exactly representable whatever the width of long double.
  constexpr long double USEC_LIMIT = 18446744073709551616.0L;
  long double usec = std::chrono::duration_cast<FloatMicros>(timeout).count();
  if (!(usec >= 0.0L) || !(usec < USEC_LIMIT)) {
    return Error::overflow();
  }
  // converting the checked value avoids the integer conversion, which may multiply before it
  // divides and wrap even when the result fits.
  *out = (uint64_t)(usec);
  return Error::success();
}

/**
 * @brief a cursor over the systemd journal.
 *
 * A Reader exclusively owns one sd_journal handle and closes it exactly once, when it is closed
 * or destroyed. A default-constructed or moved-from Reader is closed, and every positional
 * operation on it fails with IO_ERROR{EBADF}.
 *
 * A Reader must not be used from several threads at once. Open one Reader per thread instead.
 */
class Reader {
public:
  Reader() = default;
  ~Reader();

  Reader(Reader &&other) noexcept;
  Reader &operator=(Reader &&other) noexcept;
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;

  /**
   * @brief opens the journal files selected by `config`.
   *
   * If the process may not read the system journal, opening SYSTEM or ALL still succeeds, but
   * system entries will not be visible. That is libsystemd's behaviour.
   */
  static Error open(const ReaderConfig &config, Reader *out);

  /**
   * @brief opens the journal files of the namespace `name_space`.
   *
   * @returns VALIDATION_ERROR{EINVAL} if `name_space` contains a NUL byte.
   */
  static Error open_namespace(const ReaderConfig &config, std::string_view name_space,
                              Reader *out);

  bool is_open() const { return j_ != NULL; }

  /**
   * @brief moves to the next entry and reads it into `out`.
   *
   * `*out` is set to nullopt when there is no next entry; that is not an error. On error `*out`
   * is left untouched.
   */
  Error next_entry(std::optional<Entry> *out);

  /**
   * @brief moves to the previous entry and reads it into `out`. See next_entry.
   */
  Error previous_entry(std::optional<Entry> *out);

  /**
   * @brief seeks to `position`. No entry is read: the next call to next_entry or
   * previous_entry reads relative to the new position.
   *
   * Seek::cursor checks that the cursor's entry is still readable through this reader. If it
   * has been pruned, or the reader's filters exclude it, the seek fails with
   * IO_ERROR{EADDRNOTAVAIL} and the position is unspecified. Seek::closest_to_cursor skips that
   * check and leaves the reader wherever libsystemd places it.
   *
   * @returns VALIDATION_ERROR{EINVAL} if a cursor token contains a NUL byte.
   */
  Error seek(const Seek &position);

  /**
   * @brief restricts the entries this reader returns to those matching `expression`, which
   * has the form `FIELD=value`.
   *
   * Matches accumulate and cannot be removed: matches on the same field are ORed, matches on
   * different fields are ANDed.
   *
   * @returns VALIDATION_ERROR{EINVAL} if the expression has no `=` or the field name is invalid.
   */
  Error add_filter(std::string_view expression);

  /**
   * @brief ORs the matches added so far with the ones added afterwards.
   */
  Error add_disjunction();

  /**
   * @brief blocks until the journal changes.
   */
  Error wait(WakeupType *out);

  /**
   * @brief blocks until the journal changes or `timeout` elapses, in which case `*out` is
   * WAKEUP_NOP.
   *
   * @returns OVERFLOW_ERROR if `timeout` can't be expressed as microseconds.
   */
  template <class Rep, class Period>
  Error wait_timeout(std::chrono::duration<Rep, Period> timeout, WakeupType *out) {
    uint64_t usec = 0;
    Error err = duration_to_usec(timeout, &usec);
    if (!err.ok()) {
      return err;
    }
    return wait_usec(usec, out);
  }

  /**
   * @brief waits for up to `usec` microseconds. UINT64_MAX waits forever.
   */
  Error wait_usec(uint64_t usec, WakeupType *out);

  /**
   * @brief gets the cursor token of the current entry.
   */
  Error get_cursor(std::string *out);

  /**
   * @brief checks whether the current entry is the one identified by `cursor`.
   */
  Error test_cursor(std::string_view cursor, bool *out);

  /**
   * @brief closes the journal. Does nothing if the reader is already closed.
   */
  void close();

private:
  Error check_open() const;
  Error read_whole_fields();
  Error read_current(std::optional<Entry> *out);
  Error seek_exact_cursor(const std::string &token);

  const Api *api_ = NULL;
  sd_journal *j_ = NULL;
};

} // namespace sdjournal

#endif
