#ifndef SDJOURNAL_ENTRY_HPP
#define SDJOURNAL_ENTRY_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sdjournal {

// well-known field names.
inline constexpr std::string_view FIELD_MESSAGE = "MESSAGE";
inline constexpr std::string_view FIELD_PRIORITY = "PRIORITY";
inline constexpr std::string_view FIELD_TRANSPORT = "_TRANSPORT";
inline constexpr std::string_view FIELD_SOURCE_REALTIME_TIMESTAMP = "_SOURCE_REALTIME_TIMESTAMP";
inline constexpr std::string_view FIELD_REALTIME_TIMESTAMP = "__REALTIME_TIMESTAMP";
inline constexpr std::string_view FIELD_MONOTONIC_TIMESTAMP = "__MONOTONIC_TIMESTAMP";
inline constexpr std::string_view FIELD_CURSOR = "__CURSOR";

/**
 * @brief how journald received an entry, from its _TRANSPORT field.
 */
enum class Transport {
  // no _TRANSPORT field, or a value journald does not document.
  UNKNOWN,
  AUDIT,
  DRIVER,
  SYSLOG,
  JOURNAL,
  STDOUT,
  KERNEL,
};

// the _TRANSPORT value journald writes for `transport`, or "unknown".
std::string_view name_for_transport(Transport transport);

/**
 * @brief returns true if `name` may be used as a journal field name: non-empty, made of
 * uppercase ASCII letters, digits and underscores, and not starting with a digit.
 */
bool is_valid_field_name(std::string_view name);

/**
 * @brief one journal record: a set of named fields whose values are raw bytes.
 *
 * Values are stored as-is and may contain NUL bytes or invalid UTF-8. Fields iterate in
 * lexicographic order of their names.
 */
class Entry {
public:
  using Fields = std::map<std::string, std::string, std::less<>>;

  Entry() = default;
  explicit Entry(Fields fields) : fields_(std::move(fields)) {}

  const Fields &fields() const { return fields_; }
  bool empty() const { return fields_.empty(); }

  /**
   * @brief the raw bytes of field `name`, if present. The view is valid as long as this Entry
   * is alive and unmodified.
   */
  std::optional<std::string_view> get_field(std::string_view name) const;

  /**
   * @brief sets field `name` to `value`, replacing any previous value. Field names are
   * validated when the entry is submitted, not here.
   */
  void set_field(std::string name, std::string value);

  std::optional<std::string> get_message() const;
  void set_message(std::string message);

  /**
   * @brief the syslog priority (0-7) of this entry, if it has a valid PRIORITY field.
   */
  std::optional<int> get_priority() const;
  void set_priority(int priority);

  /**
   * @brief parses the _TRANSPORT field of this entry.
   */
  Transport get_transport() const;

  /**
   * @brief wall clock time of the entry in microseconds since the epoch. Prefers the time
   * supplied by the logging process and falls back to the time journald received the entry.
   */
  std::optional<uint64_t> get_wallclock_usec() const;
  std::optional<uint64_t> get_source_wallclock_usec() const;
  std::optional<uint64_t> get_reception_wallclock_usec() const;

  /**
   * @brief monotonic time of the entry in microseconds. Only comparable between entries of the
   * same boot.
   */
  std::optional<uint64_t> get_monotonic_usec() const;

  /**
   * @brief the cursor token identifying this entry, if it was read from the journal.
   */
  std::optional<std::string> get_cursor() const;

private:
  std::optional<uint64_t> get_usec_field(std::string_view name) const;

  Fields fields_;
};

inline bool operator==(const Entry &a, const Entry &b) { return a.fields() == b.fields(); }

} // namespace sdjournal

#endif
