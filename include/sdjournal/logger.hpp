#ifndef SDJOURNAL_LOGGER_HPP
#define SDJOURNAL_LOGGER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "sdjournal/entry.hpp"
#include "sdjournal/error.hpp"

namespace sdjournal {

enum class Level {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
};

/**
 * @brief maps a log Level to a syslog priority.
 * https://wiki.archlinux.org/title/Systemd/Journal#Priority_level
 */
int priority_for_level(Level level);

/**
 * @brief where a log call was made from. Unset members are not sent.
 */
struct CodeLocation {
  const char *file = NULL;
  int line = 0;
  const char *function = NULL;
};

/**
 * @brief builds the journal entry for a log call without sending it.
 */
Entry entry_for_record(Level level, std::string_view target, std::string_view message,
                       const CodeLocation &location);

/**
 * @brief sends leveled log calls to the journal.
 *
 * Each call becomes one entry with PRIORITY, MESSAGE and SYSLOG_IDENTIFIER (the target), plus
 * CODE_FILE, CODE_LINE and CODE_FUNC when the location is known.
 */
class Logger {
public:
  explicit Logger(std::string target, Level min_level = Level::TRACE)
      : target_(std::move(target)), min_level_(min_level) {}

  bool enabled(Level level) const { return level >= min_level_; }

  /**
   * @brief logs `message`. Calls below the minimum level return success without sending.
   */
  Error log(Level level, std::string_view message, const CodeLocation &location = {}) const;

  Error trace(std::string_view message) const { return log(Level::TRACE, message); }
  Error debug(std::string_view message) const { return log(Level::DEBUG, message); }
  Error info(std::string_view message) const { return log(Level::INFO, message); }
  Error warn(std::string_view message) const { return log(Level::WARN, message); }
  Error error(std::string_view message) const { return log(Level::ERROR, message); }

  const std::string &target() const { return target_; }

private:
  std::string target_;
  Level min_level_;
};

} // namespace sdjournal

// logs through `logger` recording the calling file, line and function.
#define SDJOURNAL_LOG(logger, level, message)                                                  \
  (logger).log((level), (message), ::sdjournal::CodeLocation{__FILE__, __LINE__, __func__})

#endif
