#include "sdjournal/logger.hpp"
#include "sdjournal/writer.hpp"

namespace sdjournal {

int priority_for_level(Level level) {
  switch (level) {
  case Level::ERROR:
    // LOG_ERR
    return 3;
  case Level::WARN:
    // LOG_WARNING
    return 4;
  case Level::INFO:
    // LOG_INFO
    return 6;
  case Level::DEBUG:
  case Level::TRACE:
  default:
    // LOG_DEBUG
    return 7;
  }
}

Entry entry_for_record(Level level, std::string_view target, std::string_view message,
                       const CodeLocation &location) {
  Entry entry;
  entry.set_priority(priority_for_level(level));
  entry.set_message(std::string(message));
  if (!target.empty()) {
    entry.set_field("SYSLOG_IDENTIFIER", std::string(target));
  }
  if (location.file != NULL) {
    entry.set_field("CODE_FILE", location.file);
  }
  if (location.line > 0) {
    entry.set_field("CODE_LINE", std::to_string(location.line));
  }
  if (location.function != NULL) {
    entry.set_field("CODE_FUNC", location.function);
  }
  return entry;
}

Error Logger::log(Level level, std::string_view message, const CodeLocation &location) const {
  if (!enabled(level)) {
    return Error::success();
  }
  return submit(entry_for_record(level, target_, message, location));
}

} // namespace sdjournal
