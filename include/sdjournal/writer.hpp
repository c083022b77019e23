#ifndef SDJOURNAL_WRITER_HPP
#define SDJOURNAL_WRITER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "sdjournal/entry.hpp"
#include "sdjournal/error.hpp"

namespace sdjournal {

/**
 * @brief submits `entry` to the journal as a single record.
 *
 * Every field is sent as `NAME=value` with the value bytes passed through untouched. The
 * submission is atomic: either the whole entry is recorded or nothing is.
 *
 * @returns VALIDATION_ERROR{EINVAL} if the entry is empty or a field name is invalid. Nothing is
 * sent in that case.
 * @returns IO_ERROR if journald rejected the record.
 */
Error submit(const Entry &entry);

/**
 * @brief sends preformatted `NAME=value` fields as a single record. Field names are validated
 * the same way `submit` validates them.
 */
Error send(const std::vector<std::string> &fields);

/**
 * @brief sends a simple message at the given syslog priority (0-7).
 */
Error print(int priority, std::string_view message);

} // namespace sdjournal

#endif
