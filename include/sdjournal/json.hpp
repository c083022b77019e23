#ifndef SDJOURNAL_JSON_HPP
#define SDJOURNAL_JSON_HPP

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "sdjournal/entry.hpp"

namespace sdjournal {

/**
 * @brief returns true if `value` can be exported as a JSON string: valid UTF-8 with no control
 * characters other than tab and newline.
 */
bool is_printable_utf8(std::string_view value);

/**
 * @brief converts an entry to a JSON object with one member per field, in the style of
 * `journalctl -o json`. Printable values become strings, anything else becomes an array of
 * byte values.
 */
nlohmann::json to_json(const Entry &entry);

/**
 * @brief Serializes an entry as a single line of JSON.
 */
std::string serialize_json(const Entry &entry);

} // namespace sdjournal

#endif
