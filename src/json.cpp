#include <cstdint>
#include <vector>

#include "sdjournal/json.hpp"

namespace sdjournal {

bool is_printable_utf8(std::string_view value) {
  size_t i = 0;
  while (i < value.size()) {
    unsigned char c = (unsigned char)(value[i]);
    if (c < 0x80) {
      if ((c < 0x20 && c != '\t' && c != '\n') || c == 0x7f) {
        return false;
      }
      i++;
      continue;
    }
    size_t continuation = 0;
    uint32_t codepoint = 0;
    if ((c & 0xe0) == 0xc0) {
      continuation = 1;
      codepoint = c & 0x1f;
    } else if ((c & 0xf0) == 0xe0) {
      continuation = 2;
      codepoint = c & 0x0f;
    } else if ((c & 0xf8) == 0xf0) {
      continuation = 3;
      codepoint = c & 0x07;
    } else {
      return false;
    }
    if (i + continuation >= value.size()) {
      return false;
    }
    for (size_t k = 1; k <= continuation; ++k) {
      unsigned char next = (unsigned char)(value[i + k]);
      if ((next & 0xc0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (next & 0x3f);
    }
    // reject overlong encodings, surrogates and values past U+10FFFF.
    static const uint32_t min_for_length[] = {0, 0x80, 0x800, 0x10000};
    if (codepoint < min_for_length[continuation] || codepoint > 0x10ffff ||
        (codepoint >= 0xd800 && codepoint <= 0xdfff)) {
      return false;
    }
    i += continuation + 1;
  }
  return true;
}

nlohmann::json to_json(const Entry &entry) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto &[key, val] : entry.fields()) {
    if (is_printable_utf8(val)) {
      out[key] = val;
    } else {
      out[key] = std::vector<uint8_t>(val.begin(), val.end());
    }
  }
  return out;
}

std::string serialize_json(const Entry &entry) { return to_json(entry).dump(); }

} // namespace sdjournal
