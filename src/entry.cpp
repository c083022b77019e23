#include <charconv>

#include "sdjournal/entry.hpp"

namespace sdjournal {

namespace {

constexpr std::pair<Transport, std::string_view> TRANSPORT_NAMES[] = {
    {Transport::AUDIT, "audit"},   {Transport::DRIVER, "driver"},
    {Transport::SYSLOG, "syslog"}, {Transport::JOURNAL, "journal"},
    {Transport::STDOUT, "stdout"}, {Transport::KERNEL, "kernel"},
};

} // namespace

std::string_view name_for_transport(Transport transport) {
  for (const auto &[value, name] : TRANSPORT_NAMES) {
    if (value == transport) {
      return name;
    }
  }
  return "unknown";
}

bool is_valid_field_name(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  if (name[0] >= '0' && name[0] <= '9') {
    return false;
  }
  for (char c : name) {
    bool upper = c >= 'A' && c <= 'Z';
    bool digit = c >= '0' && c <= '9';
    if (!upper && !digit && c != '_') {
      return false;
    }
  }
  return true;
}

std::optional<std::string_view> Entry::get_field(std::string_view name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void Entry::set_field(std::string name, std::string value) {
  fields_.insert_or_assign(std::move(name), std::move(value));
}

std::optional<std::string> Entry::get_message() const {
  auto message = get_field(FIELD_MESSAGE);
  if (!message) {
    return std::nullopt;
  }
  return std::string(*message);
}

void Entry::set_message(std::string message) {
  set_field(std::string(FIELD_MESSAGE), std::move(message));
}

std::optional<int> Entry::get_priority() const {
  auto priority = get_field(FIELD_PRIORITY);
  if (!priority || priority->size() != 1) {
    return std::nullopt;
  }
  char c = (*priority)[0];
  if (c < '0' || c > '7') {
    return std::nullopt;
  }
  return c - '0';
}

void Entry::set_priority(int priority) {
  set_field(std::string(FIELD_PRIORITY), std::to_string(priority));
}

Transport Entry::get_transport() const {
  auto field = get_field(FIELD_TRANSPORT);
  if (field) {
    for (const auto &[value, name] : TRANSPORT_NAMES) {
      if (*field == name) {
        return value;
      }
    }
  }
  return Transport::UNKNOWN;
}

std::optional<uint64_t> Entry::get_wallclock_usec() const {
  auto source_time = get_source_wallclock_usec();
  if (source_time) {
    return source_time;
  }
  return get_reception_wallclock_usec();
}

std::optional<uint64_t> Entry::get_source_wallclock_usec() const {
  return get_usec_field(FIELD_SOURCE_REALTIME_TIMESTAMP);
}

std::optional<uint64_t> Entry::get_reception_wallclock_usec() const {
  return get_usec_field(FIELD_REALTIME_TIMESTAMP);
}

std::optional<uint64_t> Entry::get_monotonic_usec() const {
  return get_usec_field(FIELD_MONOTONIC_TIMESTAMP);
}

std::optional<std::string> Entry::get_cursor() const {
  auto cursor = get_field(FIELD_CURSOR);
  if (!cursor) {
    return std::nullopt;
  }
  return std::string(*cursor);
}

std::optional<uint64_t> Entry::get_usec_field(std::string_view name) const {
  auto value = get_field(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  uint64_t out = 0;
  const char *end = value->data() + value->size();
  auto [ptr, ec] = std::from_chars(value->data(), end, out);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return out;
}

} // namespace sdjournal
