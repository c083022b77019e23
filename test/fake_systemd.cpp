#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <string_view>

#include "fake_systemd.hpp"

namespace fake_systemd {

namespace {

const char CURSOR_PREFIX[] = "s=fake;i=";

int injected(const char *function) {
  auto it = state().failures.find(function);
  if (it == state().failures.end()) {
    return 0;
  }
  return it->second;
}

std::optional<uint64_t> parse_cursor(const char *cursor) {
  std::string_view view(cursor);
  std::string_view prefix(CURSOR_PREFIX);
  if (view.substr(0, prefix.size()) != prefix || view.size() == prefix.size()) {
    return std::nullopt;
  }
  std::string_view hex = view.substr(prefix.size());
  if (hex.find_first_not_of("0123456789abcdef") != hex.npos) {
    return std::nullopt;
  }
  return strtoull(std::string(hex).c_str(), NULL, 16);
}

bool term_matches(const std::map<std::string, std::vector<std::string>> &term,
                  const Record &record) {
  for (const auto &[key, values] : term) {
    auto it = record.fields.find(key);
    if (it == record.fields.end()) {
      return false;
    }
    bool any = false;
    for (const std::string &value : values) {
      if (it->second == value) {
        any = true;
      }
    }
    if (!any) {
      return false;
    }
  }
  return true;
}

bool matches(const sd_journal *j, const Record &record) {
  bool has_terms = false;
  for (const auto &term : j->terms) {
    if (term.empty()) {
      continue;
    }
    has_terms = true;
    if (term_matches(term, record)) {
      return true;
    }
  }
  return !has_terms;
}

bool valid_entry(const sd_journal *j) {
  return j->position == sd_journal::POS_ENTRY && j->index < state().records.size();
}

} // namespace

State &state() {
  static State s;
  return s;
}

void reset() { state() = State{}; }

uint64_t append(std::map<std::string, std::string> fields, std::vector<std::string> raw_fields) {
  State &s = state();
  Record record;
  record.seqnum = s.next_seqnum++;
  s.clock_usec += 1000;
  record.realtime_usec = s.clock_usec;
  record.monotonic_usec = record.seqnum * 1000;
  record.fields = std::move(fields);
  record.raw_fields = std::move(raw_fields);
  s.records.push_back(std::move(record));
  return s.records.back().seqnum;
}

void prune(size_t count) {
  auto &records = state().records;
  count = std::min(count, records.size());
  records.erase(records.begin(), records.begin() + count);
}

std::string cursor_for(uint64_t seqnum) {
  char buf[64] = {0};
  snprintf(buf, sizeof(buf), "%s%" PRIx64, CURSOR_PREFIX, seqnum);
  return std::string(buf);
}

} // namespace fake_systemd

using fake_systemd::state;

int sd_journal_sendv(const struct iovec *iov, int n) {
  state().sendv_count++;
  if (int rval = fake_systemd::injected("sd_journal_sendv"); rval != 0) {
    return rval;
  }
  if (n <= 0) {
    return -EINVAL;
  }
  std::map<std::string, std::string> fields;
  for (int i = 0; i < n; ++i) {
    std::string_view data((const char *)(iov[i].iov_base), iov[i].iov_len);
    size_t eq_pos = data.find('=');
    if (eq_pos == data.npos || eq_pos == 0) {
      return -EINVAL;
    }
    fields[std::string(data.substr(0, eq_pos))] = std::string(data.substr(eq_pos + 1));
  }
  fields["_TRANSPORT"] = "journal";
  fake_systemd::append(std::move(fields));
  return 0;
}

int sd_journal_open(sd_journal **ret, int flags) {
  state().open_count++;
  state().last_open_flags = flags;
  if (int rval = fake_systemd::injected("sd_journal_open"); rval != 0) {
    return rval;
  }
  sd_journal *j = new sd_journal;
  j->flags = flags;
  j->seen_records = state().records.size();
  *ret = j;
  return 0;
}

int sd_journal_open_namespace(sd_journal **ret, const char *name_space, int flags) {
  state().last_namespace = name_space;
  if (int rval = fake_systemd::injected("sd_journal_open_namespace"); rval != 0) {
    state().open_count++;
    state().last_open_flags = flags;
    return rval;
  }
  int rval = sd_journal_open(ret, flags);
  if (rval == 0) {
    (*ret)->name_space = name_space;
  }
  return rval;
}

void sd_journal_close(sd_journal *j) {
  if (j == NULL) {
    return;
  }
  state().close_count++;
  delete j;
}

int sd_journal_set_data_threshold(sd_journal *j, size_t sz) {
  if (int rval = fake_systemd::injected("sd_journal_set_data_threshold"); rval != 0) {
    return rval;
  }
  j->data_threshold = sz;
  return 0;
}

int sd_journal_next(sd_journal *j) {
  if (int rval = fake_systemd::injected("sd_journal_next"); rval != 0) {
    return rval;
  }
  const auto &records = state().records;
  size_t start = 0;
  switch (j->position) {
  case sd_journal::POS_HEAD:
    start = 0;
    break;
  case sd_journal::POS_TAIL:
    start = j->index;
    break;
  case sd_journal::POS_ENTRY:
    start = j->index + 1;
    break;
  case sd_journal::POS_CURSOR:
    start = j->index;
    break;
  }
  for (size_t i = start; i < records.size(); ++i) {
    if (fake_systemd::matches(j, records[i])) {
      j->position = sd_journal::POS_ENTRY;
      j->index = i;
      j->field_index = 0;
      return 1;
    }
  }
  return 0;
}

int sd_journal_previous(sd_journal *j) {
  if (int rval = fake_systemd::injected("sd_journal_previous"); rval != 0) {
    return rval;
  }
  const auto &records = state().records;
  size_t end = 0;
  switch (j->position) {
  case sd_journal::POS_HEAD:
    return 0;
  case sd_journal::POS_TAIL:
    end = std::min(j->index, records.size());
    break;
  case sd_journal::POS_ENTRY:
    end = j->index;
    break;
  case sd_journal::POS_CURSOR:
    end = j->index + 1;
    break;
  }
  for (size_t i = end; i > 0; --i) {
    if (fake_systemd::matches(j, records[i - 1])) {
      j->position = sd_journal::POS_ENTRY;
      j->index = i - 1;
      j->field_index = 0;
      return 1;
    }
  }
  return 0;
}

int sd_journal_seek_head(sd_journal *j) {
  if (int rval = fake_systemd::injected("sd_journal_seek_head"); rval != 0) {
    return rval;
  }
  j->position = sd_journal::POS_HEAD;
  j->index = 0;
  return 0;
}

int sd_journal_seek_tail(sd_journal *j) {
  if (int rval = fake_systemd::injected("sd_journal_seek_tail"); rval != 0) {
    return rval;
  }
  j->position = sd_journal::POS_TAIL;
  j->index = state().records.size();
  return 0;
}

int sd_journal_seek_cursor(sd_journal *j, const char *cursor) {
  if (int rval = fake_systemd::injected("sd_journal_seek_cursor"); rval != 0) {
    return rval;
  }
  auto seqnum = fake_systemd::parse_cursor(cursor);
  if (!seqnum) {
    return -EINVAL;
  }
  // like libsystemd, a cursor whose entry is gone lands on the closest entry after it.
  const auto &records = state().records;
  size_t i = 0;
  while (i < records.size() && records[i].seqnum < *seqnum) {
    i++;
  }
  j->position = i == records.size() ? sd_journal::POS_TAIL : sd_journal::POS_CURSOR;
  j->index = i;
  return 0;
}

int sd_journal_seek_realtime_usec(sd_journal *j, uint64_t usec) {
  if (int rval = fake_systemd::injected("sd_journal_seek_realtime_usec"); rval != 0) {
    return rval;
  }
  const auto &records = state().records;
  size_t i = 0;
  while (i < records.size() && records[i].realtime_usec < usec) {
    i++;
  }
  // behaves like a cursor seek to the first entry at or after `usec`.
  if (i == records.size()) {
    j->position = sd_journal::POS_TAIL;
  } else {
    j->position = sd_journal::POS_CURSOR;
  }
  j->index = i;
  return 0;
}

int sd_journal_get_cursor(sd_journal *j, char **cursor) {
  if (int rval = fake_systemd::injected("sd_journal_get_cursor"); rval != 0) {
    return rval;
  }
  if (!fake_systemd::valid_entry(j)) {
    return -EADDRNOTAVAIL;
  }
  std::string token = fake_systemd::cursor_for(state().records[j->index].seqnum);
  *cursor = strdup(token.c_str());
  return *cursor == NULL ? -ENOMEM : 0;
}

int sd_journal_test_cursor(sd_journal *j, const char *cursor) {
  if (int rval = fake_systemd::injected("sd_journal_test_cursor"); rval != 0) {
    return rval;
  }
  if (!fake_systemd::valid_entry(j)) {
    return -EADDRNOTAVAIL;
  }
  auto seqnum = fake_systemd::parse_cursor(cursor);
  if (!seqnum) {
    return -EINVAL;
  }
  return state().records[j->index].seqnum == *seqnum ? 1 : 0;
}

int sd_journal_get_realtime_usec(sd_journal *j, uint64_t *ret) {
  if (int rval = fake_systemd::injected("sd_journal_get_realtime_usec"); rval != 0) {
    return rval;
  }
  if (!fake_systemd::valid_entry(j)) {
    return -EADDRNOTAVAIL;
  }
  *ret = state().records[j->index].realtime_usec;
  return 0;
}

int sd_journal_get_monotonic_usec(sd_journal *j, uint64_t *ret, sd_id128_t *ret_boot_id) {
  if (int rval = fake_systemd::injected("sd_journal_get_monotonic_usec"); rval != 0) {
    return rval;
  }
  if (!fake_systemd::valid_entry(j)) {
    return -EADDRNOTAVAIL;
  }
  *ret = state().records[j->index].monotonic_usec;
  if (ret_boot_id != NULL) {
    *ret_boot_id = SD_ID128_MAKE(00, 01, 02, 03, 04, 05, 06, 07, 08, 09, 0a, 0b, 0c, 0d, 0e, 0f);
  }
  return 0;
}

void sd_journal_restart_data(sd_journal *j) { j->field_index = 0; }

int sd_journal_enumerate_data(sd_journal *j, const void **data, size_t *length) {
  if (!fake_systemd::valid_entry(j)) {
    fprintf(stderr, "attempted to access entry with invalid cursor\n");
    return -EADDRNOTAVAIL;
  }
  if (state().enumerate_fail_after >= 0 &&
      j->field_index >= (size_t)(state().enumerate_fail_after)) {
    return state().enumerate_rval;
  }
  const fake_systemd::Record &record = state().records[j->index];
  size_t total = record.fields.size() + record.raw_fields.size();
  if (j->field_index >= total) {
    return 0;
  }
  if (j->field_index < record.fields.size()) {
    auto it = record.fields.begin();
    std::advance(it, j->field_index);
    j->field_buffer = it->first + "=" + it->second;
  } else {
    j->field_buffer = record.raw_fields[j->field_index - record.fields.size()];
  }
  if (j->data_threshold != 0 && j->field_buffer.size() > j->data_threshold) {
    j->field_buffer.resize(j->data_threshold);
  }
  j->field_index++;
  *data = (const void *)(j->field_buffer.data());
  *length = j->field_buffer.size();
  return 1;
}

int sd_journal_add_match(sd_journal *j, const void *data, size_t size) {
  state().add_match_count++;
  if (int rval = fake_systemd::injected("sd_journal_add_match"); rval != 0) {
    return rval;
  }
  std::string_view match((const char *)(data), size == 0 ? strlen((const char *)(data)) : size);
  size_t eq_pos = match.find('=');
  if (eq_pos == match.npos) {
    return -EINVAL;
  }
  if (j->terms.empty()) {
    j->terms.emplace_back();
  }
  j->terms.back()[std::string(match.substr(0, eq_pos))].emplace_back(match.substr(eq_pos + 1));
  return 0;
}

int sd_journal_add_disjunction(sd_journal *j) {
  if (int rval = fake_systemd::injected("sd_journal_add_disjunction"); rval != 0) {
    return rval;
  }
  if (!j->terms.empty() && !j->terms.back().empty()) {
    j->terms.emplace_back();
  }
  return 0;
}

int sd_journal_wait(sd_journal *j, uint64_t timeout_usec) {
  state().wait_count++;
  state().last_wait_usec = timeout_usec;
  if (int rval = fake_systemd::injected("sd_journal_wait"); rval != 0) {
    return rval;
  }
  if (state().on_wait) {
    state().on_wait(timeout_usec);
  }
  if (state().pending_invalidate) {
    state().pending_invalidate = false;
    j->seen_records = state().records.size();
    return SD_JOURNAL_INVALIDATE;
  }
  if (state().records.size() > j->seen_records) {
    j->seen_records = state().records.size();
    return SD_JOURNAL_APPEND;
  }
  return SD_JOURNAL_NOP;
}
