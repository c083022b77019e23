#include <cstdlib>
#include <memory>

#include "sdjournal/reader.hpp"

namespace sdjournal {

namespace {

int flags_for_config(const ReaderConfig &config) {
  int flags = 0;
  if (config.only_volatile) {
    flags |= SD_JOURNAL_RUNTIME_ONLY;
  }
  if (config.only_local) {
    flags |= SD_JOURNAL_LOCAL_ONLY;
  }
  switch (config.files) {
  case Files::SYSTEM:
    flags |= SD_JOURNAL_SYSTEM;
    break;
  case Files::CURRENT_USER:
    flags |= SD_JOURNAL_CURRENT_USER;
    break;
  case Files::ALL:
    break;
  }
  return flags;
}

bool has_nul(std::string_view s) { return s.find('\0') != s.npos; }

} // namespace

Reader::~Reader() { close(); }

Reader::Reader(Reader &&other) noexcept : api_(other.api_), j_(other.j_) {
  other.j_ = NULL;
}

Reader &Reader::operator=(Reader &&other) noexcept {
  if (this != &other) {
    close();
    api_ = other.api_;
    j_ = other.j_;
    other.j_ = NULL;
  }
  return *this;
}

Error Reader::open(const ReaderConfig &config, Reader *out) {
  Reader reader;
  Error err = load_api(&reader.api_);
  if (!err.ok()) {
    return err;
  }
  err = Error::from_return(reader.api_->open(&reader.j_, flags_for_config(config)));
  if (!err.ok()) {
    // `reader` closes anything libsystemd may have left behind.
    return err;
  }
  err = reader.read_whole_fields();
  if (!err.ok()) {
    return err;
  }
  *out = std::move(reader);
  return Error::success();
}

Error Reader::open_namespace(const ReaderConfig &config, std::string_view name_space,
                             Reader *out) {
  if (has_nul(name_space)) {
    return Error::validation(EINVAL);
  }
  Reader reader;
  Error err = load_api(&reader.api_);
  if (!err.ok()) {
    return err;
  }
  int flags = flags_for_config(config);
  if (config.all_namespaces) {
    flags |= SD_JOURNAL_ALL_NAMESPACES;
  }
  if (config.include_default_namespace) {
    flags |= SD_JOURNAL_INCLUDE_DEFAULT_NAMESPACE;
  }
  std::string name(name_space);
  err = Error::from_return(reader.api_->open_namespace(&reader.j_, name.c_str(), flags));
  if (!err.ok()) {
    return err;
  }
  err = reader.read_whole_fields();
  if (!err.ok()) {
    return err;
  }
  *out = std::move(reader);
  return Error::success();
}

// by default libsystemd truncates field data longer than 64 KiB when enumerating.
Error Reader::read_whole_fields() {
  return Error::from_return(api_->set_data_threshold(j_, 0));
}

void Reader::close() {
  if (j_ != NULL) {
    api_->close(j_);
    j_ = NULL;
  }
}

Error Reader::check_open() const {
  if (j_ == NULL) {
    return Error::io(EBADF);
  }
  return Error::success();
}

Error Reader::read_current(std::optional<Entry> *out) {
  Entry::Fields fields;
  api_->restart_data(j_);
  const void *data = NULL;
  size_t length = 0;
  for (;;) {
    int ret = api_->enumerate_data(j_, &data, &length);
    if (ret < 0) {
      return Error::from_return(ret);
    }
    if (ret == 0) {
      break;
    }
    std::string_view data_view((const char *)data, length);
    size_t eq_pos = data_view.find('=');
    if (eq_pos == data_view.npos) {
      return Error::io(EBADMSG);
    }
    fields.insert_or_assign(std::string(data_view.substr(0, eq_pos)),
                            std::string(data_view.substr(eq_pos + 1)));
  }

  // these come from dedicated calls and replace anything enumerated under the same name.
  uint64_t realtime_usec = 0;
  Error err = Error::from_return(api_->get_realtime_usec(j_, &realtime_usec));
  if (!err.ok()) {
    return err;
  }
  uint64_t monotonic_usec = 0;
  err = Error::from_return(api_->get_monotonic_usec(j_, &monotonic_usec, NULL));
  if (!err.ok()) {
    return err;
  }
  char *raw_cursor = NULL;
  err = Error::from_return(api_->get_cursor(j_, &raw_cursor));
  if (!err.ok()) {
    return err;
  }
  std::unique_ptr<char, decltype(&free)> cursor(raw_cursor, &free);

  fields.insert_or_assign(std::string(FIELD_REALTIME_TIMESTAMP), std::to_string(realtime_usec));
  fields.insert_or_assign(std::string(FIELD_MONOTONIC_TIMESTAMP),
                          std::to_string(monotonic_usec));
  fields.insert_or_assign(std::string(FIELD_CURSOR), std::string(cursor.get()));
  *out = Entry(std::move(fields));
  return Error::success();
}

Error Reader::next_entry(std::optional<Entry> *out) {
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  int ret = api_->next(j_);
  if (ret < 0) {
    return Error::from_return(ret);
  }
  if (ret == 0) {
    *out = std::nullopt;
    return Error::success();
  }
  return read_current(out);
}

Error Reader::previous_entry(std::optional<Entry> *out) {
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  int ret = api_->previous(j_);
  if (ret < 0) {
    return Error::from_return(ret);
  }
  if (ret == 0) {
    *out = std::nullopt;
    return Error::success();
  }
  return read_current(out);
}

Error Reader::seek(const Seek &position) {
  if ((position.kind() == Seek::CURSOR || position.kind() == Seek::CLOSEST_CURSOR) &&
      has_nul(position.cursor_token())) {
    return Error::validation(EINVAL);
  }
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  switch (position.kind()) {
  case Seek::HEAD:
    return Error::from_return(api_->seek_head(j_));
  case Seek::TAIL:
    return Error::from_return(api_->seek_tail(j_));
  case Seek::CURSOR:
    return seek_exact_cursor(position.cursor_token());
  case Seek::CLOSEST_CURSOR:
    return Error::from_return(api_->seek_cursor(j_, position.cursor_token().c_str()));
  case Seek::REALTIME:
    return Error::from_return(api_->seek_realtime_usec(j_, position.realtime_usec()));
  }
  return Error::validation(EINVAL);
}

// libsystemd accepts any well-formed cursor and lands on the closest entry if the cursor's own
// entry is gone, so the landed entry is compared against the cursor before seeking back to it.
Error Reader::seek_exact_cursor(const std::string &token) {
  Error err = Error::from_return(api_->seek_cursor(j_, token.c_str()));
  if (!err.ok()) {
    return err;
  }
  int ret = api_->next(j_);
  if (ret < 0) {
    return Error::from_return(ret);
  }
  if (ret == 0) {
    return Error::io(EADDRNOTAVAIL);
  }
  ret = api_->test_cursor(j_, token.c_str());
  if (ret < 0) {
    return Error::from_return(ret);
  }
  if (ret == 0) {
    return Error::io(EADDRNOTAVAIL);
  }
  return Error::from_return(api_->seek_cursor(j_, token.c_str()));
}

Error Reader::add_filter(std::string_view expression) {
  size_t eq_pos = expression.find('=');
  if (eq_pos == expression.npos || !is_valid_field_name(expression.substr(0, eq_pos))) {
    return Error::validation(EINVAL);
  }
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  return Error::from_return(api_->add_match(j_, expression.data(), expression.size()));
}

Error Reader::add_disjunction() {
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  return Error::from_return(api_->add_disjunction(j_));
}

Error Reader::wait(WakeupType *out) { return wait_usec(UINT64_MAX, out); }

Error Reader::wait_usec(uint64_t usec, WakeupType *out) {
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  int ret = api_->wait(j_, usec);
  if (ret < 0) {
    return Error::from_return(ret);
  }
  switch (ret) {
  case SD_JOURNAL_NOP:
  case SD_JOURNAL_APPEND:
  case SD_JOURNAL_INVALIDATE:
    *out = (WakeupType)(ret);
    return Error::success();
  default:
    return Error::io(EINVAL);
  }
}

Error Reader::get_cursor(std::string *out) {
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  char *raw_cursor = NULL;
  err = Error::from_return(api_->get_cursor(j_, &raw_cursor));
  if (!err.ok()) {
    return err;
  }
  std::unique_ptr<char, decltype(&free)> cursor(raw_cursor, &free);
  *out = cursor.get();
  return Error::success();
}

Error Reader::test_cursor(std::string_view cursor, bool *out) {
  if (has_nul(cursor)) {
    return Error::validation(EINVAL);
  }
  Error err = check_open();
  if (!err.ok()) {
    return err;
  }
  std::string token(cursor);
  int ret = api_->test_cursor(j_, token.c_str());
  if (ret < 0) {
    return Error::from_return(ret);
  }
  *out = ret > 0;
  return Error::success();
}

} // namespace sdjournal
