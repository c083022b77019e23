#include <utility>

#include "sdjournal/iter.hpp"

namespace sdjournal {

bool EntryRange::advance() {
  if (failed_) {
    return false;
  }
  std::optional<Entry> entry;
  Error err = reader_->next_entry(&entry);
  if (!err.ok()) {
    item_ = EntryItem{err, std::nullopt};
    failed_ = true;
    return true;
  }
  if (!entry) {
    return false;
  }
  item_ = EntryItem{Error::success(), std::move(entry)};
  return true;
}

bool BlockingEntryRange::fail(const Error &err) {
  item_ = EntryItem{err, std::nullopt};
  failed_ = true;
  return true;
}

bool BlockingEntryRange::advance() {
  if (failed_) {
    return false;
  }
  if (!timeout_err_.ok()) {
    return fail(timeout_err_);
  }
  for (;;) {
    std::optional<Entry> entry;
    Error err = reader_->next_entry(&entry);
    if (!err.ok()) {
      return fail(err);
    }
    if (entry) {
      item_ = EntryItem{Error::success(), std::move(entry)};
      return true;
    }
    // there are no more entries in the journal right now, wait for more.
    if (cancelled_ != NULL && cancelled_->load()) {
      return false;
    }
    WakeupType wakeup = WAKEUP_NOP;
    err = reader_->wait_usec(timeout_usec_, &wakeup);
    if (!err.ok()) {
      return fail(err);
    }
    if (wakeup == WAKEUP_NOP && bounded_) {
      return false;
    }
    // APPEND and INVALIDATE both mean new entries may be available, try reading again.
  }
}

} // namespace sdjournal
