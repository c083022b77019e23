#ifndef SDJOURNAL_ITER_HPP
#define SDJOURNAL_ITER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

#include "sdjournal/entry.hpp"
#include "sdjournal/error.hpp"
#include "sdjournal/reader.hpp"

namespace sdjournal {

/**
 * @brief one element of an entry range: either an entry or the error that ended the range.
 */
struct EntryItem {
  Error error;
  std::optional<Entry> entry;
};

/**
 * @brief single-pass input iterator shared by the entry ranges. `Range` provides
 * `bool advance()` and `const EntryItem &current() const`.
 */
template <typename Range> class EntryIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = EntryItem;
  using difference_type = std::ptrdiff_t;
  using pointer = const EntryItem *;
  using reference = const EntryItem &;

  EntryIterator() = default;
  explicit EntryIterator(Range *range) : range_(range) { step(); }

  reference operator*() const { return range_->current(); }
  pointer operator->() const { return &range_->current(); }

  EntryIterator &operator++() {
    step();
    return *this;
  }
  void operator++(int) { step(); }

  bool operator==(const EntryIterator &other) const { return range_ == other.range_; }
  bool operator!=(const EntryIterator &other) const { return range_ != other.range_; }

private:
  void step() {
    if (range_ != NULL && !range_->advance()) {
      range_ = NULL;
    }
  }

  Range *range_ = NULL;
};

/**
 * @brief reads entries forward from the reader's current position until there are none left
 * right now.
 *
 * The range reflects the reader's live cursor: it is single-pass, and two ranges over one
 * reader steal entries from each other. An error is yielded as the last item of a pass. Each
 * call to begin() starts a new pass from wherever the reader is.
 */
class EntryRange {
public:
  using iterator = EntryIterator<EntryRange>;

  explicit EntryRange(Reader &reader) : reader_(&reader) {}

  iterator begin() {
    failed_ = false;
    return iterator(this);
  }
  iterator end() { return iterator(); }

  bool advance();
  const EntryItem &current() const { return item_; }

private:
  Reader *reader_;
  EntryItem item_;
  bool failed_ = false;
};

/**
 * @brief reads entries forward, waiting for new ones when the journal is exhausted.
 *
 * Without a timeout the range only ends on error. With a timeout, a wait that elapses without
 * the journal changing ends the current pass; begin() polls again. APPEND and INVALIDATE
 * wakeups are never yielded, they only cause the read to be retried.
 *
 * If `cancelled` is given it is checked before every wait and ends the pass once set. Combine
 * it with a timeout, since an unbounded wait can't observe the flag.
 */
class BlockingEntryRange {
public:
  using iterator = EntryIterator<BlockingEntryRange>;

  explicit BlockingEntryRange(Reader &reader, const std::atomic_bool *cancelled = NULL)
      : reader_(&reader), cancelled_(cancelled) {}

  template <class Rep, class Period>
  BlockingEntryRange(Reader &reader, std::chrono::duration<Rep, Period> timeout,
                     const std::atomic_bool *cancelled = NULL)
      : reader_(&reader), bounded_(true), cancelled_(cancelled) {
    timeout_err_ = duration_to_usec(timeout, &timeout_usec_);
  }

  iterator begin() {
    failed_ = false;
    return iterator(this);
  }
  iterator end() { return iterator(); }

  bool advance();
  const EntryItem &current() const { return item_; }

private:
  bool fail(const Error &err);

  Reader *reader_;
  uint64_t timeout_usec_ = UINT64_MAX;
  bool bounded_ = false;
  Error timeout_err_;
  const std::atomic_bool *cancelled_;
  EntryItem item_;
  bool failed_ = false;
};

} // namespace sdjournal

#endif
