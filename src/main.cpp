#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <vector>

#include "sdjournal/cmdline.hpp"
#include "sdjournal/iter.hpp"
#include "sdjournal/reader.hpp"
#include "sdjournal/writer.hpp"

#ifndef SDJOURNAL_VERSION
#define SDJOURNAL_VERSION "unknown"
#endif

using namespace sdjournal;

namespace {

std::atomic_bool signalled = false;

void handle_signal(int) { signalled = true; }

void print_entry(const Entry &entry, OutputFormat output) {
  printf("%s\n", format_entry(entry, output).c_str());
  fflush(stdout);
}

int report(const char *what, const Error &err) {
  fprintf(stderr, "%s failed: %s\n", what, describe(err).c_str());
  return 1;
}

int write_message(const Options &options) {
  Entry entry;
  entry.set_priority(options.priority);
  entry.set_message(options.message);
  entry.set_field("SYSLOG_IDENTIFIER", options.identifier);
  Error err = submit(entry);
  if (!err.ok()) {
    return report("writing to the journal", err);
  }
  return 0;
}

int read_journal(const Options &options) {
  ReaderConfig config;
  config.files = options.files;
  Reader reader;
  Error err = options.name_space.empty()
                  ? Reader::open(config, &reader)
                  : Reader::open_namespace(config, options.name_space, &reader);
  if (!err.ok()) {
    return report("opening the journal", err);
  }
  for (const std::string &match : options.matches) {
    err = reader.add_filter(match);
    if (!err.ok()) {
      return report("adding a match", err);
    }
  }
  std::vector<Entry> backlog;
  err = seek_to_start(reader, options, &backlog);
  if (!err.ok()) {
    return report("positioning the journal", err);
  }
  for (const Entry &entry : backlog) {
    print_entry(entry, options.output);
  }
  if (!options.follow) {
    if (options.lines != 0 && options.cursor.empty()) {
      return 0;
    }
    for (const EntryItem &item : EntryRange(reader)) {
      if (!item.error.ok()) {
        return report("reading the journal", item.error);
      }
      print_entry(*item.entry, options.output);
    }
    return 0;
  }
  BlockingEntryRange range(reader, std::chrono::seconds(1), &signalled);
  while (!signalled) {
    for (const EntryItem &item : range) {
      if (!item.error.ok()) {
        return report("reading the journal", item.error);
      }
      print_entry(*item.entry, options.output);
    }
  }
  return 0;
}

} // namespace

int main(int argc, const char **argv) {
  Options options;
  if (parse_options(argc, argv, &options) != 0) {
    return 1;
  }
  if (options.help) {
    print_usage(stdout);
    return 0;
  }
  if (options.version) {
    printf("sdjournal %s\n", SDJOURNAL_VERSION);
    return 0;
  }
  if (options.write) {
    return write_message(options);
  }
  signal(SIGINT, handle_signal);
  signal(SIGTERM, handle_signal);
  return read_journal(options);
}
