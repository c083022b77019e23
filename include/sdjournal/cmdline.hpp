#ifndef SDJOURNAL_CMDLINE_HPP
#define SDJOURNAL_CMDLINE_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "sdjournal/entry.hpp"
#include "sdjournal/error.hpp"
#include "sdjournal/reader.hpp"

namespace sdjournal {

enum OutputFormat {
  OUTPUT_SHORT,
  OUTPUT_JSON,
};

struct Options {
  Files files = Files::ALL;
  std::string name_space;
  std::vector<std::string> matches;
  // show only the last `lines` entries. Zero shows everything.
  uint64_t lines = 0;
  std::string cursor;
  bool follow = false;
  OutputFormat output = OUTPUT_SHORT;
  // write `message` instead of reading.
  bool write = false;
  std::string message;
  int priority = 6;
  std::string identifier = "sdjournal";
  bool help = false;
  bool version = false;
};

/**
 * @brief parses the sdjournal command line into `options`.
 *
 * @returns 0 on success, 1 if the arguments are invalid. The reason is printed to stderr.
 */
int parse_options(int argc, const char **argv, Options *options);

/**
 * @brief prints the usage text to `out`.
 */
void print_usage(FILE *out);

/**
 * @brief formats `entry` as one line of output, without the trailing newline.
 *
 * The short format is `TIME IDENTIFIER[PID]: MESSAGE`. The identifier is SYSLOG_IDENTIFIER,
 * then _COMM, then the name of the entry's transport.
 */
std::string format_entry(const Entry &entry, OutputFormat output);

/**
 * @brief positions a reader that already has its matches for the read `options` describe.
 *
 * Afterwards, `*backlog` holds the entries to print before continuing with next_entry: the last
 * `options.lines` entries, or with a cursor, the first entry after it when libsystemd lands
 * there directly. The cursor's own entry is never printed.
 */
Error seek_to_start(Reader &reader, const Options &options, std::vector<Entry> *backlog);

} // namespace sdjournal

#endif
