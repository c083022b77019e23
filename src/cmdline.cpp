#include <algorithm>
#include <cassert>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string_view>

#include "sdjournal/cmdline.hpp"
#include "sdjournal/json.hpp"

namespace sdjournal {

namespace {

enum CmdlineToken {
  TOKEN_EMPTY,
  TOKEN_HELP,
  TOKEN_VERSION,
  TOKEN_SYSTEM,
  TOKEN_USER,
  TOKEN_NAMESPACE,
  TOKEN_MATCH,
  TOKEN_LINES,
  TOKEN_CURSOR,
  TOKEN_FOLLOW,
  TOKEN_OUTPUT,
  TOKEN_WRITE,
  TOKEN_PRIORITY,
  TOKEN_IDENTIFIER,
  TOKEN_INT,
  TOKEN_STRING,
};

CmdlineToken token_of(const char *arg) {
  std::string_view this_arg(arg);
  if (this_arg == "-h" || this_arg == "--help") {
    return TOKEN_HELP;
  } else if (this_arg == "--version") {
    return TOKEN_VERSION;
  } else if (this_arg == "--system") {
    return TOKEN_SYSTEM;
  } else if (this_arg == "--user") {
    return TOKEN_USER;
  } else if (this_arg == "--namespace") {
    return TOKEN_NAMESPACE;
  } else if (this_arg == "-m" || this_arg == "--match") {
    return TOKEN_MATCH;
  } else if (this_arg == "-n" || this_arg == "--lines") {
    return TOKEN_LINES;
  } else if (this_arg == "-c" || this_arg == "--cursor") {
    return TOKEN_CURSOR;
  } else if (this_arg == "-f" || this_arg == "--follow") {
    return TOKEN_FOLLOW;
  } else if (this_arg == "-o" || this_arg == "--output") {
    return TOKEN_OUTPUT;
  } else if (this_arg == "-w" || this_arg == "--write") {
    return TOKEN_WRITE;
  } else if (this_arg == "-p" || this_arg == "--priority") {
    return TOKEN_PRIORITY;
  } else if (this_arg == "-t" || this_arg == "--identifier") {
    return TOKEN_IDENTIFIER;
  } else if (this_arg == "") {
    return TOKEN_EMPTY;
  } else if (this_arg.find_first_not_of("0123456789") == this_arg.npos) {
    return TOKEN_INT;
  }
  return TOKEN_STRING;
}

std::string format_short(const Entry &entry) {
  char time_buf[64] = {0};
  uint64_t usec = entry.get_wallclock_usec().value_or(0);
  time_t secs = (time_t)(usec / 1'000'000ull);
  struct tm tm_buf;
  if (localtime_r(&secs, &tm_buf) != NULL) {
    strftime(time_buf, sizeof(time_buf), "%b %d %H:%M:%S", &tm_buf);
  }
  std::string line(time_buf);
  line += ' ';
  auto identifier = entry.get_field("SYSLOG_IDENTIFIER");
  if (!identifier) {
    identifier = entry.get_field("_COMM");
  }
  line += identifier.value_or(name_for_transport(entry.get_transport()));
  auto pid = entry.get_field("_PID");
  if (pid) {
    line += '[';
    line += *pid;
    line += ']';
  }
  line += ": ";
  line += entry.get_message().value_or("");
  return line;
}

// true if argv[i + 1] exists and can be used as the value of argv[i].
bool has_value(int argc, const char **argv, int i) {
  if (i == argc - 1) {
    fprintf(stderr, "expected an argument after %s\n", argv[i]);
    return false;
  }
  return true;
}

} // namespace

int parse_options(int argc, const char **argv, Options *options) {
  assert(options != NULL);
  for (int i = 1; i < argc; ++i) {
    switch (token_of(argv[i])) {
    case TOKEN_HELP:
      options->help = true;
      break;
    case TOKEN_VERSION:
      options->version = true;
      break;
    case TOKEN_SYSTEM:
      options->files = Files::SYSTEM;
      break;
    case TOKEN_USER:
      options->files = Files::CURRENT_USER;
      break;
    case TOKEN_FOLLOW:
      options->follow = true;
      break;
    case TOKEN_NAMESPACE:
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      if (token_of(argv[i + 1]) != TOKEN_STRING) {
        fprintf(stderr, "expected a namespace name, got '%s'\n", argv[i + 1]);
        return 1;
      }
      options->name_space = std::string(argv[i + 1]);
      i++;
      break;
    case TOKEN_MATCH: {
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      std::string_view match(argv[i + 1]);
      size_t eq_pos = match.find('=');
      if (eq_pos == match.npos || !is_valid_field_name(match.substr(0, eq_pos))) {
        fprintf(stderr, "expected a match of the form FIELD=VALUE, got '%s'\n", argv[i + 1]);
        return 1;
      }
      options->matches.emplace_back(match);
      i++;
      break;
    }
    case TOKEN_LINES:
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      if (token_of(argv[i + 1]) != TOKEN_INT) {
        fprintf(stderr, "expected a number of entries, got '%s'\n", argv[i + 1]);
        return 1;
      }
      options->lines = std::stoull(std::string(argv[i + 1]));
      i++;
      break;
    case TOKEN_CURSOR:
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      if (token_of(argv[i + 1]) == TOKEN_EMPTY) {
        fprintf(stderr, "expected a cursor after %s\n", argv[i]);
        return 1;
      }
      options->cursor = std::string(argv[i + 1]);
      i++;
      break;
    case TOKEN_OUTPUT: {
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      std::string_view format(argv[i + 1]);
      if (format == "short") {
        options->output = OUTPUT_SHORT;
      } else if (format == "json") {
        options->output = OUTPUT_JSON;
      } else {
        fprintf(stderr, "expected 'short' or 'json', got '%s'\n", argv[i + 1]);
        return 1;
      }
      i++;
      break;
    }
    case TOKEN_WRITE:
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      options->write = true;
      options->message = std::string(argv[i + 1]);
      i++;
      break;
    case TOKEN_PRIORITY:
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      if (token_of(argv[i + 1]) != TOKEN_INT || std::string_view(argv[i + 1]).size() != 1 ||
          argv[i + 1][0] > '7') {
        fprintf(stderr, "expected a priority between 0 and 7, got '%s'\n", argv[i + 1]);
        return 1;
      }
      options->priority = argv[i + 1][0] - '0';
      i++;
      break;
    case TOKEN_IDENTIFIER:
      if (!has_value(argc, argv, i)) {
        return 1;
      }
      if (token_of(argv[i + 1]) != TOKEN_STRING) {
        fprintf(stderr, "expected an identifier, got '%s'\n", argv[i + 1]);
        return 1;
      }
      options->identifier = std::string(argv[i + 1]);
      i++;
      break;
    default:
      fprintf(stderr, "unexpected argument '%s', see --help for usage\n", argv[i]);
      return 1;
    }
  }
  if (options->write && (options->follow || !options->cursor.empty() || options->lines != 0)) {
    fprintf(stderr, "--write can't be combined with --follow, --cursor or --lines\n");
    return 1;
  }
  return 0;
}

void print_usage(FILE *out) {
  fprintf(out,
          "usage: sdjournal [OPTIONS]\n"
          "\n"
          "reading:\n"
          "  --system                read only the system journal\n"
          "  --user                  read only the current user's journal\n"
          "  --namespace NAME        read the journal namespace NAME\n"
          "  -m, --match FIELD=VALUE show only matching entries, may be repeated\n"
          "  -n, --lines COUNT       show only the last COUNT entries\n"
          "  -c, --cursor CURSOR     start after the entry identified by CURSOR\n"
          "  -f, --follow            wait for new entries\n"
          "  -o, --output FORMAT     'short' (default) or 'json'\n"
          "\n"
          "writing:\n"
          "  -w, --write MESSAGE     write MESSAGE to the journal\n"
          "  -p, --priority N        priority of the written message, 0-7 (default 6)\n"
          "  -t, --identifier NAME   SYSLOG_IDENTIFIER of the written message\n"
          "\n"
          "  -h, --help              show this help\n"
          "      --version           show the version\n");
}

std::string format_entry(const Entry &entry, OutputFormat output) {
  switch (output) {
  case OUTPUT_JSON:
    return serialize_json(entry);
  case OUTPUT_SHORT:
  default:
    return format_short(entry);
  }
}

Error seek_to_start(Reader &reader, const Options &options, std::vector<Entry> *backlog) {
  backlog->clear();
  Error err;
  if (!options.cursor.empty()) {
    // the cursor's entry may be gone, or excluded by the matches, in which case libsystemd
    // lands on the next entry and that one has not been seen yet.
    err = reader.seek(Seek::closest_to_cursor(options.cursor));
    if (!err.ok()) {
      return err;
    }
    std::optional<Entry> landed;
    err = reader.next_entry(&landed);
    if (!err.ok() || !landed) {
      return err;
    }
    bool seen = false;
    err = reader.test_cursor(options.cursor, &seen);
    if (!err.ok()) {
      return err;
    }
    if (!seen) {
      backlog->push_back(std::move(*landed));
    }
    return Error::success();
  }
  if (options.lines == 0) {
    return reader.seek(options.follow ? Seek::tail() : Seek::head());
  }
  err = reader.seek(Seek::tail());
  if (!err.ok()) {
    return err;
  }
  while (backlog->size() < options.lines) {
    std::optional<Entry> entry;
    err = reader.previous_entry(&entry);
    if (!err.ok()) {
      return err;
    }
    if (!entry) {
      break;
    }
    backlog->push_back(std::move(*entry));
  }
  std::reverse(backlog->begin(), backlog->end());
  if (backlog->empty()) {
    return Error::success();
  }
  // continue after the newest entry in the backlog.
  err = reader.seek(Seek::cursor(backlog->back().get_cursor().value_or("")));
  if (!err.ok()) {
    return err;
  }
  std::optional<Entry> newest;
  return reader.next_entry(&newest);
}

} // namespace sdjournal
