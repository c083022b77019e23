#include <catch2/catch.hpp>

#include "sdjournal/entry.hpp"

using namespace sdjournal;

TEST_CASE("accepts journal field names", "[field_name]") {
  REQUIRE(is_valid_field_name("MESSAGE"));
  REQUIRE(is_valid_field_name("_BOOT_ID"));
  REQUIRE(is_valid_field_name("__CURSOR"));
  REQUIRE(is_valid_field_name("CODE_LINE2"));
}

TEST_CASE("rejects invalid field names", "[field_name]") {
  REQUIRE_FALSE(is_valid_field_name(""));
  REQUIRE_FALSE(is_valid_field_name("message"));
  REQUIRE_FALSE(is_valid_field_name("2FAST"));
  REQUIRE_FALSE(is_valid_field_name("BAD FIELD"));
  REQUIRE_FALSE(is_valid_field_name("bad field!"));
  REQUIRE_FALSE(is_valid_field_name("FIELD=VALUE"));
  REQUIRE_FALSE(is_valid_field_name(std::string_view("NUL\0", 4)));
}

TEST_CASE("fields iterate in name order", "[entry]") {
  Entry entry;
  entry.set_field("ZETA", "z");
  entry.set_field("ALPHA", "a");
  entry.set_field("MIDDLE", "m");
  std::vector<std::string> names;
  for (const auto &[name, value] : entry.fields()) {
    names.push_back(name);
  }
  REQUIRE(names == std::vector<std::string>{"ALPHA", "MIDDLE", "ZETA"});
}

TEST_CASE("set_field replaces the previous value", "[entry]") {
  Entry entry;
  entry.set_message("first");
  entry.set_message("second");
  REQUIRE(entry.fields().size() == 1);
  REQUIRE(entry.get_message() == "second");
}

TEST_CASE("values are raw bytes", "[entry]") {
  Entry entry;
  std::string binary("a\0b\xff", 4);
  entry.set_field("BLOB", binary);
  auto value = entry.get_field("BLOB");
  REQUIRE(value.has_value());
  REQUIRE(value->size() == 4);
  REQUIRE(*value == binary);
  REQUIRE_FALSE(entry.get_field("MISSING").has_value());
}

TEST_CASE("wallclock time prefers the source timestamp", "[entry]") {
  Entry entry(Entry::Fields{
      {"_SOURCE_REALTIME_TIMESTAMP", "100"},
      {"__REALTIME_TIMESTAMP", "200"},
  });
  REQUIRE(entry.get_wallclock_usec() == 100u);
  REQUIRE(entry.get_source_wallclock_usec() == 100u);
  REQUIRE(entry.get_reception_wallclock_usec() == 200u);
}

TEST_CASE("wallclock time falls back to the reception timestamp", "[entry]") {
  Entry entry(Entry::Fields{{"__REALTIME_TIMESTAMP", "200"}});
  REQUIRE(entry.get_wallclock_usec() == 200u);

  Entry garbage(Entry::Fields{
      {"_SOURCE_REALTIME_TIMESTAMP", "yesterday"},
      {"__REALTIME_TIMESTAMP", "200"},
  });
  REQUIRE(garbage.get_wallclock_usec() == 200u);
}

TEST_CASE("timestamps must be plain decimal numbers", "[entry]") {
  REQUIRE_FALSE(Entry(Entry::Fields{{"__MONOTONIC_TIMESTAMP", ""}}).get_monotonic_usec());
  REQUIRE_FALSE(Entry(Entry::Fields{{"__MONOTONIC_TIMESTAMP", "12ab"}}).get_monotonic_usec());
  REQUIRE_FALSE(Entry(Entry::Fields{{"__MONOTONIC_TIMESTAMP", "-5"}}).get_monotonic_usec());
  REQUIRE(Entry(Entry::Fields{{"__MONOTONIC_TIMESTAMP", "42"}}).get_monotonic_usec() == 42u);
  REQUIRE_FALSE(Entry().get_wallclock_usec());
}

TEST_CASE("reads the cursor", "[entry]") {
  REQUIRE(Entry(Entry::Fields{{"__CURSOR", "s=abc"}}).get_cursor() == "s=abc");
  REQUIRE_FALSE(Entry().get_cursor());
}

TEST_CASE("reads the priority", "[entry]") {
  Entry entry;
  entry.set_priority(3);
  REQUIRE(entry.get_field("PRIORITY") == "3");
  REQUIRE(entry.get_priority() == 3);
  REQUIRE_FALSE(Entry(Entry::Fields{{"PRIORITY", "9"}}).get_priority());
  REQUIRE_FALSE(Entry(Entry::Fields{{"PRIORITY", "12"}}).get_priority());
}

TEST_CASE("gets the transport value", "[entry]") {
  REQUIRE(Entry(Entry::Fields{{"_TRANSPORT", "kernel"}}).get_transport() == Transport::KERNEL);
  REQUIRE(Entry(Entry::Fields{{"_TRANSPORT", "stdout"}}).get_transport() == Transport::STDOUT);
  for (Transport t : {Transport::AUDIT, Transport::DRIVER, Transport::SYSLOG, Transport::JOURNAL}) {
    Entry entry(Entry::Fields{{"_TRANSPORT", std::string(name_for_transport(t))}});
    REQUIRE(entry.get_transport() == t);
  }
}

TEST_CASE("return unknown for unknown transports", "[entry]") {
  REQUIRE(Entry(Entry::Fields{{"_TRANSPORT", "burgus"}}).get_transport() == Transport::UNKNOWN);
  REQUIRE(Entry().get_transport() == Transport::UNKNOWN);
  REQUIRE(name_for_transport(Transport::UNKNOWN) == "unknown");
}
