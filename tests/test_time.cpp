#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace fastgh;

TEST_CASE("ISO-8601 timestamps parse as UTC", "[time]") {
  auto t = parse_iso8601("2024-01-02T03:04:05Z");
  REQUIRE(t);
  CHECK(*t == 1704164645);
  CHECK(parse_iso8601("2024-01-02T03:04:05.123+00:00") == t);
  CHECK_FALSE(parse_iso8601(""));
  CHECK_FALSE(parse_iso8601("yesterday at noon"));
}

TEST_CASE("timestamps format with a strftime pattern", "[time]") {
  CHECK(format_timestamp("2024-01-02T03:04:05Z") == "2024-01-02 03:04");
  CHECK(format_timestamp("2024-01-02T03:04:05Z", "%d/%m/%Y") == "02/01/2024");
  CHECK(format_timestamp("not a date") == "not a date");
}

TEST_CASE("relative times in long and short form", "[time]") {
  const std::string iso = "2024-01-01T00:00:00Z";
  const std::time_t base = *parse_iso8601(iso);
  CHECK(format_relative_time(iso, base + 30) == "just now");
  CHECK(format_relative_time(iso, base + 30, RelativeStyle::Short) ==
        "Just now");
  CHECK(format_relative_time(iso, base + 5 * 60) == "5 minutes ago");
  CHECK(format_relative_time(iso, base + 2 * 3600 + 1, RelativeStyle::Short) ==
        "2h ago");
  CHECK(format_relative_time(iso, base + 86400) == "1 day ago");
  CHECK(format_relative_time(iso, base + 3 * 86400, RelativeStyle::Short) ==
        "3d ago");
  CHECK(format_relative_time(iso, base + 62 * 86400) == "2 months ago");
  CHECK(format_relative_time(iso, base + 800 * 86400, RelativeStyle::Short) ==
        "2y ago");
  CHECK(format_relative_time(iso, base - 100) == "just now");
  CHECK(format_relative_time("", base) == "Unknown");
}
