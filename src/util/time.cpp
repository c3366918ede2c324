#include "util/time.hpp"

#include <iomanip>
#include <sstream>

namespace fastgh {

namespace {

std::string plural(long value, const char *unit) {
  std::string out = std::to_string(value) + " " + unit;
  if (value != 1) {
    out += 's';
  }
  return out + " ago";
}

} // namespace

std::optional<std::time_t> parse_iso8601(const std::string &iso) {
  if (iso.size() < 19) {
    return std::nullopt;
  }
  std::tm tm{};
  std::istringstream ss(iso.substr(0, 19));
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    return std::nullopt;
  }
#ifdef _WIN32
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return t;
}

std::string format_timestamp(const std::string &iso, const char *pattern) {
  auto parsed = parse_iso8601(iso);
  if (!parsed) {
    return iso;
  }
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &*parsed);
#else
  gmtime_r(&*parsed, &tm);
#endif
  std::ostringstream out;
  out << std::put_time(&tm, pattern);
  return out.str();
}

std::string format_relative_time(const std::string &iso, std::time_t now,
                                 RelativeStyle style) {
  auto then = parse_iso8601(iso);
  if (!then) {
    return "Unknown";
  }
  long diff = static_cast<long>(now - *then);
  if (diff < 0) {
    diff = 0;
  }
  const long days = diff / 86400;
  const long secs = diff % 86400;
  const bool shortened = style == RelativeStyle::Short;
  if (days > 365) {
    return shortened ? std::to_string(days / 365) + "y ago"
                     : plural(days / 365, "year");
  }
  if (days > 30) {
    return shortened ? std::to_string(days / 30) + "mo ago"
                     : plural(days / 30, "month");
  }
  if (days > 0) {
    return shortened ? std::to_string(days) + "d ago" : plural(days, "day");
  }
  if (secs > 3600) {
    return shortened ? std::to_string(secs / 3600) + "h ago"
                     : plural(secs / 3600, "hour");
  }
  if (secs > 60) {
    return shortened ? std::to_string(secs / 60) + "m ago"
                     : plural(secs / 60, "minute");
  }
  return shortened ? "Just now" : "just now";
}

std::string format_relative_time(const std::string &iso,
                                 RelativeStyle style) {
  return format_relative_time(iso, std::time(nullptr), style);
}

} // namespace fastgh
