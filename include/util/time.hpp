/**
 * @file time.hpp
 * @brief Timestamp parsing and human readable time formatting.
 *
 * GitHub reports timestamps as ISO-8601 UTC strings such as
 * "2024-01-02T03:04:05Z". These helpers turn them into `std::time_t` values
 * and the relative phrases shown in lists ("3 days ago", "3d ago").
 */
#ifndef FASTGH_UTIL_TIME_HPP
#define FASTGH_UTIL_TIME_HPP

#include <ctime>
#include <optional>
#include <string>

namespace fastgh {

/// Phrase style used by format_relative_time().
enum class RelativeStyle {
  Long, ///< "3 days ago", "just now"
  Short ///< "3d ago", "Just now"
};

/**
 * Parse an ISO-8601 UTC timestamp.
 *
 * Fractional seconds and a trailing "Z" or "+00:00" are accepted.
 *
 * @return Seconds since the epoch, or `std::nullopt` when @p iso is empty or
 *         malformed.
 */
std::optional<std::time_t> parse_iso8601(const std::string &iso);

/**
 * Format an ISO-8601 timestamp with a strftime pattern in UTC.
 *
 * @return Formatted text, or @p iso unchanged when it cannot be parsed.
 */
std::string format_timestamp(const std::string &iso,
                             const char *pattern = "%Y-%m-%d %H:%M");

/**
 * Describe how long ago @p iso was relative to @p now.
 *
 * Years are 365 days and months 30 days. Unparsable input yields "Unknown".
 */
std::string format_relative_time(const std::string &iso, std::time_t now,
                                  RelativeStyle style = RelativeStyle::Long);

/// Convenience overload using the current wall clock.
std::string format_relative_time(const std::string &iso,
                                 RelativeStyle style = RelativeStyle::Long);

} // namespace fastgh

#endif // FASTGH_UTIL_TIME_HPP
