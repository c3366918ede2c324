/**
 * @file log.hpp
 * @brief Logging utilities for fastgh.
 *
 * Declares logger initialization, category loggers, the in-memory log buffer
 * used by the terminal UI and log category configuration.
 */

#ifndef FASTGH_LOG_HPP
#define FASTGH_LOG_HPP

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastgh {

/**
 * Initialize the global logger with console and optional rotating file sinks.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path for enabling a rotating sink. When empty
 *        no file output is configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided.
 * @param compress_rotations Whether rotated log files should be gzip
 *        compressed automatically.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Arbitrary category name used as the logger identifier.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Calling spdlog logging macros requires a default logger. This helper creates
 * one on demand when the logging subsystem has not been explicitly
 * initialized.
 */
void ensure_default_logger();

/**
 * Enable or silence the console sink.
 *
 * The terminal UI silences it while curses owns the screen.
 */
void set_console_logging(bool enabled);

/**
 * Sink keeping the most recent formatted log lines in memory.
 *
 * The terminal UI renders the buffer in its log pane.
 */
class LogBufferSink : public spdlog::sinks::base_sink<std::mutex> {
public:
  explicit LogBufferSink(std::size_t limit = 200);

  /// Copy of the buffered lines, oldest first.
  std::vector<std::string> lines();

  /// Maximum number of retained lines.
  std::size_t limit() const { return limit_; }

protected:
  void sink_it_(const spdlog::details::log_msg &msg) override;
  void flush_() override {}

private:
  std::size_t limit_;
  std::deque<std::string> lines_;
};

/**
 * Attach a ::LogBufferSink to the default logger and every registered
 * category logger.
 *
 * Loggers created afterwards inherit it through the default sinks.
 *
 * @param limit Number of lines retained by the buffer.
 * @return The attached sink.
 */
std::shared_ptr<LogBufferSink> attach_log_buffer(std::size_t limit = 200);

} // namespace fastgh

#endif // FASTGH_LOG_HPP
