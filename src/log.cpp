#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "fastgh";
constexpr std::size_t kRotateBytes = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::weak_ptr<spdlog::sinks::sink> g_console_sink;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 32768;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
  return spdlog::thread_pool();
}

std::shared_ptr<spdlog::logger>
make_async_logger(const std::string &name,
                  const std::vector<spdlog::sink_ptr> &sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
}

namespace fs = std::filesystem;

/**
 * Compute the path of the rotated log file with the given index.
 *
 * Index zero is the active file; higher indices insert ".N" before the
 * extension ("fastgh.log" becomes "fastgh.2.log").
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path stem = base_path.stem();
  fs::path ext = base_path.extension();
  std::string name = stem.string() + "." + std::to_string(index) +
                     ext.string();
  return base_path.has_parent_path() ? base_path.parent_path() / name
                                     : fs::path(name);
}

/**
 * Shift compressed rotations up by one index, dropping the oldest.
 *
 * @param base Base log file path.
 * @param max_files Number of compressed rotations kept.
 */
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = rotated_path(base, i).string() + ".gz";
    fs::remove(to, ec);
    fs::rename(from, to, ec);
    if (ec) {
      fastgh::category_logger("logging")->warn(
          "Could not move {} to {}: {}", from.string(), to.string(),
          ec.message());
    }
  }
}

/**
 * Gzip a rotated log file and delete the plain copy.
 *
 * @param path Rotated log file to compress.
 * @return `true` when the compressed file was written.
 */
bool gzip_file(const std::string &path) {
  auto log = fastgh::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Failed to open log file {} for compression", path);
    return false;
  }
  const std::string gz_path = path + ".gz";
  gzFile gz = gzopen(gz_path.c_str(), "wb");
  if (!gz) {
    log->warn("Failed to open compressed log {}", gz_path);
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (ok && input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize got = input.gcount();
    if (got <= 0) {
      break;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(got));
    if (written != got) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Failed to compress log {}: {}", path, msg ? msg : "unknown");
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(gz_path, ec);
    return false;
  }
  fs::remove(path, ec);
  if (ec) {
    log->warn("Failed to remove {} after compression: {}", path,
              ec.message());
  }
  log->debug("Compressed rotated log '{}'", gz_path);
  return true;
}

spdlog::sink_ptr make_file_sink(const std::string &file,
                                std::size_t rotate_files,
                                bool compress_rotations) {
  if (rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &name) {
      const auto base = spdlog::details::os::filename_to_str(name);
      shift_compressed_logs(base, rotate_files);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kRotateBytes, rotate_files, false, handlers);
}
} // namespace

namespace fastgh {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_console_sink = console;
    sinks.push_back(console);
    if (!file.empty()) {
      sinks.push_back(make_file_sink(file, rotate_files, compress_rotations));
    }
    logger = make_async_logger(kRootLoggerName, sinks);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

void set_console_logging(bool enabled) {
  if (auto sink = g_console_sink.lock()) {
    sink->set_level(enabled ? spdlog::level::trace : spdlog::level::off);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = spdlog::default_logger();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    root = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto logger = make_async_logger(name, sinks);
  logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->info("Applied {} log category override(s)",
                                     overrides.size());
  }
}

LogBufferSink::LogBufferSink(std::size_t limit)
    : limit_(limit == 0 ? 1 : limit) {}

std::vector<std::string> LogBufferSink::lines() {
  std::lock_guard<std::mutex> lock(mutex_);
  return {lines_.begin(), lines_.end()};
}

void LogBufferSink::sink_it_(const spdlog::details::log_msg &msg) {
  spdlog::memory_buf_t formatted;
  formatter_->format(msg, formatted);
  std::string line(formatted.data(), formatted.size());
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
    line.pop_back();
  }
  lines_.push_back(std::move(line));
  while (lines_.size() > limit_) {
    lines_.pop_front();
  }
}

std::shared_ptr<LogBufferSink> attach_log_buffer(std::size_t limit) {
  ensure_default_logger();
  auto sink = std::make_shared<LogBufferSink>(limit);
  sink->set_pattern("%H:%M:%S [%l] %v");
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  spdlog::apply_all([&sink](std::shared_ptr<spdlog::logger> logger) {
    logger->sinks().push_back(sink);
  });
  return sink;
}

} // namespace fastgh
