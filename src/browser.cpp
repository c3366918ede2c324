#include "browser.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#if defined(_WIN32)
#include <shellapi.h>
#include <windows.h>
#elif defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <CoreServices/CoreServices.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
extern char **environ;
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fastgh {

namespace {
std::shared_ptr<spdlog::logger> browser_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("browser");
  }();
  return logger;
}

bool env_flag_enabled(const char *name) {
  if (const char *v = std::getenv(name)) {
    return (*v != '\0' && *v != '0');
  }
  return false;
}

#if !defined(_WIN32)
[[maybe_unused]] std::string shell_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

[[maybe_unused]] bool command_exists(const char *tool) {
  std::string cmd = std::string("command -v ") + tool + " >/dev/null 2>&1";
  return std::system(cmd.c_str()) == 0;
}
#endif

/// Pipe @p text into the stdin of @p command.
bool pipe_to_command(const std::string &command, const std::string &text) {
#if defined(_WIN32)
  FILE *pipe = _popen(command.c_str(), "w");
#else
  FILE *pipe = popen(command.c_str(), "w");
#endif
  if (pipe == nullptr) {
    browser_log()->warn("Cannot start '{}': {}", command, std::strerror(errno));
    return false;
  }
  std::size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
#if defined(_WIN32)
  int rc = _pclose(pipe);
#else
  int rc = pclose(pipe);
#endif
  if (written != text.size() || rc != 0) {
    browser_log()->warn("'{}' exited with {}", command, rc);
    return false;
  }
  return true;
}

#if defined(__APPLE__)
/// Open a URL via LaunchServices without invoking a shell.
bool ls_open_url(const std::string &url) {
  CFStringRef cfstr = CFStringCreateWithCString(kCFAllocatorDefault, url.c_str(),
                                                kCFStringEncodingUTF8);
  if (!cfstr) {
    browser_log()->warn("CFStringCreateWithCString failed");
    return false;
  }
  CFURLRef cfurl = CFURLCreateWithString(kCFAllocatorDefault, cfstr, nullptr);
  CFRelease(cfstr);
  if (!cfurl) {
    browser_log()->warn("CFURLCreateWithString failed");
    return false;
  }
  OSStatus st = LSOpenCFURLRef(cfurl, nullptr);
  CFRelease(cfurl);
  if (st != noErr) {
    browser_log()->warn("LSOpenCFURLRef failed: {}", static_cast<int>(st));
    return false;
  }
  return true;
}

bool spawn_detached(const std::vector<std::string> &argv) {
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &s : argv)
    cargv.push_back(const_cast<char *>(s.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(), environ);
  if (rc != 0) {
    browser_log()->warn("posix_spawnp('{}') failed: {} ({})", argv[0],
                        std::strerror(rc), rc);
    return false;
  }
  return true;
}
#endif
} // namespace

bool open_url(const std::string &url) {
  if (url.empty()) {
    return false;
  }
  if (env_flag_enabled("FASTGH_TEST_SKIP_BROWSER")) {
    browser_log()->debug("Skipping browser launch for {}", url);
    return true;
  }

#if defined(_WIN32)
  HINSTANCE res = ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr,
                                SW_SHOWNORMAL);
  auto code = reinterpret_cast<uintptr_t>(res);
  if (code > 32) {
    return true;
  }
  browser_log()->warn("ShellExecuteA failed with code {}", code);
  return false;
#elif defined(__APPLE__)
  if (ls_open_url(url))
    return true;
  if (spawn_detached({"/usr/bin/open", url}))
    return true;
  browser_log()->warn("Failed to launch default browser for '{}'", url);
  return false;
#else
  int rc = std::system(
      ("xdg-open " + shell_quote(url) + " >/dev/null 2>&1 &").c_str());
  if (rc != 0) {
    browser_log()->warn("xdg-open command returned {}", rc);
  }
  return rc == 0;
#endif
}

bool copy_to_clipboard(const std::string &text) {
  if (env_flag_enabled("FASTGH_TEST_SKIP_BROWSER")) {
    return true;
  }
#if defined(_WIN32)
  return pipe_to_command("clip", text);
#elif defined(__APPLE__)
  return pipe_to_command("pbcopy", text);
#else
  if (std::getenv("WAYLAND_DISPLAY") != nullptr && command_exists("wl-copy")) {
    return pipe_to_command("wl-copy", text);
  }
  if (command_exists("xclip")) {
    return pipe_to_command("xclip -selection clipboard", text);
  }
  if (command_exists("xsel")) {
    return pipe_to_command("xsel --clipboard --input", text);
  }
  browser_log()->debug("No clipboard tool available");
  return false;
#endif
}

} // namespace fastgh
