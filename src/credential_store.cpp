#include "credential_store.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace fastgh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> credentials_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("credentials");
  }();
  return logger;
}

bool fail(std::string *error, std::string message) {
  credentials_log()->error("{}", message);
  if (error != nullptr) {
    *error = std::move(message);
  }
  return false;
}

/// Indices of every `account<k>` directory under @p root, ascending.
std::vector<std::size_t> slot_indices(const fs::path &root) {
  static const std::string prefix = "account";
  std::vector<std::size_t> indices;
  std::error_code ec;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.size() <= prefix.size() || name.size() > prefix.size() + 9 ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        !std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()),
                     name.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
      continue;
    }
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      indices.push_back(std::stoul(name.substr(prefix.size())));
    }
  }
  std::sort(indices.begin(), indices.end());
  return indices;
}

/// Undo the renames of a failed removal, newest first.
bool roll_back(const std::vector<std::pair<fs::path, fs::path>> &moved,
               const fs::path &tombstone, const fs::path &target) {
  bool ok = true;
  std::error_code ec;
  for (auto it = moved.rbegin(); it != moved.rend(); ++it) {
    fs::rename(it->second, it->first, ec);
    if (ec) {
      credentials_log()->error("Could not restore {}: {}", it->first.string(),
                               ec.message());
      ok = false;
    }
  }
  if (!tombstone.empty()) {
    fs::rename(tombstone, target, ec);
    if (ec) {
      credentials_log()->error("Could not restore {}: {}", target.string(),
                               ec.message());
      ok = false;
    }
  }
  return ok;
}

} // namespace

CredentialStore::CredentialStore(fs::path root) : root_(std::move(root)) {}

fs::path CredentialStore::slot_dir(std::size_t slot) const {
  return root_ / ("account" + std::to_string(slot));
}

fs::path CredentialStore::credential_file(std::size_t slot) const {
  return slot_dir(slot) / "credentials.json";
}

std::optional<std::string> CredentialStore::load_token(std::size_t slot) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(credential_file(slot));
  if (!in) {
    return std::nullopt;
  }
  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    credentials_log()->warn("Ignoring malformed credentials for slot {}", slot);
    return std::nullopt;
  }
  auto it = j.find("access_token");
  if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

bool CredentialStore::has_token(std::size_t slot) const {
  return load_token(slot).has_value();
}

bool CredentialStore::save_token(std::size_t slot, const std::string &token,
                                 std::string *error) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  fs::create_directories(slot_dir(slot), ec);
  if (ec) {
    return fail(error, "Failed to create " + slot_dir(slot).string() + ": " +
                           ec.message());
  }
  const fs::path path = credential_file(slot);
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    return fail(error, "Failed to open " + path.string() + " for writing");
  }
  out << nlohmann::json{{"access_token", token}}.dump(2) << '\n';
  out.close();
  if (!out) {
    return fail(error, "Failed to write credentials to " + path.string());
  }
#ifndef _WIN32
  ::chmod(path.c_str(), S_IRUSR | S_IWUSR);
#endif
  credentials_log()->info("Stored credentials for slot {}", slot);
  return true;
}

bool CredentialStore::clear_token(std::size_t slot, std::string *error) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  fs::remove(credential_file(slot), ec);
  if (ec) {
    return fail(error, "Failed to remove credentials of slot " +
                           std::to_string(slot) + ": " + ec.message());
  }
  credentials_log()->info("Cleared credentials for slot {}", slot);
  return true;
}

bool CredentialStore::remove_slot(std::size_t slot, std::string *error) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  const fs::path target = slot_dir(slot);
  const fs::path tombstone =
      root_ / (".removing-account" + std::to_string(slot));
  const bool had_target = fs::is_directory(target, ec);
  if (had_target) {
    fs::remove_all(tombstone, ec);
    fs::rename(target, tombstone, ec);
    if (ec) {
      return fail(error, "Failed to move " + target.string() + " aside: " +
                             ec.message());
    }
  }

  // Every later slot directory moves to the lowest free index, so gaps left
  // by missing directories close as well.
  std::vector<std::pair<fs::path, fs::path>> moved;
  std::size_t next = slot;
  for (std::size_t k : slot_indices(root_)) {
    if (k <= slot) {
      continue;
    }
    const fs::path from = slot_dir(k);
    const fs::path to = slot_dir(next);
    std::string reason;
    if (fs::exists(to, ec)) {
      reason = to.string() + " already exists";
    } else {
      fs::rename(from, to, ec);
      if (ec) {
        reason = ec.message();
      }
    }
    if (!reason.empty()) {
      std::string message = "Failed to move " + from.string() + " to " +
                            to.string() + ": " + reason;
      if (!roll_back(moved, had_target ? tombstone : fs::path(), target)) {
        message += " (rollback incomplete)";
      }
      return fail(error, message);
    }
    moved.emplace_back(from, to);
    ++next;
  }

  if (had_target) {
    fs::remove_all(tombstone, ec);
    if (ec) {
      credentials_log()->warn("Could not delete {}: {}", tombstone.string(),
                              ec.message());
    }
  }
  credentials_log()->info("Removed slot {}, moved {} later slot(s) down", slot,
                          moved.size());
  return true;
}

std::size_t CredentialStore::count_slots() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::size_t count = 0;
  while (fs::is_directory(slot_dir(count), ec)) {
    ++count;
  }
  return count;
}

} // namespace fastgh
