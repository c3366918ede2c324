#include "update_check.hpp"
#include "log.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> update_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("update");
  }();
  return logger;
}

} // namespace

std::optional<std::vector<int>> parse_version(const std::string &version) {
  std::string v = version;
  if (!v.empty() && (v[0] == 'v' || v[0] == 'V')) {
    v.erase(0, 1);
  }
  if (v.empty()) {
    return std::nullopt;
  }
  std::vector<int> parts;
  std::stringstream ss(v);
  std::string part;
  while (std::getline(ss, part, '.')) {
    if (part.empty() ||
        part.find_first_not_of("0123456789") != std::string::npos ||
        part.size() > 9) {
      return std::nullopt;
    }
    parts.push_back(std::stoi(part));
  }
  return parts;
}

bool version_newer(const std::string &latest, const std::string &current) {
  auto l = parse_version(latest);
  auto c = parse_version(current);
  if (!l || !c) {
    return false;
  }
  std::size_t n = std::max(l->size(), c->size());
  l->resize(n, 0);
  c->resize(n, 0);
  return *l > *c;
}

std::string release_version(const Release &release) {
  static const std::regex pattern(R"(\*\*Version:\*\*\s*(\d+\.\d+\.\d+))");
  std::smatch match;
  if (std::regex_search(release.body, match, pattern)) {
    return match[1].str();
  }
  return release.tag_name;
}

std::optional<UpdateInfo> check_for_update(GitHubClient &client,
                                           const std::string &repository,
                                           const std::string &current_version) {
  auto slash = repository.find('/');
  if (slash == std::string::npos || slash == 0 ||
      slash + 1 == repository.size()) {
    update_log()->error("Invalid update repository '{}'", repository);
    return std::nullopt;
  }
  auto releases = client.get_releases(repository.substr(0, slash),
                                      repository.substr(slash + 1));
  if (releases.empty()) {
    update_log()->info("No releases found for {}", repository);
    return std::nullopt;
  }
  const Release &latest = releases.front();
  UpdateInfo info;
  info.current_version = current_version;
  info.latest_version = release_version(latest);
  info.html_url = latest.html_url;
  info.available = version_newer(info.latest_version, current_version);
  update_log()->info("Latest version {} (running {}){}", info.latest_version,
                     current_version,
                     info.available ? "; update available" : "");
  return info;
}

} // namespace fastgh
