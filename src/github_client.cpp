/**
 * @file github_client.cpp
 * @brief Implementation of the GitHub REST API client.
 */

#include "github_client.hpp"
#include "log.hpp"
#include "version.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <initializer_list>
#include <sstream>
#include <system_error>
#include <thread>

namespace fastgh {

namespace {

constexpr const char *kApiVersion = "2022-11-28";
constexpr const char *kJsonAccept = "application/vnd.github+json";

std::shared_ptr<spdlog::logger> github_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github");
  }();
  return logger;
}

/**
 * Run an API operation, converting any exception into @p fallback.
 *
 * @param operation Short description used in the log message.
 * @param fallback Value returned when @p body throws.
 * @param body Callable producing the operation result.
 */
template <typename R, typename F>
R guarded(const char *operation, R fallback, F &&body) {
  try {
    return body();
  } catch (const std::exception &e) {
    github_log()->error("{} failed: {}", operation, e.what());
    return fallback;
  }
}

bool status_in(const HttpResponse &res, std::initializer_list<long> codes) {
  return std::find(codes.begin(), codes.end(), res.status_code) != codes.end();
}

/// Log unexpected statuses so failed actions leave a trace.
bool expect_status(const char *operation, const HttpResponse &res,
                   std::initializer_list<long> codes) {
  if (status_in(res, codes)) {
    return true;
  }
  github_log()->warn("{} returned HTTP {}", operation, res.status_code);
  return false;
}

std::optional<long long> parse_integer(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno = 0;
  char *end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return value;
}

/// Extract the `rel="next"` target of a Link header.
std::optional<std::string> next_link(const std::string &header) {
  std::stringstream ss(header);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (part.find("rel=\"next\"") == std::string::npos) {
      continue;
    }
    auto start = part.find('<');
    auto end = part.find('>', start);
    if (start != std::string::npos && end != std::string::npos) {
      return part.substr(start + 1, end - start - 1);
    }
  }
  return std::nullopt;
}

/// Percent-encode each segment of a slash separated path.
std::string encode_path(const std::string &path) {
  std::string out;
  std::stringstream ss(path);
  std::string segment;
  while (std::getline(ss, segment, '/')) {
    if (segment.empty()) {
      continue;
    }
    out += "/" + url_encode(segment);
  }
  return out;
}

std::string repo_path(const std::string &owner, const std::string &repo) {
  return "/repos/" + url_encode(owner) + "/" + url_encode(repo);
}

const char *merge_method_name(MergeMethod method) {
  switch (method) {
  case MergeMethod::Squash:
    return "squash";
  case MergeMethod::Rebase:
    return "rebase";
  case MergeMethod::Merge:
    break;
  }
  return "merge";
}

void sort_by_updated_desc(std::vector<Repository> &repos) {
  std::stable_sort(repos.begin(), repos.end(),
                   [](const Repository &a, const Repository &b) {
                     return a.updated_at > b.updated_at;
                   });
}

nlohmann::json state_patch(const std::optional<std::string> &title,
                           const std::optional<std::string> &body,
                           const std::optional<std::string> &state) {
  nlohmann::json patch = nlohmann::json::object();
  if (title) {
    patch["title"] = *title;
  }
  if (body) {
    patch["body"] = *body;
  }
  if (state) {
    patch["state"] = *state;
  }
  return patch;
}

} // namespace

GitHubClient::GitHubClient(std::string token, std::unique_ptr<HttpClient> http,
                           std::string api_base, int delay_ms)
    : http_(std::move(http)), api_base_(std::move(api_base)),
      token_(std::move(token)), delay_(std::max(delay_ms, 0)),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
  if (!http_) {
    http_ = std::make_unique<RetryHttpClient>(
        std::make_unique<CurlHttpClient>(30000, kUserAgent), 3, 200);
  }
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

void GitHubClient::set_token(const std::string &token) {
  std::lock_guard<std::mutex> lock(token_mutex_);
  token_ = token;
}

bool GitHubClient::has_token() const {
  std::lock_guard<std::mutex> lock(token_mutex_);
  return !token_.empty();
}

void GitHubClient::set_delay_ms(int delay_ms) {
  std::lock_guard<std::mutex> lock(rate_mutex_);
  delay_ = std::chrono::milliseconds(std::max(delay_ms, 0));
}

void GitHubClient::set_sleep_function(SleepFunction sleep) {
  sleep_ = std::move(sleep);
}

void GitHubClient::set_max_rate_limit_wait(std::chrono::seconds wait) {
  max_rate_limit_wait_ = wait;
}

std::string GitHubClient::url(const std::string &path,
                              const Query &query) const {
  std::string out = path.rfind("http", 0) == 0 ? path : api_base_ + path;
  char sep = out.find('?') == std::string::npos ? '?' : '&';
  for (const auto &[key, value] : query) {
    out += sep;
    out += key + "=" + url_encode(value);
    sep = '&';
  }
  return out;
}

std::vector<std::string>
GitHubClient::request_headers(const std::string &accept) const {
  std::vector<std::string> headers;
  {
    std::lock_guard<std::mutex> lock(token_mutex_);
    if (!token_.empty()) {
      headers.push_back("Authorization: Bearer " + token_);
    }
  }
  headers.push_back("Accept: " + accept);
  headers.push_back(std::string("X-GitHub-Api-Version: ") + kApiVersion);
  return headers;
}

void GitHubClient::enforce_delay() {
  std::chrono::milliseconds wait{0};
  {
    std::lock_guard<std::mutex> lock(rate_mutex_);
    if (delay_.count() <= 0) {
      return;
    }
    auto now = std::chrono::steady_clock::now();
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last_request_);
    if (elapsed < delay_) {
      wait = delay_ - elapsed;
    }
    last_request_ = now + wait;
  }
  if (wait.count() > 0) {
    std::this_thread::sleep_for(wait);
  }
}

std::optional<std::chrono::milliseconds>
GitHubClient::rate_limit_wait(const HttpResponse &res) const {
  if (res.status_code != 403 && res.status_code != 429) {
    return std::nullopt;
  }
  std::optional<std::chrono::seconds> wait;
  if (auto retry_after = find_header(res.headers, "Retry-After")) {
    if (auto secs = parse_integer(*retry_after)) {
      wait = std::chrono::seconds(std::max<long long>(*secs, 0));
    }
  }
  if (!wait) {
    auto remaining = find_header(res.headers, "X-RateLimit-Remaining");
    auto reset = find_header(res.headers, "X-RateLimit-Reset");
    if (remaining && reset && parse_integer(*remaining).value_or(-1) == 0) {
      long long reset_at = parse_integer(*reset).value_or(0);
      long long now = static_cast<long long>(std::time(nullptr));
      wait = std::chrono::seconds(std::max<long long>(reset_at - now, 0));
    }
  }
  if (!wait) {
    // Plain permission failure, not a rate limit.
    return std::nullopt;
  }
  return std::chrono::milliseconds(std::min(*wait, max_rate_limit_wait_));
}

HttpResponse GitHubClient::send(const char *verb, const std::string &url,
                                const std::string *body,
                                const std::vector<std::string> &headers) {
  static const std::string empty;
  const std::string method = verb;
  const std::string &payload = body ? *body : empty;
  for (int attempt = 0;; ++attempt) {
    enforce_delay();
    HttpResponse res;
    if (method == "GET") {
      res = http_->get(url, headers);
    } else if (method == "POST") {
      res = http_->post(url, payload, headers);
    } else if (method == "PUT") {
      res = http_->put(url, payload, headers);
    } else if (method == "PATCH") {
      res = http_->patch(url, payload, headers);
    } else if (method == "DELETE") {
      res = http_->del(url, headers);
    } else {
      throw std::invalid_argument("Unsupported HTTP verb " + method);
    }
    if (attempt < rate_limit_retries_) {
      if (auto wait = rate_limit_wait(res)) {
        github_log()->warn("Rate limited on {} {}; waiting {} ms", verb, url,
                           wait->count());
        sleep_(*wait);
        continue;
      }
    }
    return res;
  }
}

HttpResponse GitHubClient::get(const std::string &url) {
  return send("GET", url, nullptr, request_headers());
}

std::optional<nlohmann::json> GitHubClient::get_json(const std::string &url) {
  HttpResponse res = get(url);
  if (res.status_code != 200) {
    github_log()->warn("GET {} returned HTTP {}", url, res.status_code);
    return std::nullopt;
  }
  return nlohmann::json::parse(res.body);
}

HttpResponse GitHubClient::send_json(const char *verb, const std::string &url,
                                     const nlohmann::json &body) {
  auto headers = request_headers();
  headers.push_back("Content-Type: application/json");
  const std::string payload = body.dump();
  return send(verb, url, &payload, headers);
}

void GitHubClient::for_each_item(const std::string &path, Query query,
                                 const PageOptions &options,
                                 const ItemVisitor &visit) {
  query.emplace_back("per_page", std::to_string(options.per_page));
  int page = 1;
  auto page_url = [&] {
    Query q = query;
    q.emplace_back("page", std::to_string(page));
    return url(path, q);
  };
  std::string next = page_url();
  while (true) {
    HttpResponse res = get(next);
    if (res.status_code != 200) {
      github_log()->warn("GET {} returned HTTP {}", next, res.status_code);
      return;
    }
    const nlohmann::json body = nlohmann::json::parse(res.body);
    const nlohmann::json *items = &body;
    if (options.items_key != nullptr) {
      auto it = body.find(options.items_key);
      items = it != body.end() ? &*it : nullptr;
    }
    if (items == nullptr || !items->is_array() || items->empty()) {
      return;
    }
    for (const auto &item : *items) {
      if (!visit(item)) {
        return;
      }
    }
    if (static_cast<int>(items->size()) < options.per_page) {
      return;
    }
    if (options.max_pages > 0 && page >= options.max_pages) {
      return;
    }
    ++page;
    if (auto link = find_header(res.headers, "Link")) {
      auto target = next_link(*link);
      if (!target) {
        return;
      }
      next = *target;
    } else {
      next = page_url();
    }
  }
}

CredentialCheck GitHubClient::check_credentials() {
  CredentialCheck check;
  try {
    HttpResponse res = get(url("/user"));
    if (res.status_code == 200) {
      check.status = CredentialStatus::Valid;
      check.profile = parse_user_profile(nlohmann::json::parse(res.body));
    } else if (res.status_code == 401) {
      check.status = CredentialStatus::Rejected;
      check.message = "Access token was rejected";
    } else {
      check.message = "Verification returned HTTP " +
                      std::to_string(res.status_code);
    }
  } catch (const std::exception &e) {
    check.status = CredentialStatus::Failed;
    check.message = e.what();
  }
  if (check.status != CredentialStatus::Valid) {
    github_log()->warn("Credential check failed: {}", check.message);
  }
  return check;
}

std::optional<UserProfile> GitHubClient::get_user(const std::string &username) {
  return guarded("get_user", std::optional<UserProfile>{}, [&] {
    auto j = get_json(url("/users/" + url_encode(username)));
    return j ? std::optional<UserProfile>(parse_user_profile(*j))
             : std::nullopt;
  });
}

std::vector<Repository>
GitHubClient::get_user_repos(const std::string &username) {
  return guarded("get_user_repos", std::vector<Repository>{}, [&] {
    std::vector<Repository> repos;
    for_each_item("/users/" + url_encode(username) + "/repos",
                  {{"sort", "updated"}, {"direction", "desc"}}, {},
                  [&](const nlohmann::json &item) {
                    repos.push_back(parse_repository(item));
                    return true;
                  });
    return repos;
  });
}

std::vector<UserProfile> GitHubClient::get_following() {
  return guarded("get_following", std::vector<UserProfile>{}, [&] {
    std::vector<UserProfile> users;
    for_each_item("/user/following", {}, {}, [&](const nlohmann::json &item) {
      users.push_back(parse_user_profile(item));
      return true;
    });
    return users;
  });
}

bool GitHubClient::is_following(const std::string &username) {
  return guarded("is_following", false, [&] {
    return get(url("/user/following/" + url_encode(username))).status_code ==
           204;
  });
}

bool GitHubClient::follow_user(const std::string &username) {
  return guarded("follow_user", false, [&] {
    auto res = send("PUT", url("/user/following/" + url_encode(username)),
                    nullptr, request_headers());
    return expect_status("follow_user", res, {204});
  });
}

bool GitHubClient::unfollow_user(const std::string &username) {
  return guarded("unfollow_user", false, [&] {
    auto res = send("DELETE", url("/user/following/" + url_encode(username)),
                    nullptr, request_headers());
    return expect_status("unfollow_user", res, {204});
  });
}

std::vector<Repository> GitHubClient::get_repos() {
  return guarded("get_repos", std::vector<Repository>{}, [&] {
    std::vector<Repository> repos;
    for_each_item("/user/repos",
                  {{"sort", "updated"},
                   {"direction", "desc"},
                   {"affiliation", "owner,collaborator,organization_member"}},
                  {}, [&](const nlohmann::json &item) {
                    repos.push_back(parse_repository(item));
                    return true;
                  });
    github_log()->debug("Loaded {} repositories", repos.size());
    return repos;
  });
}

std::vector<Repository> GitHubClient::get_starred() {
  return guarded("get_starred", std::vector<Repository>{}, [&] {
    std::vector<Repository> repos;
    for_each_item("/user/starred", {{"sort", "updated"}, {"direction", "desc"}},
                  {}, [&](const nlohmann::json &item) {
                    repos.push_back(parse_repository(item));
                    return true;
                  });
    sort_by_updated_desc(repos);
    return repos;
  });
}

std::vector<Repository> GitHubClient::get_watched() {
  return guarded("get_watched", std::vector<Repository>{}, [&] {
    std::vector<Repository> repos;
    for_each_item("/user/subscriptions", {}, {},
                  [&](const nlohmann::json &item) {
                    repos.push_back(parse_repository(item));
                    return true;
                  });
    sort_by_updated_desc(repos);
    return repos;
  });
}

std::optional<Repository> GitHubClient::get_repo(const std::string &owner,
                                                 const std::string &repo) {
  return guarded("get_repo", std::optional<Repository>{}, [&] {
    auto j = get_json(url(repo_path(owner, repo)));
    return j ? std::optional<Repository>(parse_repository(*j)) : std::nullopt;
  });
}

std::optional<std::string>
GitHubClient::get_repo_permission(const std::string &owner,
                                  const std::string &repo) {
  return guarded("get_repo_permission", std::optional<std::string>{}, [&] {
    auto j = get_json(url(repo_path(owner, repo)));
    if (!j || !j->contains("permissions")) {
      return std::optional<std::string>{};
    }
    const auto &perms = (*j)["permissions"];
    if (perms.value("admin", false)) {
      return std::optional<std::string>("admin");
    }
    if (perms.value("push", false)) {
      return std::optional<std::string>("write");
    }
    if (perms.value("pull", false)) {
      return std::optional<std::string>("read");
    }
    return std::optional<std::string>{};
  });
}

bool GitHubClient::can_merge(const std::string &owner,
                             const std::string &repo) {
  auto permission = get_repo_permission(owner, repo);
  return permission && (*permission == "admin" || *permission == "write");
}

std::vector<Branch> GitHubClient::get_branches(const std::string &owner,
                                               const std::string &repo) {
  return guarded("get_branches", std::vector<Branch>{}, [&] {
    std::vector<Branch> branches;
    for_each_item(repo_path(owner, repo) + "/branches", {}, {},
                  [&](const nlohmann::json &item) {
                    branches.push_back(parse_branch(item));
                    return true;
                  });
    for (auto &branch : branches) {
      if (branch.sha.empty()) {
        continue;
      }
      auto commit =
          get_json(url(repo_path(owner, repo) + "/commits/" + branch.sha));
      if (commit) {
        branch.last_commit_date = parse_commit(*commit).committer.date;
      }
    }
    std::stable_sort(branches.begin(), branches.end(),
                     [](const Branch &a, const Branch &b) {
                       return a.last_commit_date > b.last_commit_date;
                     });
    return branches;
  });
}

std::vector<ContentItem> GitHubClient::get_contents(const std::string &owner,
                                                    const std::string &repo,
                                                    const std::string &path,
                                                    const std::string &ref) {
  return guarded("get_contents", std::vector<ContentItem>{}, [&] {
    Query query;
    if (!ref.empty()) {
      query.emplace_back("ref", ref);
    }
    std::vector<ContentItem> items;
    auto j = get_json(
        url(repo_path(owner, repo) + "/contents" + encode_path(path), query));
    if (!j) {
      return items;
    }
    if (j->is_array()) {
      for (const auto &item : *j) {
        items.push_back(parse_content_item(item));
      }
      std::stable_sort(items.begin(), items.end(),
                       [](const ContentItem &a, const ContentItem &b) {
                         if ((a.type == "dir") != (b.type == "dir")) {
                           return a.type == "dir";
                         }
                         return a.name < b.name;
                       });
    } else if (j->is_object()) {
      items.push_back(parse_content_item(*j));
    }
    return items;
  });
}

std::optional<std::string> GitHubClient::get_file_text(const std::string &owner,
                                                       const std::string &repo,
                                                       const std::string &path,
                                                       const std::string &ref) {
  return guarded("get_file_text", std::optional<std::string>{}, [&] {
    Query query;
    if (!ref.empty()) {
      query.emplace_back("ref", ref);
    }
    auto res = send(
        "GET",
        url(repo_path(owner, repo) + "/contents" + encode_path(path), query),
        nullptr, request_headers("application/vnd.github.raw"));
    if (!expect_status("get_file_text", res, {200})) {
      return std::optional<std::string>{};
    }
    return std::optional<std::string>(res.body);
  });
}

bool GitHubClient::is_starred(const std::string &owner,
                              const std::string &repo) {
  return guarded("is_starred", false, [&] {
    return get(url("/user/starred/" + url_encode(owner) + "/" +
                   url_encode(repo)))
               .status_code == 204;
  });
}

bool GitHubClient::star_repo(const std::string &owner,
                             const std::string &repo) {
  return guarded("star_repo", false, [&] {
    auto res = send("PUT",
                    url("/user/starred/" + url_encode(owner) + "/" +
                        url_encode(repo)),
                    nullptr, request_headers());
    return expect_status("star_repo", res, {204});
  });
}

bool GitHubClient::unstar_repo(const std::string &owner,
                               const std::string &repo) {
  return guarded("unstar_repo", false, [&] {
    auto res = send("DELETE",
                    url("/user/starred/" + url_encode(owner) + "/" +
                        url_encode(repo)),
                    nullptr, request_headers());
    return expect_status("unstar_repo", res, {204});
  });
}

bool GitHubClient::is_watching(const std::string &owner,
                               const std::string &repo) {
  return guarded("is_watching", false, [&] {
    return get(url(repo_path(owner, repo) + "/subscription")).status_code ==
           200;
  });
}

bool GitHubClient::watch_repo(const std::string &owner,
                              const std::string &repo) {
  return guarded("watch_repo", false, [&] {
    auto res = send_json("PUT", url(repo_path(owner, repo) + "/subscription"),
                         {{"subscribed", true}});
    return expect_status("watch_repo", res, {200});
  });
}

bool GitHubClient::unwatch_repo(const std::string &owner,
                                const std::string &repo) {
  return guarded("unwatch_repo", false, [&] {
    auto res = send("DELETE", url(repo_path(owner, repo) + "/subscription"),
                    nullptr, request_headers());
    return expect_status("unwatch_repo", res, {204});
  });
}

std::vector<SearchResult> GitHubClient::search(SearchKind kind,
                                               const std::string &query,
                                               const std::string &sort,
                                               int per_page) {
  return guarded("search", std::vector<SearchResult>{}, [&] {
    std::vector<SearchResult> results;
    Query params{{"q", query}, {"per_page", std::to_string(per_page)}};
    if (!sort.empty() && sort != "best-match") {
      params.emplace_back("sort", sort);
    }
    const std::string path = kind == SearchKind::Repositories
                                 ? "/search/repositories"
                                 : "/search/users";
    auto j = get_json(url(path, params));
    if (!j || !j->contains("items") || !(*j)["items"].is_array()) {
      return results;
    }
    for (const auto &item : (*j)["items"]) {
      if (kind == SearchKind::Repositories) {
        results.emplace_back(parse_repository(item));
      } else {
        results.emplace_back(parse_user_profile(item));
      }
    }
    return results;
  });
}

std::vector<Issue> GitHubClient::get_issues(const std::string &owner,
                                            const std::string &repo,
                                            const std::string &state) {
  return guarded("get_issues", std::vector<Issue>{}, [&] {
    std::vector<Issue> issues;
    for_each_item(repo_path(owner, repo) + "/issues", {{"state", state}}, {},
                  [&](const nlohmann::json &item) {
                    Issue issue = parse_issue(item);
                    if (!issue.is_pull_request) {
                      issues.push_back(std::move(issue));
                    }
                    return true;
                  });
    return issues;
  });
}

std::optional<Issue> GitHubClient::get_issue(const std::string &owner,
                                             const std::string &repo,
                                             int number) {
  return guarded("get_issue", std::optional<Issue>{}, [&] {
    auto j = get_json(
        url(repo_path(owner, repo) + "/issues/" + std::to_string(number)));
    return j ? std::optional<Issue>(parse_issue(*j)) : std::nullopt;
  });
}

std::optional<Issue> GitHubClient::create_issue(
    const std::string &owner, const std::string &repo, const std::string &title,
    const std::string &body, const std::vector<std::string> &labels) {
  return guarded("create_issue", std::optional<Issue>{}, [&] {
    nlohmann::json payload{{"title", title}, {"body", body}};
    if (!labels.empty()) {
      payload["labels"] = labels;
    }
    auto res =
        send_json("POST", url(repo_path(owner, repo) + "/issues"), payload);
    if (!expect_status("create_issue", res, {201})) {
      return std::optional<Issue>{};
    }
    return std::optional<Issue>(parse_issue(nlohmann::json::parse(res.body)));
  });
}

std::optional<Issue> GitHubClient::update_issue(
    const std::string &owner, const std::string &repo, int number,
    const std::optional<std::string> &title,
    const std::optional<std::string> &body,
    const std::optional<std::string> &state) {
  return guarded("update_issue", std::optional<Issue>{}, [&] {
    auto res = send_json(
        "PATCH",
        url(repo_path(owner, repo) + "/issues/" + std::to_string(number)),
        state_patch(title, body, state));
    if (!expect_status("update_issue", res, {200})) {
      return std::optional<Issue>{};
    }
    return std::optional<Issue>(parse_issue(nlohmann::json::parse(res.body)));
  });
}

bool GitHubClient::close_issue(const std::string &owner,
                               const std::string &repo, int number) {
  return update_issue(owner, repo, number, std::nullopt, std::nullopt,
                      std::string("closed"))
      .has_value();
}

bool GitHubClient::reopen_issue(const std::string &owner,
                                const std::string &repo, int number) {
  return update_issue(owner, repo, number, std::nullopt, std::nullopt,
                      std::string("open"))
      .has_value();
}

std::vector<Comment> GitHubClient::get_issue_comments(const std::string &owner,
                                                      const std::string &repo,
                                                      int number) {
  return guarded("get_issue_comments", std::vector<Comment>{}, [&] {
    std::vector<Comment> comments;
    for_each_item(repo_path(owner, repo) + "/issues/" +
                      std::to_string(number) + "/comments",
                  {}, {}, [&](const nlohmann::json &item) {
                    comments.push_back(parse_comment(item));
                    return true;
                  });
    return comments;
  });
}

std::optional<Comment>
GitHubClient::create_issue_comment(const std::string &owner,
                                   const std::string &repo, int number,
                                   const std::string &body) {
  return guarded("create_issue_comment", std::optional<Comment>{}, [&] {
    auto res = send_json("POST",
                         url(repo_path(owner, repo) + "/issues/" +
                             std::to_string(number) + "/comments"),
                         {{"body", body}});
    if (!expect_status("create_issue_comment", res, {201})) {
      return std::optional<Comment>{};
    }
    return std::optional<Comment>(
        parse_comment(nlohmann::json::parse(res.body)));
  });
}

bool GitHubClient::delete_comment(const std::string &owner,
                                  const std::string &repo,
                                  std::int64_t comment_id) {
  return guarded("delete_comment", false, [&] {
    auto res = send("DELETE",
                    url(repo_path(owner, repo) + "/issues/comments/" +
                        std::to_string(comment_id)),
                    nullptr, request_headers());
    return expect_status("delete_comment", res, {204});
  });
}

std::vector<PullRequest>
GitHubClient::get_pull_requests(const std::string &owner,
                                const std::string &repo,
                                const std::string &state) {
  return guarded("get_pull_requests", std::vector<PullRequest>{}, [&] {
    std::vector<PullRequest> pulls;
    for_each_item(repo_path(owner, repo) + "/pulls", {{"state", state}}, {},
                  [&](const nlohmann::json &item) {
                    pulls.push_back(parse_pull_request(item));
                    return true;
                  });
    return pulls;
  });
}

std::optional<PullRequest>
GitHubClient::get_pull_request(const std::string &owner,
                               const std::string &repo, int number) {
  return guarded("get_pull_request", std::optional<PullRequest>{}, [&] {
    auto j = get_json(
        url(repo_path(owner, repo) + "/pulls/" + std::to_string(number)));
    return j ? std::optional<PullRequest>(parse_pull_request(*j))
             : std::nullopt;
  });
}

std::optional<PullRequest> GitHubClient::create_pull_request(
    const std::string &owner, const std::string &repo, const std::string &title,
    const std::string &head, const std::string &base, const std::string &body,
    bool draft) {
  return guarded("create_pull_request", std::optional<PullRequest>{}, [&] {
    nlohmann::json payload{{"title", title},
                           {"head", head},
                           {"base", base},
                           {"body", body},
                           {"draft", draft}};
    auto res =
        send_json("POST", url(repo_path(owner, repo) + "/pulls"), payload);
    if (!expect_status("create_pull_request", res, {201})) {
      return std::optional<PullRequest>{};
    }
    return std::optional<PullRequest>(
        parse_pull_request(nlohmann::json::parse(res.body)));
  });
}

std::optional<PullRequest> GitHubClient::update_pull_request(
    const std::string &owner, const std::string &repo, int number,
    const std::optional<std::string> &title,
    const std::optional<std::string> &body,
    const std::optional<std::string> &state) {
  return guarded("update_pull_request", std::optional<PullRequest>{}, [&] {
    auto res = send_json(
        "PATCH",
        url(repo_path(owner, repo) + "/pulls/" + std::to_string(number)),
        state_patch(title, body, state));
    if (!expect_status("update_pull_request", res, {200})) {
      return std::optional<PullRequest>{};
    }
    return std::optional<PullRequest>(
        parse_pull_request(nlohmann::json::parse(res.body)));
  });
}

bool GitHubClient::merge_pull_request(const std::string &owner,
                                      const std::string &repo, int number,
                                      MergeMethod method,
                                      const std::string &commit_title,
                                      const std::string &commit_message,
                                      std::string *error) {
  return guarded("merge_pull_request", false, [&] {
    nlohmann::json payload{{"merge_method", merge_method_name(method)}};
    if (!commit_title.empty()) {
      payload["commit_title"] = commit_title;
    }
    if (!commit_message.empty()) {
      payload["commit_message"] = commit_message;
    }
    auto res = send_json("PUT",
                         url(repo_path(owner, repo) + "/pulls/" +
                             std::to_string(number) + "/merge"),
                         payload);
    if (res.status_code == 200) {
      github_log()->info("Merged {}/{}#{}", owner, repo, number);
      return true;
    }
    if (error != nullptr) {
      auto body = nlohmann::json::parse(res.body, nullptr, false);
      *error = body.is_object() && body.contains("message") &&
                       body["message"].is_string()
                   ? body["message"].get<std::string>()
                   : "HTTP " + std::to_string(res.status_code);
    }
    github_log()->warn("Merge of {}/{}#{} refused with HTTP {}", owner, repo,
                       number, res.status_code);
    return false;
  });
}

bool GitHubClient::close_pull_request(const std::string &owner,
                                      const std::string &repo, int number) {
  return update_pull_request(owner, repo, number, std::nullopt, std::nullopt,
                             std::string("closed"))
      .has_value();
}

bool GitHubClient::reopen_pull_request(const std::string &owner,
                                       const std::string &repo, int number) {
  return update_pull_request(owner, repo, number, std::nullopt, std::nullopt,
                             std::string("open"))
      .has_value();
}

std::vector<Commit> GitHubClient::get_commits(const std::string &owner,
                                              const std::string &repo,
                                              const std::string &branch,
                                              std::size_t max_commits) {
  return guarded("get_commits", std::vector<Commit>{}, [&] {
    PageOptions options;
    if (max_commits > 0 &&
        max_commits < static_cast<std::size_t>(options.per_page)) {
      options.per_page = static_cast<int>(max_commits);
    }
    Query query;
    if (!branch.empty()) {
      query.emplace_back("sha", branch);
    }
    std::vector<Commit> commits;
    for_each_item(repo_path(owner, repo) + "/commits", query, options,
                  [&](const nlohmann::json &item) {
                    commits.push_back(parse_commit(item));
                    return max_commits == 0 || commits.size() < max_commits;
                  });
    return commits;
  });
}

std::optional<Commit> GitHubClient::get_commit(const std::string &owner,
                                               const std::string &repo,
                                               const std::string &sha) {
  return guarded("get_commit", std::optional<Commit>{}, [&] {
    auto j =
        get_json(url(repo_path(owner, repo) + "/commits/" + url_encode(sha)));
    return j ? std::optional<Commit>(parse_commit(*j)) : std::nullopt;
  });
}

std::vector<Workflow> GitHubClient::get_workflows(const std::string &owner,
                                                  const std::string &repo) {
  return guarded("get_workflows", std::vector<Workflow>{}, [&] {
    PageOptions options;
    options.items_key = "workflows";
    std::vector<Workflow> workflows;
    for_each_item(repo_path(owner, repo) + "/actions/workflows", {}, options,
                  [&](const nlohmann::json &item) {
                    workflows.push_back(parse_workflow(item));
                    return true;
                  });
    return workflows;
  });
}

std::vector<WorkflowRun>
GitHubClient::get_workflow_runs(const std::string &owner,
                                const std::string &repo,
                                const WorkflowRunFilter &filter) {
  return guarded("get_workflow_runs", std::vector<WorkflowRun>{}, [&] {
    std::string path = repo_path(owner, repo) + "/actions/";
    path += filter.workflow_id
                ? "workflows/" + std::to_string(*filter.workflow_id) + "/runs"
                : std::string("runs");
    Query query;
    if (!filter.branch.empty()) {
      query.emplace_back("branch", filter.branch);
    }
    if (!filter.status.empty()) {
      query.emplace_back("status", filter.status);
    }
    PageOptions options;
    options.per_page = filter.per_page;
    options.items_key = "workflow_runs";
    std::vector<WorkflowRun> runs;
    for_each_item(path, query, options, [&](const nlohmann::json &item) {
      runs.push_back(parse_workflow_run(item));
      return true;
    });
    return runs;
  });
}

std::optional<WorkflowRun>
GitHubClient::get_workflow_run(const std::string &owner,
                               const std::string &repo, std::int64_t run_id) {
  return guarded("get_workflow_run", std::optional<WorkflowRun>{}, [&] {
    auto j = get_json(url(repo_path(owner, repo) + "/actions/runs/" +
                          std::to_string(run_id)));
    return j ? std::optional<WorkflowRun>(parse_workflow_run(*j))
             : std::nullopt;
  });
}

std::vector<WorkflowJob>
GitHubClient::get_workflow_run_jobs(const std::string &owner,
                                    const std::string &repo,
                                    std::int64_t run_id) {
  return guarded("get_workflow_run_jobs", std::vector<WorkflowJob>{}, [&] {
    PageOptions options;
    options.items_key = "jobs";
    std::vector<WorkflowJob> jobs;
    for_each_item(repo_path(owner, repo) + "/actions/runs/" +
                      std::to_string(run_id) + "/jobs",
                  {}, options, [&](const nlohmann::json &item) {
                    jobs.push_back(parse_workflow_job(item));
                    return true;
                  });
    return jobs;
  });
}

bool GitHubClient::rerun_workflow(const std::string &owner,
                                  const std::string &repo,
                                  std::int64_t run_id) {
  return guarded("rerun_workflow", false, [&] {
    auto res = send("POST",
                    url(repo_path(owner, repo) + "/actions/runs/" +
                        std::to_string(run_id) + "/rerun"),
                    nullptr, request_headers());
    return expect_status("rerun_workflow", res, {201});
  });
}

bool GitHubClient::rerun_failed_jobs(const std::string &owner,
                                     const std::string &repo,
                                     std::int64_t run_id) {
  return guarded("rerun_failed_jobs", false, [&] {
    auto res = send("POST",
                    url(repo_path(owner, repo) + "/actions/runs/" +
                        std::to_string(run_id) + "/rerun-failed-jobs"),
                    nullptr, request_headers());
    return expect_status("rerun_failed_jobs", res, {201});
  });
}

bool GitHubClient::cancel_workflow_run(const std::string &owner,
                                       const std::string &repo,
                                       std::int64_t run_id) {
  return guarded("cancel_workflow_run", false, [&] {
    auto res = send("POST",
                    url(repo_path(owner, repo) + "/actions/runs/" +
                        std::to_string(run_id) + "/cancel"),
                    nullptr, request_headers());
    return expect_status("cancel_workflow_run", res, {202});
  });
}

std::optional<std::string>
GitHubClient::get_workflow_run_logs_url(const std::string &owner,
                                        const std::string &repo,
                                        std::int64_t run_id) {
  return guarded("get_workflow_run_logs_url", std::optional<std::string>{},
                 [&] {
                   auto res = get(url(repo_path(owner, repo) +
                                      "/actions/runs/" +
                                      std::to_string(run_id) + "/logs"));
                   if (res.status_code != 302) {
                     return std::optional<std::string>{};
                   }
                   return find_header(res.headers, "Location");
                 });
}

std::optional<std::string> GitHubClient::get_job_logs(const std::string &owner,
                                                      const std::string &repo,
                                                      std::int64_t job_id) {
  return guarded("get_job_logs", std::optional<std::string>{}, [&] {
    auto res = get(url(repo_path(owner, repo) + "/actions/jobs/" +
                       std::to_string(job_id) + "/logs"));
    if (res.status_code == 200) {
      return std::optional<std::string>(res.body);
    }
    if (res.status_code == 302) {
      if (auto location = find_header(res.headers, "Location")) {
        // Signed storage URLs reject API credentials.
        auto logs = http_->get(*location, {});
        if (logs.status_code == 200) {
          return std::optional<std::string>(logs.body);
        }
      }
    }
    github_log()->warn("get_job_logs returned HTTP {}", res.status_code);
    return std::optional<std::string>{};
  });
}

std::vector<Release> GitHubClient::get_releases(const std::string &owner,
                                                const std::string &repo) {
  return guarded("get_releases", std::vector<Release>{}, [&] {
    PageOptions options;
    options.per_page = 30;
    std::vector<Release> releases;
    for_each_item(repo_path(owner, repo) + "/releases", {}, options,
                  [&](const nlohmann::json &item) {
                    releases.push_back(parse_release(item));
                    return true;
                  });
    return releases;
  });
}

std::optional<Release> GitHubClient::get_release(const std::string &owner,
                                                 const std::string &repo,
                                                 std::int64_t release_id) {
  return guarded("get_release", std::optional<Release>{}, [&] {
    auto j = get_json(url(repo_path(owner, repo) + "/releases/" +
                          std::to_string(release_id)));
    return j ? std::optional<Release>(parse_release(*j)) : std::nullopt;
  });
}

std::optional<Release>
GitHubClient::get_latest_release(const std::string &owner,
                                 const std::string &repo) {
  return guarded("get_latest_release", std::optional<Release>{}, [&] {
    auto j = get_json(url(repo_path(owner, repo) + "/releases/latest"));
    return j ? std::optional<Release>(parse_release(*j)) : std::nullopt;
  });
}

std::optional<Release>
GitHubClient::get_release_by_tag(const std::string &owner,
                                 const std::string &repo,
                                 const std::string &tag) {
  return guarded("get_release_by_tag", std::optional<Release>{}, [&] {
    auto j = get_json(
        url(repo_path(owner, repo) + "/releases/tags/" + url_encode(tag)));
    return j ? std::optional<Release>(parse_release(*j)) : std::nullopt;
  });
}

bool GitHubClient::download_asset(const std::string &owner,
                                  const std::string &repo,
                                  std::int64_t asset_id,
                                  const std::string &dest_path,
                                  const ProgressCallback &progress) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path parent = fs::path(dest_path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      github_log()->error("Cannot create download directory {}: {}",
                          parent.string(), ec.message());
      return false;
    }
  }
  bool ok = guarded("download_asset", false, [&] {
    enforce_delay();
    auto res = http_->download(url(repo_path(owner, repo) +
                                   "/releases/assets/" +
                                   std::to_string(asset_id)),
                               request_headers("application/octet-stream"),
                               dest_path, progress);
    return expect_status("download_asset", res, {200});
  });
  if (!ok) {
    fs::remove(dest_path, ec);
  } else {
    github_log()->info("Downloaded asset {} to {}", asset_id, dest_path);
  }
  return ok;
}

std::vector<Notification> GitHubClient::get_notifications(bool all,
                                                          bool participating) {
  return guarded("get_notifications", std::vector<Notification>{}, [&] {
    PageOptions options;
    options.per_page = 50;
    std::vector<Notification> notifications;
    for_each_item("/notifications",
                  {{"all", all ? "true" : "false"},
                   {"participating", participating ? "true" : "false"}},
                  options, [&](const nlohmann::json &item) {
                    notifications.push_back(parse_notification(item));
                    return true;
                  });
    return notifications;
  });
}

std::vector<Notification>
GitHubClient::get_repo_notifications(const std::string &owner,
                                     const std::string &repo, bool all) {
  return guarded("get_repo_notifications", std::vector<Notification>{}, [&] {
    PageOptions options;
    options.per_page = 50;
    std::vector<Notification> notifications;
    for_each_item(repo_path(owner, repo) + "/notifications",
                  {{"all", all ? "true" : "false"}}, options,
                  [&](const nlohmann::json &item) {
                    notifications.push_back(parse_notification(item));
                    return true;
                  });
    return notifications;
  });
}

bool GitHubClient::mark_notifications_read(const std::string &last_read_at) {
  return guarded("mark_notifications_read", false, [&] {
    nlohmann::json payload = nlohmann::json::object();
    if (!last_read_at.empty()) {
      payload["last_read_at"] = last_read_at;
    }
    auto res = send_json("PUT", url("/notifications"), payload);
    return expect_status("mark_notifications_read", res, {202, 205});
  });
}

bool GitHubClient::mark_repo_notifications_read(
    const std::string &owner, const std::string &repo,
    const std::string &last_read_at) {
  return guarded("mark_repo_notifications_read", false, [&] {
    nlohmann::json payload = nlohmann::json::object();
    if (!last_read_at.empty()) {
      payload["last_read_at"] = last_read_at;
    }
    auto res = send_json("PUT", url(repo_path(owner, repo) + "/notifications"),
                         payload);
    return expect_status("mark_repo_notifications_read", res, {202, 205});
  });
}

bool GitHubClient::mark_thread_read(const std::string &thread_id) {
  return guarded("mark_thread_read", false, [&] {
    auto res = send("PATCH",
                    url("/notifications/threads/" + url_encode(thread_id)),
                    nullptr, request_headers());
    return expect_status("mark_thread_read", res, {200, 205});
  });
}

bool GitHubClient::mark_thread_done(const std::string &thread_id) {
  return guarded("mark_thread_done", false, [&] {
    auto res = send("DELETE",
                    url("/notifications/threads/" + url_encode(thread_id)),
                    nullptr, request_headers());
    return expect_status("mark_thread_done", res, {204});
  });
}

std::optional<ThreadSubscription>
GitHubClient::get_thread_subscription(const std::string &thread_id) {
  return guarded("get_thread_subscription",
                 std::optional<ThreadSubscription>{}, [&] {
                   auto j = get_json(url("/notifications/threads/" +
                                         url_encode(thread_id) +
                                         "/subscription"));
                   if (!j) {
                     return std::optional<ThreadSubscription>{};
                   }
                   ThreadSubscription sub;
                   sub.subscribed = j->value("subscribed", false);
                   sub.ignored = j->value("ignored", false);
                   if (j->contains("reason") && (*j)["reason"].is_string()) {
                     sub.reason = (*j)["reason"].get<std::string>();
                   }
                   return std::optional<ThreadSubscription>(sub);
                 });
}

bool GitHubClient::subscribe_thread(const std::string &thread_id) {
  return guarded("subscribe_thread", false, [&] {
    auto res = send_json("PUT",
                         url("/notifications/threads/" +
                             url_encode(thread_id) + "/subscription"),
                         {{"subscribed", true}});
    return expect_status("subscribe_thread", res, {200});
  });
}

bool GitHubClient::unsubscribe_thread(const std::string &thread_id) {
  return guarded("unsubscribe_thread", false, [&] {
    auto res = send("DELETE",
                    url("/notifications/threads/" + url_encode(thread_id) +
                        "/subscription"),
                    nullptr, request_headers());
    return expect_status("unsubscribe_thread", res, {204});
  });
}

bool GitHubClient::mute_thread(const std::string &thread_id) {
  return guarded("mute_thread", false, [&] {
    auto res = send_json("PUT",
                         url("/notifications/threads/" +
                             url_encode(thread_id) + "/subscription"),
                         {{"ignored", true}});
    return expect_status("mute_thread", res, {200});
  });
}

std::vector<Event>
GitHubClient::get_received_events(const std::string &username, int max_pages) {
  return guarded("get_received_events", std::vector<Event>{}, [&] {
    PageOptions options;
    options.max_pages = max_pages;
    std::vector<Event> events;
    for_each_item("/users/" + url_encode(username) + "/received_events", {},
                  options, [&](const nlohmann::json &item) {
                    events.push_back(parse_event(item));
                    return true;
                  });
    return events;
  });
}

namespace {

std::vector<Event> parse_events(const std::optional<nlohmann::json> &j) {
  std::vector<Event> events;
  if (j && j->is_array()) {
    for (const auto &item : *j) {
      events.push_back(parse_event(item));
    }
  }
  return events;
}

} // namespace

std::vector<Event> GitHubClient::get_user_events(const std::string &username) {
  return guarded("get_user_events", std::vector<Event>{}, [&] {
    return parse_events(get_json(
        url("/users/" + url_encode(username) + "/events", {{"per_page", "30"}})));
  });
}

std::vector<Event> GitHubClient::get_repo_events(const std::string &owner,
                                                 const std::string &repo) {
  return guarded("get_repo_events", std::vector<Event>{}, [&] {
    return parse_events(
        get_json(url(repo_path(owner, repo) + "/events", {{"per_page", "30"}})));
  });
}

std::vector<Event> GitHubClient::get_org_events(const std::string &org) {
  return guarded("get_org_events", std::vector<Event>{}, [&] {
    return parse_events(get_json(
        url("/orgs/" + url_encode(org) + "/events", {{"per_page", "30"}})));
  });
}

} // namespace fastgh
