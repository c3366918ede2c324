/**
 * @file models.cpp
 * @brief JSON mapping and display formatting for GitHub resources.
 */

#include "models.hpp"
#include "util/time.hpp"

#include <cstdio>
#include <map>

namespace fastgh {

namespace {

using nlohmann::json;

const json &child(const json &j, const char *key) {
  static const json empty = json::object();
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_object()) {
      return *it;
    }
  }
  return empty;
}

std::string str(const json &j, const char *key, const std::string &def = "") {
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return def;
}

std::optional<std::string> opt_str(const json &j, const char *key) {
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return std::nullopt;
}

template <typename T> T num(const json &j, const char *key, T def = T{}) {
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) {
      return it->get<T>();
    }
  }
  return def;
}

bool flag(const json &j, const char *key, bool def = false) {
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean()) {
      return it->get<bool>();
    }
  }
  return def;
}

/// Number fields inside event payloads may be absent; render them as text.
std::string num_text(const json &j, const char *key) {
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) {
      return std::to_string(it->get<std::int64_t>());
    }
  }
  return "";
}

const json &array(const json &j, const char *key) {
  static const json empty = json::array();
  if (j.is_object()) {
    auto it = j.find(key);
    if (it != j.end() && it->is_array()) {
      return *it;
    }
  }
  return empty;
}

std::string truncate(const std::string &text, std::size_t width) {
  return text.size() > width ? text.substr(0, width) : text;
}

const char *run_icon(const std::string &status,
                     const std::optional<std::string> &conclusion) {
  if (status == "completed") {
    const std::string c = conclusion.value_or("");
    if (c == "success") {
      return "+";
    }
    if (c == "failure") {
      return "x";
    }
    if (c == "cancelled" || c == "skipped") {
      return "-";
    }
    return "?";
  }
  if (status == "in_progress") {
    return "*";
  }
  if (status == "queued") {
    return "o";
  }
  return "?";
}

void replace_all(std::string &text, const std::string &from,
                 const std::string &to) {
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

User parse_user(const json &j) {
  User u;
  if (!j.is_object()) {
    return u;
  }
  u.login = str(j, "login", "unknown");
  u.id = num<std::int64_t>(j, "id");
  u.avatar_url = str(j, "avatar_url");
  return u;
}

Label parse_label(const json &j) {
  return {str(j, "name"), str(j, "color"), str(j, "description")};
}

Comment parse_comment(const json &j) {
  Comment c;
  c.id = num<std::int64_t>(j, "id");
  c.body = str(j, "body");
  c.user = parse_user(child(j, "user"));
  c.created_at = str(j, "created_at");
  c.updated_at = str(j, "updated_at");
  c.html_url = str(j, "html_url");
  return c;
}

Issue parse_issue(const json &j) {
  Issue i;
  i.id = num<std::int64_t>(j, "id");
  i.number = num<int>(j, "number");
  i.title = str(j, "title");
  i.body = opt_str(j, "body");
  i.state = str(j, "state", "open");
  i.user = parse_user(child(j, "user"));
  for (const auto &l : array(j, "labels")) {
    i.labels.push_back(parse_label(l));
  }
  for (const auto &a : array(j, "assignees")) {
    i.assignees.push_back(parse_user(a));
  }
  i.comments_count = num<int>(j, "comments");
  i.created_at = str(j, "created_at");
  i.updated_at = str(j, "updated_at");
  i.closed_at = str(j, "closed_at");
  i.html_url = str(j, "html_url");
  i.is_pull_request = j.is_object() && j.contains("pull_request");
  return i;
}

std::string Issue::display() const {
  std::string out = "#" + std::to_string(number) +
                    (state == "open" ? " [Open] " : " [Closed] ") + title;
  if (!labels.empty()) {
    out += " [";
    for (std::size_t i = 0; i < labels.size(); ++i) {
      out += (i ? ", " : "") + labels[i].name;
    }
    out += "]";
  }
  return out + " - by " + user.login;
}

PullRequest parse_pull_request(const json &j) {
  PullRequest pr;
  pr.id = num<std::int64_t>(j, "id");
  pr.number = num<int>(j, "number");
  pr.title = str(j, "title");
  pr.body = opt_str(j, "body");
  pr.state = str(j, "state", "open");
  pr.user = parse_user(child(j, "user"));
  for (const auto &l : array(j, "labels")) {
    pr.labels.push_back(parse_label(l));
  }
  for (const auto &a : array(j, "assignees")) {
    pr.assignees.push_back(parse_user(a));
  }
  pr.head_ref = str(child(j, "head"), "ref");
  pr.base_ref = str(child(j, "base"), "ref");
  pr.merged = flag(j, "merged");
  if (j.contains("mergeable") && j["mergeable"].is_boolean()) {
    pr.mergeable = j["mergeable"].get<bool>();
  }
  pr.mergeable_state = opt_str(j, "mergeable_state");
  if (j.contains("merged_by") && j["merged_by"].is_object()) {
    pr.merged_by = parse_user(j["merged_by"]);
  }
  pr.merged_at = str(j, "merged_at");
  pr.comments_count = num<int>(j, "comments");
  pr.commits_count = num<int>(j, "commits");
  pr.additions = num<int>(j, "additions");
  pr.deletions = num<int>(j, "deletions");
  pr.changed_files = num<int>(j, "changed_files");
  pr.created_at = str(j, "created_at");
  pr.updated_at = str(j, "updated_at");
  pr.closed_at = str(j, "closed_at");
  pr.html_url = str(j, "html_url");
  pr.draft = flag(j, "draft");
  return pr;
}

std::string PullRequest::display() const {
  std::string marker;
  if (merged) {
    marker = "[Merged]";
  } else if (state == "open") {
    marker = draft ? "[Draft]" : "[Open]";
  } else {
    marker = "[Closed]";
  }
  return "#" + std::to_string(number) + " " + marker + " " + title + " (" +
         head_ref + " -> " + base_ref + ") - by " + user.login;
}

Repository parse_repository(const json &j) {
  Repository r;
  r.id = num<std::int64_t>(j, "id");
  r.name = str(j, "name");
  r.full_name = str(j, "full_name");
  r.description = opt_str(j, "description");
  r.owner = str(child(j, "owner"), "login");
  r.stars = num<int>(j, "stargazers_count");
  r.forks = num<int>(j, "forks_count");
  r.open_issues = num<int>(j, "open_issues_count");
  r.language = opt_str(j, "language");
  r.updated_at = str(j, "updated_at");
  r.pushed_at = str(j, "pushed_at");
  r.url = str(j, "url");
  r.html_url = str(j, "html_url");
  r.is_private = flag(j, "private");
  return r;
}

std::string Repository::single_line() const {
  const std::string pushed =
      pushed_at.empty() ? "Unknown" : format_timestamp(pushed_at);
  return full_name + " | " + std::to_string(stars) + " stars | " +
         language.value_or("Unknown") + " | Pushed " + pushed;
}

std::string Repository::render(const std::string &tmpl,
                               std::time_t now) const {
  const std::map<std::string, std::string> values = {
      {"name", name},
      {"full_name", full_name},
      {"description", description.value_or("No description")},
      {"owner", owner},
      {"stars", std::to_string(stars)},
      {"forks", std::to_string(forks)},
      {"open_issues", std::to_string(open_issues)},
      {"language", language.value_or("Unknown")},
      {"updated_at", format_relative_time(updated_at, now)},
      {"pushed_at", format_relative_time(pushed_at, now)},
      {"html_url", html_url},
      {"private", is_private ? "private" : "public"}};
  std::string out = tmpl;
  for (const auto &[key, value] : values) {
    replace_all(out, "$" + key + "$", value);
  }
  return out;
}

CommitAuthor parse_commit_author(const json &j) {
  CommitAuthor a;
  if (!j.is_object()) {
    return a;
  }
  a.name = str(j, "name", "unknown");
  a.email = str(j, "email");
  a.date = str(j, "date");
  return a;
}

CommitFile parse_commit_file(const json &j) {
  CommitFile f;
  f.filename = str(j, "filename");
  f.status = str(j, "status", "modified");
  f.additions = num<int>(j, "additions");
  f.deletions = num<int>(j, "deletions");
  f.changes = num<int>(j, "changes");
  f.previous_filename = opt_str(j, "previous_filename");
  return f;
}

std::string CommitFile::display() const {
  static const std::map<std::string, std::string> icons = {
      {"added", "[A]"},   {"removed", "[D]"}, {"modified", "[M]"},
      {"renamed", "[R]"}, {"copied", "[C]"},  {"changed", "[M]"},
      {"unchanged", "[ ]"}};
  auto it = icons.find(status);
  const std::string icon = it != icons.end() ? it->second : "[?]";
  const std::string stats =
      "(+" + std::to_string(additions) + " -" + std::to_string(deletions) + ")";
  if (status == "renamed" && previous_filename) {
    return icon + " " + *previous_filename + " -> " + filename + " " + stats;
  }
  return icon + " " + filename + " " + stats;
}

Commit parse_commit(const json &j) {
  Commit c;
  const json &detail = child(j, "commit");
  c.sha = str(j, "sha");
  c.message = str(detail, "message");
  c.author = parse_commit_author(child(detail, "author"));
  c.committer = parse_commit_author(child(detail, "committer"));
  if (j.contains("author") && j["author"].is_object()) {
    c.github_author = parse_user(j["author"]);
  }
  if (j.contains("committer") && j["committer"].is_object()) {
    c.github_committer = parse_user(j["committer"]);
  }
  c.html_url = str(j, "html_url");
  for (const auto &p : array(j, "parents")) {
    c.parents.push_back(str(p, "sha"));
  }
  const json &stats = child(j, "stats");
  c.stats_additions = num<int>(stats, "additions");
  c.stats_deletions = num<int>(stats, "deletions");
  c.stats_total = num<int>(stats, "total");
  for (const auto &f : array(j, "files")) {
    c.files.push_back(parse_commit_file(f));
  }
  return c;
}

std::string Commit::first_line() const {
  return message.substr(0, message.find('\n'));
}

std::string Commit::display(std::time_t now) const {
  const std::string who = github_author ? github_author->login : author.name;
  const std::string when =
      author.date.empty() ? "Unknown" : format_relative_time(author.date, now);
  return first_line() + " - " + who + ", " + when + " [" + short_sha() + "]";
}

Branch parse_branch(const json &j) {
  Branch b;
  b.name = str(j, "name");
  b.sha = str(child(j, "commit"), "sha");
  b.is_protected = flag(j, "protected");
  return b;
}

UserProfile parse_user_profile(const json &j) {
  UserProfile p;
  p.id = num<std::int64_t>(j, "id");
  p.login = str(j, "login");
  p.name = opt_str(j, "name");
  p.avatar_url = str(j, "avatar_url");
  p.html_url = str(j, "html_url");
  p.bio = opt_str(j, "bio");
  p.company = opt_str(j, "company");
  p.location = opt_str(j, "location");
  p.email = opt_str(j, "email");
  p.blog = opt_str(j, "blog");
  p.twitter_username = opt_str(j, "twitter_username");
  p.public_repos = num<int>(j, "public_repos");
  p.public_gists = num<int>(j, "public_gists");
  p.followers = num<int>(j, "followers");
  p.following = num<int>(j, "following");
  p.created_at = str(j, "created_at");
  p.updated_at = str(j, "updated_at");
  p.type = str(j, "type", "User");
  return p;
}

std::string UserProfile::display() const {
  std::string out = login;
  if (name) {
    out += " (" + *name + ")";
  }
  if (bio && !bio->empty()) {
    std::string preview = truncate(*bio, 50);
    for (auto &ch : preview) {
      if (ch == '\n') {
        ch = ' ';
      }
    }
    out += " - " + preview + (bio->size() > 50 ? "..." : "");
  }
  return out;
}

ContentItem parse_content_item(const json &j) {
  ContentItem c;
  c.name = str(j, "name");
  c.path = str(j, "path");
  c.sha = str(j, "sha");
  c.size = num<std::int64_t>(j, "size");
  c.type = str(j, "type", "file");
  c.download_url = opt_str(j, "download_url");
  c.html_url = str(j, "html_url");
  return c;
}

Workflow parse_workflow(const json &j) {
  Workflow w;
  w.id = num<std::int64_t>(j, "id");
  w.name = str(j, "name");
  w.path = str(j, "path");
  w.state = str(j, "state");
  w.html_url = str(j, "html_url");
  w.badge_url = str(j, "badge_url");
  w.created_at = str(j, "created_at");
  w.updated_at = str(j, "updated_at");
  return w;
}

WorkflowRun parse_workflow_run(const json &j) {
  WorkflowRun r;
  r.id = num<std::int64_t>(j, "id");
  r.name = str(j, "name");
  r.workflow_id = num<std::int64_t>(j, "workflow_id");
  r.head_branch = str(j, "head_branch");
  r.head_sha = str(j, "head_sha").substr(0, 7);
  r.status = str(j, "status");
  r.conclusion = opt_str(j, "conclusion");
  r.event = str(j, "event");
  r.run_number = num<int>(j, "run_number");
  r.run_attempt = num<int>(j, "run_attempt", 1);
  r.html_url = str(j, "html_url");
  r.created_at = str(j, "created_at");
  r.updated_at = str(j, "updated_at");
  r.run_started_at = str(j, "run_started_at");
  r.actor_login = str(child(j, "actor"), "login");
  r.actor_avatar_url = str(child(j, "actor"), "avatar_url");
  r.triggering_actor_login = str(child(j, "triggering_actor"), "login");
  return r;
}

std::string WorkflowRun::status_text() const {
  if (status == "completed") {
    return conclusion.value_or("completed");
  }
  std::string text = status;
  for (auto &ch : text) {
    if (ch == '_') {
      ch = ' ';
    }
  }
  return text;
}

std::string WorkflowRun::display(std::time_t now) const {
  std::string out = std::string(run_icon(status, conclusion)) + " " + name +
                    " #" + std::to_string(run_number) + " - " + head_branch +
                    " (" + event + ")";
  if (!created_at.empty()) {
    out += " - " + format_relative_time(created_at, now, RelativeStyle::Short);
  }
  return out;
}

WorkflowJob parse_workflow_job(const json &j) {
  WorkflowJob job;
  job.id = num<std::int64_t>(j, "id");
  job.run_id = num<std::int64_t>(j, "run_id");
  job.name = str(j, "name");
  job.status = str(j, "status");
  job.conclusion = opt_str(j, "conclusion");
  job.started_at = str(j, "started_at");
  job.completed_at = str(j, "completed_at");
  job.html_url = str(j, "html_url");
  job.runner_name = opt_str(j, "runner_name");
  for (const auto &s : array(j, "steps")) {
    job.steps.push_back({str(s, "name"), str(s, "status"),
                         opt_str(s, "conclusion"), num<int>(s, "number")});
  }
  return job;
}

std::string WorkflowJob::duration(std::time_t now) const {
  auto start = parse_iso8601(started_at);
  if (!start) {
    return "";
  }
  auto end = parse_iso8601(completed_at).value_or(now);
  long seconds = static_cast<long>(end - *start);
  if (seconds < 0) {
    seconds = 0;
  }
  if (seconds < 60) {
    return std::to_string(seconds) + "s";
  }
  if (seconds < 3600) {
    return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) +
           "s";
  }
  return std::to_string(seconds / 3600) + "h " +
         std::to_string((seconds % 3600) / 60) + "m";
}

std::string WorkflowJob::display(std::time_t now) const {
  std::string out = std::string(run_icon(status, conclusion)) + " " + name;
  const std::string d = duration(now);
  return d.empty() ? out : out + " (" + d + ")";
}

std::string format_byte_size(std::int64_t size) {
  char buf[32];
  if (size < 1024) {
    return std::to_string(size) + " B";
  }
  if (size < 1024 * 1024) {
    std::snprintf(buf, sizeof(buf), "%.1f KB", size / 1024.0);
  } else if (size < 1024LL * 1024 * 1024) {
    std::snprintf(buf, sizeof(buf), "%.1f MB", size / (1024.0 * 1024));
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f GB",
                  size / (1024.0 * 1024 * 1024));
  }
  return buf;
}

ReleaseAsset parse_release_asset(const json &j) {
  ReleaseAsset a;
  a.id = num<std::int64_t>(j, "id");
  a.name = str(j, "name");
  a.label = opt_str(j, "label");
  a.content_type = str(j, "content_type");
  a.size = num<std::int64_t>(j, "size");
  a.download_count = num<int>(j, "download_count");
  a.browser_download_url = str(j, "browser_download_url");
  a.created_at = str(j, "created_at");
  a.updated_at = str(j, "updated_at");
  return a;
}

std::string ReleaseAsset::format_size() const { return format_byte_size(size); }

std::string ReleaseAsset::display() const {
  const std::string downloads =
      download_count == 1 ? "1 download"
                          : std::to_string(download_count) + " downloads";
  return name + " (" + format_size() + ", " + downloads + ")";
}

Release parse_release(const json &j) {
  Release r;
  r.id = num<std::int64_t>(j, "id");
  r.tag_name = str(j, "tag_name");
  r.name = str(j, "name");
  if (r.name.empty()) {
    r.name = r.tag_name;
  }
  r.body = str(j, "body");
  r.draft = flag(j, "draft");
  r.prerelease = flag(j, "prerelease");
  r.created_at = str(j, "created_at");
  r.published_at = str(j, "published_at");
  r.html_url = str(j, "html_url");
  r.tarball_url = str(j, "tarball_url");
  r.zipball_url = str(j, "zipball_url");
  r.author_login = str(child(j, "author"), "login");
  for (const auto &a : array(j, "assets")) {
    r.assets.push_back(parse_release_asset(a));
  }
  return r;
}

std::string Release::status_label() const {
  if (draft && prerelease) {
    return "Draft, Pre-release";
  }
  if (draft) {
    return "Draft";
  }
  return prerelease ? "Pre-release" : "Release";
}

std::string Release::display() const {
  const std::string assets_text =
      assets.size() == 1 ? "1 asset"
                         : std::to_string(assets.size()) + " assets";
  const std::string &when = published_at.empty() ? created_at : published_at;
  std::string out = tag_name;
  if (name != tag_name) {
    out += ": " + name;
  }
  out += " - " + status_label() + " (" + assets_text + ")";
  if (!when.empty()) {
    out += " - " + format_timestamp(when, "%Y-%m-%d");
  }
  return out;
}

Notification parse_notification(const json &j) {
  Notification n;
  n.id = str(j, "id");
  n.unread = flag(j, "unread");
  n.reason = str(j, "reason");
  const json &subject = child(j, "subject");
  n.subject.title = str(subject, "title");
  n.subject.url = str(subject, "url");
  n.subject.type = str(subject, "type");
  n.subject.latest_comment_url = opt_str(subject, "latest_comment_url");
  const json &repo = child(j, "repository");
  n.repository_full_name = str(repo, "full_name");
  n.repository_owner = str(child(repo, "owner"), "login");
  n.repository_name = str(repo, "name");
  n.updated_at = str(j, "updated_at");
  n.last_read_at = str(j, "last_read_at");
  n.url = str(j, "url");
  return n;
}

std::string Notification::reason_text() const {
  static const std::map<std::string, std::string> reasons = {
      {"assign", "You were assigned"},
      {"author", "You created the thread"},
      {"comment", "You commented"},
      {"ci_activity", "CI activity"},
      {"invitation", "You were invited"},
      {"manual", "You subscribed manually"},
      {"mention", "You were @mentioned"},
      {"review_requested", "Review requested"},
      {"security_alert", "Security alert"},
      {"state_change", "State changed"},
      {"subscribed", "You're watching the repo"},
      {"team_mention", "Your team was @mentioned"}};
  auto it = reasons.find(reason);
  return it != reasons.end() ? it->second : reason;
}

std::string Notification::type_label() const {
  static const std::map<std::string, std::string> labels = {
      {"Issue", "Issue"},
      {"PullRequest", "PR"},
      {"Commit", "Commit"},
      {"Release", "Release"},
      {"Discussion", "Disc"},
      {"RepositoryVulnerabilityAlert", "Security"}};
  auto it = labels.find(subject.type);
  return it != labels.end() ? it->second : subject.type;
}

std::string Notification::web_url() const {
  if (subject.url.empty()) {
    return "https://github.com/" + repository_full_name;
  }
  std::string out = subject.url;
  replace_all(out, "api.github.com/repos", "github.com");
  replace_all(out, "/pulls/", "/pull/");
  return out;
}

std::string Notification::display(std::time_t now) const {
  return std::string(unread ? "* " : "  ") + "[" + type_label() + "] " +
         subject.title + " - " + repository_full_name + " (" + reason_text() +
         ") - " + format_relative_time(updated_at, now, RelativeStyle::Short);
}

Event parse_event(const json &j) {
  Event e;
  e.id = str(j, "id");
  e.type = str(j, "type");
  const json &actor = child(j, "actor");
  e.actor = {num<std::int64_t>(actor, "id"), str(actor, "login"),
             str(actor, "avatar_url")};
  const json &repo = child(j, "repo");
  e.repo = {num<std::int64_t>(repo, "id"), str(repo, "name"),
            str(repo, "url")};
  e.payload = child(j, "payload");
  e.is_public = flag(j, "public", true);
  e.created_at = str(j, "created_at");
  return e;
}

std::string Event::action_description() const {
  const json &p = payload;
  if (type == "WatchEvent") {
    return "starred";
  }
  if (type == "ForkEvent") {
    const std::string fork = str(child(p, "forkee"), "full_name");
    return fork.empty() ? "forked" : "forked to " + fork;
  }
  if (type == "CreateEvent") {
    const std::string ref_type = str(p, "ref_type");
    const std::string ref = str(p, "ref");
    if (ref_type == "repository") {
      return "created repository";
    }
    if (ref_type == "branch" || ref_type == "tag") {
      return "created " + ref_type + " " + ref;
    }
    return "created " + ref_type;
  }
  if (type == "DeleteEvent") {
    return "deleted " + str(p, "ref_type") + " " + str(p, "ref");
  }
  if (type == "PushEvent") {
    std::int64_t size = num<std::int64_t>(p, "size");
    if (size == 0) {
      size = num<std::int64_t>(p, "distinct_size");
    }
    if (size == 0) {
      size = static_cast<std::int64_t>(array(p, "commits").size());
    }
    std::string ref = str(p, "ref");
    replace_all(ref, "refs/heads/", "");
    if (size == 0) {
      return "force pushed to " + ref;
    }
    if (size == 1) {
      return "pushed 1 commit to " + ref;
    }
    return "pushed " + std::to_string(size) + " commits to " + ref;
  }
  if (type == "IssuesEvent") {
    const json &issue = child(p, "issue");
    return str(p, "action") + " issue #" + num_text(issue, "number") + ": " +
           truncate(str(issue, "title"), 50);
  }
  if (type == "IssueCommentEvent") {
    return "commented on issue #" + num_text(child(p, "issue"), "number");
  }
  if (type == "PullRequestEvent") {
    const json &pr = child(p, "pull_request");
    const std::string action = str(p, "action");
    const std::string number = num_text(pr, "number");
    const std::string title = truncate(str(pr, "title"), 50);
    if (action == "opened") {
      return "opened PR #" + number + ": " + title;
    }
    if (action == "closed") {
      return (flag(pr, "merged") ? "merged PR #" : "closed PR #") + number +
             ": " + title;
    }
    return action + " PR #" + number;
  }
  if (type == "PullRequestReviewEvent") {
    const std::string number = num_text(child(p, "pull_request"), "number");
    const std::string state = str(child(p, "review"), "state");
    if (state == "approved") {
      return "approved PR #" + number;
    }
    if (state == "changes_requested") {
      return "requested changes on PR #" + number;
    }
    return "reviewed PR #" + number;
  }
  if (type == "PullRequestReviewCommentEvent") {
    return "commented on PR #" + num_text(child(p, "pull_request"), "number");
  }
  if (type == "ReleaseEvent") {
    const std::string action = str(p, "action");
    const std::string tag = str(child(p, "release"), "tag_name");
    return action == "published" ? "released " + tag
                                 : action + " release " + tag;
  }
  if (type == "CommitCommentEvent") {
    return "commented on a commit";
  }
  if (type == "GollumEvent") {
    const json &pages = array(p, "pages");
    if (pages.empty()) {
      return "updated wiki";
    }
    return str(pages[0], "action", "updated") + " wiki page: " +
           str(pages[0], "title");
  }
  if (type == "MemberEvent") {
    return str(p, "action") + " " + str(child(p, "member"), "login") +
           " as collaborator";
  }
  if (type == "PublicEvent") {
    return "made repository public";
  }
  static const std::map<std::string, std::string> fallback = {
      {"IssuesEvent", "issue"},
      {"MemberEvent", "added member"},
      {"PullRequestEvent", "pull request"},
      {"SponsorshipEvent", "sponsorship"}};
  auto it = fallback.find(type);
  return it != fallback.end() ? it->second : type;
}

std::string Event::web_url() const {
  const std::string base = "https://github.com/" + repo.name;
  const json &p = payload;
  if (type == "IssuesEvent") {
    const std::string number = num_text(child(p, "issue"), "number");
    if (!number.empty()) {
      return base + "/issues/" + number;
    }
  } else if (type == "IssueCommentEvent") {
    const std::string html = str(child(p, "comment"), "html_url");
    if (!html.empty()) {
      return html;
    }
    const std::string number = num_text(child(p, "issue"), "number");
    if (!number.empty()) {
      return base + "/issues/" + number;
    }
  } else if (type == "PullRequestEvent" || type == "PullRequestReviewEvent" ||
             type == "PullRequestReviewCommentEvent") {
    const std::string number = num_text(child(p, "pull_request"), "number");
    if (!number.empty()) {
      return base + "/pull/" + number;
    }
  } else if (type == "PushEvent") {
    const std::string before = str(p, "before").substr(0, 7);
    const std::string head = str(p, "head").substr(0, 7);
    if (!before.empty() && !head.empty()) {
      return base + "/compare/" + before + "..." + head;
    }
  } else if (type == "ReleaseEvent" || type == "ForkEvent" ||
             type == "CommitCommentEvent") {
    const char *key = type == "ReleaseEvent" ? "release"
                      : type == "ForkEvent"  ? "forkee"
                                             : "comment";
    const std::string html = str(child(p, key), "html_url");
    if (!html.empty()) {
      return html;
    }
  } else if (type == "CreateEvent") {
    const std::string ref_type = str(p, "ref_type");
    const std::string ref = str(p, "ref");
    if (ref_type == "branch" && !ref.empty()) {
      return base + "/tree/" + ref;
    }
    if (ref_type == "tag" && !ref.empty()) {
      return base + "/releases/tag/" + ref;
    }
  }
  return base;
}

std::string Event::display(std::time_t now) const {
  return actor.login + " " + action_description() + " in " + repo.name +
         " - " + format_relative_time(created_at, now, RelativeStyle::Short);
}

} // namespace fastgh
