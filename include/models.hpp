/**
 * @file models.hpp
 * @brief Value types for GitHub REST API resources.
 *
 * Each record is built from one JSON object returned by the API through the
 * matching `parse_*` function. Timestamps keep the ISO-8601 text reported by
 * GitHub; an empty string means the field was absent or null.
 */

#ifndef FASTGH_MODELS_HPP
#define FASTGH_MODELS_HPP

#include <cstdint>
#include <ctime>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fastgh {

/** Minimal account reference embedded in other resources. */
struct User {
  std::string login = "unknown"; ///< Account login
  std::int64_t id = 0;           ///< Numeric account id
  std::string avatar_url;        ///< Avatar image URL
};

/** Issue or pull request label. */
struct Label {
  std::string name;
  std::string color;
  std::string description;
};

/** Comment on an issue or pull request. */
struct Comment {
  std::int64_t id = 0;
  std::string body;
  User user;
  std::string created_at;
  std::string updated_at;
  std::string html_url;
};

/** GitHub issue. Pull requests listed through the issues API are flagged. */
struct Issue {
  std::int64_t id = 0;
  int number = 0;
  std::string title;
  std::optional<std::string> body;
  std::string state = "open"; ///< "open" or "closed"
  User user;
  std::vector<Label> labels;
  std::vector<User> assignees;
  int comments_count = 0;
  std::string created_at;
  std::string updated_at;
  std::string closed_at;
  std::string html_url;
  bool is_pull_request = false;

  /// "#12 [Open] Title [bug, ui] - by login".
  std::string display() const;
};

/** GitHub pull request. */
struct PullRequest {
  std::int64_t id = 0;
  int number = 0;
  std::string title;
  std::optional<std::string> body;
  std::string state = "open";
  User user;
  std::vector<Label> labels;
  std::vector<User> assignees;
  std::string head_ref; ///< Source branch
  std::string base_ref; ///< Target branch
  bool merged = false;
  std::optional<bool> mergeable;
  std::optional<std::string> mergeable_state;
  std::optional<User> merged_by;
  std::string merged_at;
  int comments_count = 0;
  int commits_count = 0;
  int additions = 0;
  int deletions = 0;
  int changed_files = 0;
  std::string created_at;
  std::string updated_at;
  std::string closed_at;
  std::string html_url;
  bool draft = false;

  /// "#3 [Merged] Title (feature -> main) - by login".
  std::string display() const;
};

/** GitHub repository. */
struct Repository {
  std::int64_t id = 0;
  std::string name;
  std::string full_name; ///< "owner/name"
  std::optional<std::string> description;
  std::string owner;
  int stars = 0;
  int forks = 0;
  int open_issues = 0;
  std::optional<std::string> language;
  std::string updated_at;
  std::string pushed_at;
  std::string url;
  std::string html_url;
  bool is_private = false;

  /// "owner/name | 5 stars | C++ | Pushed 2024-01-02 03:04".
  std::string single_line() const;

  /**
   * Render a display template.
   *
   * Placeholders are `$name$` for name, full_name, description, owner,
   * stars, forks, open_issues, language, updated_at, pushed_at, html_url
   * and private. Timestamps render as relative time against @p now.
   */
  std::string render(const std::string &tmpl, std::time_t now) const;
};

/** Git author or committer identity of a commit. */
struct CommitAuthor {
  std::string name = "unknown";
  std::string email;
  std::string date;
};

/** File touched by a commit. */
struct CommitFile {
  std::string filename;
  std::string status = "modified"; ///< added, removed, modified, renamed...
  int additions = 0;
  int deletions = 0;
  int changes = 0;
  std::optional<std::string> previous_filename;

  /// "[M] src/a.cpp (+3 -1)" or "[R] old -> new (+0 -0)".
  std::string display() const;
};

/** Commit with optional file list (single commit fetches only). */
struct Commit {
  std::string sha;
  std::string message;
  CommitAuthor author;
  CommitAuthor committer;
  std::optional<User> github_author;
  std::optional<User> github_committer;
  std::string html_url;
  std::vector<std::string> parents;
  int stats_additions = 0;
  int stats_deletions = 0;
  int stats_total = 0;
  std::vector<CommitFile> files;

  std::string short_sha() const { return sha.substr(0, 7); }
  std::string first_line() const;
  /// "Fix bug - login, 2 days ago [abc1234]".
  std::string display(std::time_t now) const;
};

/** Branch with the date of its head commit. */
struct Branch {
  std::string name;
  std::string sha;
  bool is_protected = false;
  std::string last_commit_date; ///< Committer date of the head commit
};

/** Full user or organisation profile. */
struct UserProfile {
  std::int64_t id = 0;
  std::string login;
  std::optional<std::string> name;
  std::string avatar_url;
  std::string html_url;
  std::optional<std::string> bio;
  std::optional<std::string> company;
  std::optional<std::string> location;
  std::optional<std::string> email;
  std::optional<std::string> blog;
  std::optional<std::string> twitter_username;
  int public_repos = 0;
  int public_gists = 0;
  int followers = 0;
  int following = 0;
  std::string created_at;
  std::string updated_at;
  std::string type = "User"; ///< "User" or "Organization"

  /// Name when set, otherwise the login.
  std::string display_name() const { return name ? *name : login; }
  /// "login (Name) - bio preview".
  std::string display() const;
};

/** File or directory entry from the contents API. */
struct ContentItem {
  std::string name;
  std::string path;
  std::string sha;
  std::int64_t size = 0;
  std::string type = "file"; ///< file, dir, symlink or submodule
  std::optional<std::string> download_url;
  std::string html_url;
};

/** GitHub Actions workflow definition. */
struct Workflow {
  std::int64_t id = 0;
  std::string name;
  std::string path;
  std::string state;
  std::string html_url;
  std::string badge_url;
  std::string created_at;
  std::string updated_at;
};

/** Single execution of a workflow. */
struct WorkflowRun {
  std::int64_t id = 0;
  std::string name;
  std::int64_t workflow_id = 0;
  std::string head_branch;
  std::string head_sha; ///< Abbreviated to seven characters
  std::string status;   ///< queued, in_progress or completed
  std::optional<std::string> conclusion;
  std::string event;
  int run_number = 0;
  int run_attempt = 1;
  std::string html_url;
  std::string created_at;
  std::string updated_at;
  std::string run_started_at;
  std::string actor_login;
  std::string actor_avatar_url;
  std::string triggering_actor_login;

  /// Conclusion of completed runs, otherwise the status with spaces.
  std::string status_text() const;
  std::string display(std::time_t now) const;
};

/** Step of a workflow job. */
struct WorkflowStep {
  std::string name;
  std::string status;
  std::optional<std::string> conclusion;
  int number = 0;
};

/** Job belonging to a workflow run. */
struct WorkflowJob {
  std::int64_t id = 0;
  std::int64_t run_id = 0;
  std::string name;
  std::string status;
  std::optional<std::string> conclusion;
  std::string started_at;
  std::string completed_at;
  std::string html_url;
  std::optional<std::string> runner_name;
  std::vector<WorkflowStep> steps;

  /// "42s", "3m 5s" or "1h 2m"; empty when the job has not started.
  std::string duration(std::time_t now) const;
  std::string display(std::time_t now) const;
};

/** Downloadable file attached to a release. */
struct ReleaseAsset {
  std::int64_t id = 0;
  std::string name;
  std::optional<std::string> label;
  std::string content_type;
  std::int64_t size = 0;
  int download_count = 0;
  std::string browser_download_url;
  std::string created_at;
  std::string updated_at;

  std::string format_size() const;
  /// "tool.zip (1.5 MB, 3 downloads)".
  std::string display() const;
};

/** GitHub release. */
struct Release {
  std::int64_t id = 0;
  std::string tag_name;
  std::string name; ///< Falls back to the tag name
  std::string body;
  bool draft = false;
  bool prerelease = false;
  std::string created_at;
  std::string published_at;
  std::string html_url;
  std::string tarball_url;
  std::string zipball_url;
  std::string author_login;
  std::vector<ReleaseAsset> assets;

  /// "Draft, Pre-release", "Draft", "Pre-release" or "Release".
  std::string status_label() const;
  std::string display() const;
};

/** Subject of a notification thread. */
struct NotificationSubject {
  std::string title;
  std::string url;
  std::string type; ///< Issue, PullRequest, Commit, Release...
  std::optional<std::string> latest_comment_url;
};

/** Notification thread from the notifications API. */
struct Notification {
  std::string id;
  bool unread = false;
  std::string reason;
  NotificationSubject subject;
  std::string repository_full_name;
  std::string repository_owner;
  std::string repository_name;
  std::string updated_at;
  std::string last_read_at;
  std::string url;

  /// Human readable reason, or the raw reason when unknown.
  std::string reason_text() const;
  /// Short label of the subject type.
  std::string type_label() const;
  /// Browser URL of the subject.
  std::string web_url() const;
  std::string display(std::time_t now) const;
};

/** Account that triggered an event. */
struct EventActor {
  std::int64_t id = 0;
  std::string login;
  std::string avatar_url;
};

/** Repository an event belongs to. */
struct EventRepo {
  std::int64_t id = 0;
  std::string name; ///< "owner/name"
  std::string url;
};

/** Activity feed event. */
struct Event {
  std::string id;
  std::string type;
  EventActor actor;
  EventRepo repo;
  nlohmann::json payload = nlohmann::json::object();
  bool is_public = true;
  std::string created_at;

  /// Sentence fragment describing what the actor did.
  std::string action_description() const;
  /// Browser URL most specific to the event.
  std::string web_url() const;
  /// "login pushed 2 commits to main in owner/repo - 3h ago".
  std::string display(std::time_t now) const;
};

/// Kind of search performed by GitHubClient::search().
enum class SearchKind { Repositories, Users };

/// One search hit: either a repository or a (basic) user profile.
using SearchResult = std::variant<Repository, UserProfile>;

User parse_user(const nlohmann::json &j);
Label parse_label(const nlohmann::json &j);
Comment parse_comment(const nlohmann::json &j);
Issue parse_issue(const nlohmann::json &j);
PullRequest parse_pull_request(const nlohmann::json &j);
Repository parse_repository(const nlohmann::json &j);
CommitAuthor parse_commit_author(const nlohmann::json &j);
CommitFile parse_commit_file(const nlohmann::json &j);
Commit parse_commit(const nlohmann::json &j);
Branch parse_branch(const nlohmann::json &j);
UserProfile parse_user_profile(const nlohmann::json &j);
ContentItem parse_content_item(const nlohmann::json &j);
Workflow parse_workflow(const nlohmann::json &j);
WorkflowRun parse_workflow_run(const nlohmann::json &j);
WorkflowJob parse_workflow_job(const nlohmann::json &j);
ReleaseAsset parse_release_asset(const nlohmann::json &j);
Release parse_release(const nlohmann::json &j);
Notification parse_notification(const nlohmann::json &j);
Event parse_event(const nlohmann::json &j);

/// Human readable byte count ("512 B", "1.5 KB", "2.0 MB", "1.25 GB").
std::string format_byte_size(std::int64_t size);

} // namespace fastgh

#endif // FASTGH_MODELS_HPP
