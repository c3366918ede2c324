/**
 * @file github_client.hpp
 * @brief Authenticated client for the GitHub REST API.
 *
 * Every public operation converts transport and API failures into a sentinel
 * (`std::nullopt`, an empty vector or `false`) after logging them, so callers
 * never see exceptions. A `false` from a mutating call means no state change
 * was observed.
 */

#ifndef FASTGH_GITHUB_CLIENT_HPP
#define FASTGH_GITHUB_CLIENT_HPP

#include "http_client.hpp"
#include "models.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fastgh {

/// Outcome of verifying an access token against `GET /user`.
enum class CredentialStatus {
  Valid,    ///< Token accepted; profile populated
  Rejected, ///< 401 response; token revoked or expired
  Failed    ///< Any other failure
};

/** Result of GitHubClient::check_credentials(). */
struct CredentialCheck {
  CredentialStatus status = CredentialStatus::Failed;
  std::optional<UserProfile> profile; ///< Authenticated profile when valid
  std::string message;                ///< Failure description
};

/// Merge strategies accepted by the merge endpoint.
enum class MergeMethod { Merge, Squash, Rebase };

/** Optional filters for GitHubClient::get_workflow_runs(). */
struct WorkflowRunFilter {
  std::optional<std::int64_t> workflow_id; ///< Restrict to one workflow
  std::string branch;                      ///< Restrict to one branch
  std::string status;                      ///< queued, completed, ...
  int per_page = 30;
};

/** Subscription state of a notification thread. */
struct ThreadSubscription {
  bool subscribed = false;
  bool ignored = false;
  std::string reason;
};

/**
 * GitHub REST API client bound to one access token.
 *
 * The client is safe for concurrent use from multiple worker threads: the
 * token and rate limit bookkeeping are guarded and requests share no other
 * mutable state.
 */
class GitHubClient {
public:
  /// Query string parameters in request order.
  using Query = std::vector<std::pair<std::string, std::string>>;

  /// Sleep hook used for rate limit waits.
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  /**
   * Construct a client.
   *
   * @param token Access token sent as a Bearer credential.
   * @param http HTTP transport; a retrying CurlHttpClient when null.
   * @param api_base Base URL of the REST API.
   * @param delay_ms Minimum delay between consecutive requests.
   */
  explicit GitHubClient(std::string token,
                        std::unique_ptr<HttpClient> http = nullptr,
                        std::string api_base = "https://api.github.com",
                        int delay_ms = 0);

  /// Replace the access token used for subsequent requests.
  void set_token(const std::string &token);

  /// Whether a non-empty token is configured.
  bool has_token() const;

  /// Base URL of the REST API.
  const std::string &api_base() const { return api_base_; }

  /// Set the minimum delay in milliseconds between requests.
  void set_delay_ms(int delay_ms);

  /// Replace the sleep used while waiting out rate limits.
  void set_sleep_function(SleepFunction sleep);

  /// Upper bound for a single rate limit wait.
  void set_max_rate_limit_wait(std::chrono::seconds wait);

  /// Verify the token by fetching the authenticated user's profile.
  CredentialCheck check_credentials();

  /// @name Users and following
  /// @{
  std::optional<UserProfile> get_user(const std::string &username);
  std::vector<Repository> get_user_repos(const std::string &username);
  std::vector<UserProfile> get_following();
  bool is_following(const std::string &username);
  bool follow_user(const std::string &username);
  bool unfollow_user(const std::string &username);
  /// @}

  /// @name Repositories
  /// @{
  /// Repositories owned by or shared with the user, most recently updated
  /// first.
  std::vector<Repository> get_repos();
  /// Starred repositories sorted by `updated_at` descending.
  std::vector<Repository> get_starred();
  /// Watched repositories sorted by `updated_at` descending.
  std::vector<Repository> get_watched();
  std::optional<Repository> get_repo(const std::string &owner,
                                     const std::string &repo);
  /// "admin", "write" or "read"; `std::nullopt` when unknown.
  std::optional<std::string> get_repo_permission(const std::string &owner,
                                                 const std::string &repo);
  /// `true` for admin or write permission.
  bool can_merge(const std::string &owner, const std::string &repo);
  /// Branches sorted by head commit date, newest first.
  std::vector<Branch> get_branches(const std::string &owner,
                                   const std::string &repo);
  /// Directory listing; a file path yields a single entry.
  std::vector<ContentItem> get_contents(const std::string &owner,
                                        const std::string &repo,
                                        const std::string &path = "",
                                        const std::string &ref = "");
  /// Raw text of a file.
  std::optional<std::string> get_file_text(const std::string &owner,
                                           const std::string &repo,
                                           const std::string &path,
                                           const std::string &ref = "");
  bool is_starred(const std::string &owner, const std::string &repo);
  bool star_repo(const std::string &owner, const std::string &repo);
  bool unstar_repo(const std::string &owner, const std::string &repo);
  bool is_watching(const std::string &owner, const std::string &repo);
  bool watch_repo(const std::string &owner, const std::string &repo);
  bool unwatch_repo(const std::string &owner, const std::string &repo);
  /// @}

  /**
   * Search repositories or users.
   *
   * @param kind What to search for.
   * @param query GitHub search query.
   * @param sort Sort key; "best-match" keeps the API default.
   * @param per_page Number of results (single page).
   */
  std::vector<SearchResult> search(SearchKind kind, const std::string &query,
                                   const std::string &sort = "best-match",
                                   int per_page = 30);

  /// @name Issues
  /// @{
  /// Issues in @p state, excluding pull requests.
  std::vector<Issue> get_issues(const std::string &owner,
                                const std::string &repo,
                                const std::string &state = "open");
  std::optional<Issue> get_issue(const std::string &owner,
                                 const std::string &repo, int number);
  std::optional<Issue> create_issue(const std::string &owner,
                                    const std::string &repo,
                                    const std::string &title,
                                    const std::string &body = "",
                                    const std::vector<std::string> &labels = {});
  std::optional<Issue> update_issue(const std::string &owner,
                                    const std::string &repo, int number,
                                    const std::optional<std::string> &title,
                                    const std::optional<std::string> &body,
                                    const std::optional<std::string> &state);
  bool close_issue(const std::string &owner, const std::string &repo,
                   int number);
  bool reopen_issue(const std::string &owner, const std::string &repo,
                    int number);
  std::vector<Comment> get_issue_comments(const std::string &owner,
                                          const std::string &repo, int number);
  std::optional<Comment> create_issue_comment(const std::string &owner,
                                              const std::string &repo,
                                              int number,
                                              const std::string &body);
  bool delete_comment(const std::string &owner, const std::string &repo,
                      std::int64_t comment_id);
  /// @}

  /// @name Pull requests
  /// @{
  std::vector<PullRequest> get_pull_requests(const std::string &owner,
                                             const std::string &repo,
                                             const std::string &state = "open");
  std::optional<PullRequest> get_pull_request(const std::string &owner,
                                              const std::string &repo,
                                              int number);
  std::optional<PullRequest>
  create_pull_request(const std::string &owner, const std::string &repo,
                      const std::string &title, const std::string &head,
                      const std::string &base, const std::string &body = "",
                      bool draft = false);
  std::optional<PullRequest>
  update_pull_request(const std::string &owner, const std::string &repo,
                      int number, const std::optional<std::string> &title,
                      const std::optional<std::string> &body,
                      const std::optional<std::string> &state);
  /**
   * Merge a pull request.
   *
   * @param error Receives the API message when the merge is refused (for
   *        example because of conflicts).
   */
  bool merge_pull_request(const std::string &owner, const std::string &repo,
                          int number, MergeMethod method = MergeMethod::Merge,
                          const std::string &commit_title = "",
                          const std::string &commit_message = "",
                          std::string *error = nullptr);
  bool close_pull_request(const std::string &owner, const std::string &repo,
                          int number);
  bool reopen_pull_request(const std::string &owner, const std::string &repo,
                           int number);
  /// @}

  /// @name Commits
  /// @{
  /**
   * List commits, newest first.
   *
   * @param branch Branch or SHA to start from; default branch when empty.
   * @param max_commits Stop after this many commits (0 = all).
   */
  std::vector<Commit> get_commits(const std::string &owner,
                                  const std::string &repo,
                                  const std::string &branch = "",
                                  std::size_t max_commits = 0);
  std::optional<Commit> get_commit(const std::string &owner,
                                   const std::string &repo,
                                   const std::string &sha);
  /// @}

  /// @name Actions
  /// @{
  std::vector<Workflow> get_workflows(const std::string &owner,
                                      const std::string &repo);
  std::vector<WorkflowRun> get_workflow_runs(const std::string &owner,
                                             const std::string &repo,
                                             const WorkflowRunFilter &filter = {});
  std::optional<WorkflowRun> get_workflow_run(const std::string &owner,
                                              const std::string &repo,
                                              std::int64_t run_id);
  std::vector<WorkflowJob> get_workflow_run_jobs(const std::string &owner,
                                                 const std::string &repo,
                                                 std::int64_t run_id);
  bool rerun_workflow(const std::string &owner, const std::string &repo,
                      std::int64_t run_id);
  bool rerun_failed_jobs(const std::string &owner, const std::string &repo,
                         std::int64_t run_id);
  bool cancel_workflow_run(const std::string &owner, const std::string &repo,
                           std::int64_t run_id);
  /// Temporary download URL of the run's log archive.
  std::optional<std::string> get_workflow_run_logs_url(const std::string &owner,
                                                       const std::string &repo,
                                                       std::int64_t run_id);
  /// Plain text log of one job.
  std::optional<std::string> get_job_logs(const std::string &owner,
                                          const std::string &repo,
                                          std::int64_t job_id);
  /// @}

  /// @name Releases
  /// @{
  std::vector<Release> get_releases(const std::string &owner,
                                    const std::string &repo);
  std::optional<Release> get_release(const std::string &owner,
                                     const std::string &repo,
                                     std::int64_t release_id);
  std::optional<Release> get_latest_release(const std::string &owner,
                                            const std::string &repo);
  std::optional<Release> get_release_by_tag(const std::string &owner,
                                            const std::string &repo,
                                            const std::string &tag);
  /**
   * Download a release asset.
   *
   * A partially written file is removed on failure.
   */
  bool download_asset(const std::string &owner, const std::string &repo,
                      std::int64_t asset_id, const std::string &dest_path,
                      const ProgressCallback &progress = {});
  /// @}

  /// @name Notifications
  /// @{
  std::vector<Notification> get_notifications(bool all = false,
                                              bool participating = false);
  std::vector<Notification> get_repo_notifications(const std::string &owner,
                                                   const std::string &repo,
                                                   bool all = false);
  bool mark_notifications_read(const std::string &last_read_at = "");
  bool mark_repo_notifications_read(const std::string &owner,
                                    const std::string &repo,
                                    const std::string &last_read_at = "");
  bool mark_thread_read(const std::string &thread_id);
  bool mark_thread_done(const std::string &thread_id);
  std::optional<ThreadSubscription>
  get_thread_subscription(const std::string &thread_id);
  bool subscribe_thread(const std::string &thread_id);
  bool unsubscribe_thread(const std::string &thread_id);
  bool mute_thread(const std::string &thread_id);
  /// @}

  /// @name Events
  /// @{
  /// Feed of events received by @p username (at most @p max_pages pages).
  std::vector<Event> get_received_events(const std::string &username,
                                         int max_pages = 3);
  std::vector<Event> get_user_events(const std::string &username);
  std::vector<Event> get_repo_events(const std::string &owner,
                                     const std::string &repo);
  std::vector<Event> get_org_events(const std::string &org);
  /// @}

private:
  /// Options controlling for_each_item().
  struct PageOptions {
    int per_page = 100;
    int max_pages = 0;           ///< 0 = unlimited
    const char *items_key = nullptr; ///< Array member holding the items
  };

  /// Visitor receiving one item; return `false` to stop paging.
  using ItemVisitor = std::function<bool(const nlohmann::json &)>;

  std::string url(const std::string &path, const Query &query = {}) const;
  std::vector<std::string>
  request_headers(const std::string &accept = "application/vnd.github+json") const;
  HttpResponse send(const char *verb, const std::string &url,
                    const std::string *body,
                    const std::vector<std::string> &headers);
  HttpResponse get(const std::string &url);
  std::optional<nlohmann::json> get_json(const std::string &url);
  HttpResponse send_json(const char *verb, const std::string &url,
                         const nlohmann::json &body);
  void for_each_item(const std::string &path, Query query,
                     const PageOptions &options, const ItemVisitor &visit);
  std::optional<std::chrono::milliseconds>
  rate_limit_wait(const HttpResponse &res) const;
  void enforce_delay();

  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  mutable std::mutex token_mutex_;
  std::string token_;
  std::mutex rate_mutex_;
  std::chrono::milliseconds delay_;
  std::chrono::steady_clock::time_point last_request_{};
  std::chrono::seconds max_rate_limit_wait_{60};
  int rate_limit_retries_ = 2;
  SleepFunction sleep_;
};

} // namespace fastgh

#endif // FASTGH_GITHUB_CLIENT_HPP
