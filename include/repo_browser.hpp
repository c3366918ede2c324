/**
 * @file repo_browser.hpp
 * @brief Drill-down view of a single repository.
 *
 * The browser lists issues, pull requests, commits, workflow runs, releases
 * and files of one repository and runs the actions available on each of
 * them. Every request goes through TaskRunner::run_then_post so results are
 * applied on the UI thread.
 */

#ifndef FASTGH_REPO_BROWSER_HPP
#define FASTGH_REPO_BROWSER_HPP

#include "account.hpp"
#include "models.hpp"
#include "preferences.hpp"
#include "task_runner.hpp"
#include "ui_dispatcher.hpp"
#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fastgh {

/// Panes of the repository view, in display order.
enum class RepoPane { Issues, PullRequests, Commits, Actions, Releases, Files };

/// Printable title of @p pane.
const char *pane_title(RepoPane pane);

/**
 * State of the repository view.
 *
 * Owned through a `std::shared_ptr`; requests still in flight when the view
 * is closed are dropped on arrival. All methods run on the UI thread.
 */
class RepoBrowser : public std::enable_shared_from_this<RepoBrowser> {
public:
  /// Receives status messages for the status line.
  using MessageSink = std::function<void(const std::string &)>;

  RepoBrowser(std::shared_ptr<Account> account, Repository repo,
              TaskRunner &runner, UiDispatcher &ui, Preferences prefs,
              MessageSink message);

  RepoBrowser(const RepoBrowser &) = delete;
  RepoBrowser &operator=(const RepoBrowser &) = delete;

  /// Fetch the permission level and the first pane.
  void open();

  const Repository &repository() const { return repo_; }
  RepoPane pane() const { return pane_; }
  int selected() const { return selected_; }

  /// Whether the current pane has received its first result.
  bool loaded() const;

  /// "admin", "write" or "read" once known.
  const std::optional<std::string> &permission() const { return permission_; }

  /// Branch used for commits, runs and files; empty for the default branch.
  std::string branch() const;

  /// Directory shown in the files pane, empty for the root.
  const std::string &path() const { return path_; }

  /// State filter of the issue and pull request panes.
  const std::string &state_filter() const { return state_filter_; }

  /// "owner/name [write] | Issues (open)".
  std::string header_text() const;

  std::size_t row_count() const;
  std::string row_text(std::size_t index) const;
  std::string detail_text() const;
  std::string selected_url() const;

  /// Move to the pane @p delta steps away and load it when still empty.
  void switch_pane(int delta);

  /// Move the selection by @p delta rows.
  void move(int delta);

  /// Reload the current pane.
  void reload();

  /**
   * Drill into the selected row: descend into a directory, preview a file
   * or fetch the details of the selected item.
   */
  void enter();

  /**
   * Leave the current directory of the files pane.
   *
   * @return `false` when there is nothing to go back to.
   */
  bool back();

  /// Close or reopen the selected issue or pull request; cancel a running
  /// workflow run or re-run a finished one.
  void toggle_state();

  /// Toggle the issue and pull request filter between open and closed.
  void toggle_filter();

  /// Merge the selected pull request.
  void merge();

  /// Re-run the failed jobs of the selected workflow run.
  void rerun_failed();

  /// Save the log of the first failed job (or the first job) of the
  /// selected workflow run into the download location.
  void fetch_job_logs();

  /// Download the first asset of the selected release.
  void download_asset();

  /// Use the next branch for commits, runs and files.
  void cycle_branch();

  /// Mark every notification of the repository as read.
  void mark_notifications_read();

  /// Raw text of the last previewed file.
  const std::string &preview() const { return preview_; }

  /// Extra lines fetched by enter() for the selected row.
  const std::string &drill_down() const { return drill_down_; }

private:
  static constexpr std::size_t kPanes = 6;

  template <typename T, typename Work>
  void fetch(RepoPane pane, Work work, std::vector<T> RepoBrowser::*list);

  /// Run @p work and report the message it returns; reload @p pane on
  /// success when set.
  template <typename Work>
  void act(const std::string &name, Work work,
           std::optional<RepoPane> reload_pane = std::nullopt);

  /// Run @p work and show the text it returns below the selected row.
  template <typename Work> void drill(const std::string &name, Work work);

  void load(RepoPane pane);
  void finish_load(RepoPane pane);
  void notify(const std::string &msg);
  void reset_drill_down();
  void advance_branch();
  bool can_write() const;
  std::filesystem::path download_dir() const;

  std::shared_ptr<Account> account_;
  Repository repo_;
  TaskRunner &runner_;
  UiDispatcher &ui_;
  Preferences prefs_;
  MessageSink message_;

  RepoPane pane_{RepoPane::Issues};
  int selected_{0};
  std::string state_filter_{"open"};
  std::string path_;
  std::string preview_;
  std::string preview_path_;
  std::string drill_down_;
  unsigned drill_generation_{0};
  std::optional<std::string> permission_;
  std::vector<Branch> branches_;
  std::optional<std::size_t> branch_index_;

  std::vector<Issue> issues_;
  std::vector<PullRequest> pulls_;
  std::vector<Commit> commits_;
  std::vector<WorkflowRun> runs_;
  std::vector<Release> releases_;
  std::vector<ContentItem> files_;

  std::array<bool, kPanes> loaded_{};
  std::array<unsigned, kPanes> generation_{};
};

} // namespace fastgh

#endif // FASTGH_REPO_BROWSER_HPP
