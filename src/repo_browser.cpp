#include "repo_browser.hpp"
#include "log.hpp"
#include <algorithm>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> repo_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("repo");
  }();
  return logger;
}

/// Success flag and the status line message of an action.
using Outcome = std::pair<bool, std::string>;

constexpr std::size_t kDrillLines = 8;

std::size_t index_of(RepoPane pane) { return static_cast<std::size_t>(pane); }

std::string first_line(const std::string &text) {
  return text.substr(0, text.find('\n'));
}

/// Leading @p max lines of @p text.
std::string head_lines(const std::string &text, std::size_t max) {
  std::size_t end = 0;
  for (std::size_t n = 0; n < max && end < text.size(); ++n) {
    auto newline = text.find('\n', end);
    if (newline == std::string::npos) {
      return text;
    }
    end = newline + 1;
  }
  return text.substr(0, end == 0 ? 0 : end - 1);
}

std::string parent_of(const std::string &path) {
  auto slash = path.rfind('/');
  return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

} // namespace

const char *pane_title(RepoPane pane) {
  switch (pane) {
  case RepoPane::Issues:
    return "Issues";
  case RepoPane::PullRequests:
    return "Pull requests";
  case RepoPane::Commits:
    return "Commits";
  case RepoPane::Actions:
    return "Actions";
  case RepoPane::Releases:
    return "Releases";
  case RepoPane::Files:
    return "Files";
  }
  return "";
}

RepoBrowser::RepoBrowser(std::shared_ptr<Account> account, Repository repo,
                         TaskRunner &runner, UiDispatcher &ui,
                         Preferences prefs, MessageSink message)
    : account_(std::move(account)), repo_(std::move(repo)), runner_(runner),
      ui_(ui), prefs_(std::move(prefs)), message_(std::move(message)) {}

void RepoBrowser::open() {
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  std::weak_ptr<RepoBrowser> weak = weak_from_this();
  runner_.run_then_post(
      ui_, "permission " + repo_.full_name,
      [account, owner, name] {
        return account->api().get_repo_permission(owner, name);
      },
      [weak](std::optional<std::string> permission) {
        if (auto self = weak.lock()) {
          self->permission_ = std::move(permission);
        }
      },
      [weak](const std::string &error) {
        if (auto self = weak.lock()) {
          self->notify(error);
        }
      });
  load(pane_);
}

bool RepoBrowser::loaded() const { return loaded_[index_of(pane_)]; }

std::string RepoBrowser::branch() const {
  return branch_index_ ? branches_[*branch_index_].name : std::string();
}

std::string RepoBrowser::header_text() const {
  std::string text = repo_.full_name;
  if (permission_) {
    text += " [" + *permission_ + "]";
  }
  text += std::string(" | ") + pane_title(pane_);
  switch (pane_) {
  case RepoPane::Issues:
  case RepoPane::PullRequests:
    text += " (" + state_filter_ + ")";
    break;
  case RepoPane::Files:
    text += " /" + path_;
    [[fallthrough]];
  case RepoPane::Commits:
  case RepoPane::Actions:
    if (branch_index_) {
      text += " @ " + branch();
    }
    break;
  case RepoPane::Releases:
    break;
  }
  return text;
}

std::size_t RepoBrowser::row_count() const {
  switch (pane_) {
  case RepoPane::Issues:
    return issues_.size();
  case RepoPane::PullRequests:
    return pulls_.size();
  case RepoPane::Commits:
    return commits_.size();
  case RepoPane::Actions:
    return runs_.size();
  case RepoPane::Releases:
    return releases_.size();
  case RepoPane::Files:
    return files_.size();
  }
  return 0;
}

std::string RepoBrowser::row_text(std::size_t index) const {
  if (index >= row_count()) {
    return {};
  }
  std::time_t now = std::time(nullptr);
  switch (pane_) {
  case RepoPane::Issues:
    return issues_[index].display();
  case RepoPane::PullRequests:
    return pulls_[index].display();
  case RepoPane::Commits:
    return commits_[index].display(now);
  case RepoPane::Actions:
    return runs_[index].display(now);
  case RepoPane::Releases:
    return releases_[index].display();
  case RepoPane::Files: {
    const auto &item = files_[index];
    if (item.type == "dir") {
      return item.name + "/";
    }
    return item.name + "  " + format_byte_size(item.size);
  }
  }
  return {};
}

std::string RepoBrowser::detail_text() const {
  if (selected_ < 0 || static_cast<std::size_t>(selected_) >= row_count()) {
    return loaded() ? std::string("Nothing here") : std::string("Loading...");
  }
  auto index = static_cast<std::size_t>(selected_);
  switch (pane_) {
  case RepoPane::Issues: {
    const auto &issue = issues_[index];
    return "Opened by " + issue.user.login + " | " +
           std::to_string(issue.comments_count) + " comments";
  }
  case RepoPane::PullRequests: {
    const auto &pr = pulls_[index];
    std::string text = pr.head_ref + " -> " + pr.base_ref;
    if (pr.draft) {
      text += " | Draft";
    }
    if (pr.mergeable_state) {
      text += " | " + *pr.mergeable_state;
    }
    return text;
  }
  case RepoPane::Commits: {
    const auto &commit = commits_[index];
    return commit.short_sha() + " by " + commit.author.name;
  }
  case RepoPane::Actions: {
    const auto &run = runs_[index];
    return run.status_text() + " | " + run.event + " on " + run.head_branch;
  }
  case RepoPane::Releases: {
    const auto &release = releases_[index];
    return release.status_label() + " | " +
           std::to_string(release.assets.size()) + " assets";
  }
  case RepoPane::Files:
    return files_[index].path;
  }
  return {};
}

std::string RepoBrowser::selected_url() const {
  if (selected_ < 0 || static_cast<std::size_t>(selected_) >= row_count()) {
    return repo_.html_url;
  }
  auto index = static_cast<std::size_t>(selected_);
  switch (pane_) {
  case RepoPane::Issues:
    return issues_[index].html_url;
  case RepoPane::PullRequests:
    return pulls_[index].html_url;
  case RepoPane::Commits:
    return commits_[index].html_url;
  case RepoPane::Actions:
    return runs_[index].html_url;
  case RepoPane::Releases:
    return releases_[index].html_url;
  case RepoPane::Files:
    return files_[index].html_url;
  }
  return repo_.html_url;
}

void RepoBrowser::switch_pane(int delta) {
  const int n = static_cast<int>(kPanes);
  int next = (static_cast<int>(pane_) + delta % n + n) % n;
  pane_ = static_cast<RepoPane>(next);
  selected_ = 0;
  reset_drill_down();
  if (!loaded_[index_of(pane_)]) {
    load(pane_);
  }
}

void RepoBrowser::move(int delta) {
  int count = static_cast<int>(row_count());
  if (count == 0) {
    selected_ = 0;
    return;
  }
  selected_ = std::clamp(selected_ + delta, 0, count - 1);
  reset_drill_down();
}

void RepoBrowser::reload() {
  reset_drill_down();
  load(pane_);
}

template <typename T, typename Work>
void RepoBrowser::fetch(RepoPane pane, Work work,
                        std::vector<T> RepoBrowser::*list) {
  std::size_t idx = index_of(pane);
  unsigned gen = ++generation_[idx];
  std::weak_ptr<RepoBrowser> weak = weak_from_this();
  runner_.run_then_post(
      ui_, std::string("load ") + pane_title(pane) + " " + repo_.full_name,
      std::move(work),
      [weak, pane, idx, gen, list](std::vector<T> items) {
        auto self = weak.lock();
        if (!self || self->generation_[idx] != gen) {
          return;
        }
        (*self).*list = std::move(items);
        self->loaded_[idx] = true;
        self->finish_load(pane);
      },
      [weak](const std::string &error) {
        if (auto self = weak.lock()) {
          self->notify(error);
        }
      });
}

template <typename Work>
void RepoBrowser::act(const std::string &name, Work work,
                      std::optional<RepoPane> reload_pane) {
  repo_log()->debug("{} on {}", name, repo_.full_name);
  std::weak_ptr<RepoBrowser> weak = weak_from_this();
  runner_.run_then_post(
      ui_, name + " " + repo_.full_name, std::move(work),
      [weak, reload_pane](Outcome outcome) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        self->notify(outcome.second);
        if (outcome.first && reload_pane) {
          self->load(*reload_pane);
        }
      },
      [weak](const std::string &error) {
        if (auto self = weak.lock()) {
          self->notify(error);
        }
      });
}

template <typename Work>
void RepoBrowser::drill(const std::string &name, Work work) {
  unsigned gen = ++drill_generation_;
  drill_down_ = "Loading...";
  std::weak_ptr<RepoBrowser> weak = weak_from_this();
  runner_.run_then_post(
      ui_, name + " " + repo_.full_name, std::move(work),
      [weak, gen](std::string text) {
        auto self = weak.lock();
        if (self && self->drill_generation_ == gen) {
          self->drill_down_ = std::move(text);
        }
      },
      [weak](const std::string &error) {
        if (auto self = weak.lock()) {
          self->notify(error);
        }
      });
}

void RepoBrowser::load(RepoPane pane) {
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  std::string ref = branch();
  switch (pane) {
  case RepoPane::Issues: {
    std::string state = state_filter_;
    fetch(
        pane,
        [account, owner, name, state] {
          return account->api().get_issues(owner, name, state);
        },
        &RepoBrowser::issues_);
    break;
  }
  case RepoPane::PullRequests: {
    std::string state = state_filter_;
    fetch(
        pane,
        [account, owner, name, state] {
          return account->api().get_pull_requests(owner, name, state);
        },
        &RepoBrowser::pulls_);
    break;
  }
  case RepoPane::Commits: {
    auto limit = static_cast<std::size_t>(std::max(prefs_.commit_limit, 0));
    fetch(
        pane,
        [account, owner, name, ref, limit] {
          return account->api().get_commits(owner, name, ref, limit);
        },
        &RepoBrowser::commits_);
    break;
  }
  case RepoPane::Actions: {
    WorkflowRunFilter filter;
    filter.branch = ref;
    fetch(
        pane,
        [account, owner, name, filter] {
          return account->api().get_workflow_runs(owner, name, filter);
        },
        &RepoBrowser::runs_);
    break;
  }
  case RepoPane::Releases:
    fetch(
        pane,
        [account, owner, name] {
          return account->api().get_releases(owner, name);
        },
        &RepoBrowser::releases_);
    break;
  case RepoPane::Files: {
    std::string path = path_;
    fetch(
        pane,
        [account, owner, name, path, ref] {
          return account->api().get_contents(owner, name, path, ref);
        },
        &RepoBrowser::files_);
    break;
  }
  }
}

void RepoBrowser::finish_load(RepoPane pane) {
  if (pane != pane_) {
    return;
  }
  int count = static_cast<int>(row_count());
  selected_ = count == 0 ? 0 : std::clamp(selected_, 0, count - 1);
}

void RepoBrowser::notify(const std::string &msg) {
  if (message_) {
    message_(msg);
  }
}

void RepoBrowser::reset_drill_down() {
  ++drill_generation_;
  drill_down_.clear();
}

bool RepoBrowser::can_write() const {
  return permission_ && (*permission_ == "admin" || *permission_ == "write");
}

std::filesystem::path RepoBrowser::download_dir() const {
  return prefs_.download_location.empty()
             ? std::filesystem::current_path()
             : std::filesystem::path(prefs_.download_location);
}

void RepoBrowser::enter() {
  if (selected_ < 0 || static_cast<std::size_t>(selected_) >= row_count()) {
    return;
  }
  auto index = static_cast<std::size_t>(selected_);
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  switch (pane_) {
  case RepoPane::Files: {
    const auto item = files_[index];
    if (item.type == "dir") {
      path_ = item.path;
      selected_ = 0;
      reset_drill_down();
      load(RepoPane::Files);
      return;
    }
    std::string ref = branch();
    std::string path = item.path;
    unsigned gen = ++drill_generation_;
    drill_down_ = "Loading...";
    std::weak_ptr<RepoBrowser> weak = weak_from_this();
    runner_.run_then_post(
        ui_, "preview " + path,
        [account, owner, name, path, ref] {
          return account->api().get_file_text(owner, name, path, ref);
        },
        [weak, gen, path](std::optional<std::string> text) {
          auto self = weak.lock();
          if (!self || self->drill_generation_ != gen) {
            return;
          }
          if (!text) {
            self->drill_down_ = "Could not load " + path;
            return;
          }
          self->drill_down_ = head_lines(*text, kDrillLines);
          self->preview_ = std::move(*text);
          self->preview_path_ = path;
        },
        [weak](const std::string &error) {
          if (auto self = weak.lock()) {
            self->notify(error);
          }
        });
    return;
  }
  case RepoPane::Issues: {
    int number = issues_[index].number;
    drill("comments #" + std::to_string(number), [account, owner, name,
                                                  number] {
      auto comments = account->api().get_issue_comments(owner, name, number);
      std::string text = std::to_string(comments.size()) + " comments";
      std::size_t start =
          comments.size() > kDrillLines ? comments.size() - kDrillLines : 0;
      for (std::size_t i = start; i < comments.size(); ++i) {
        text += "\n" + comments[i].user.login + ": " +
                first_line(comments[i].body);
      }
      return text;
    });
    return;
  }
  case RepoPane::PullRequests: {
    int number = pulls_[index].number;
    drill("pull request #" + std::to_string(number), [account, owner, name,
                                                      number] {
      auto pr = account->api().get_pull_request(owner, name, number);
      if (!pr) {
        return "Could not load #" + std::to_string(number);
      }
      std::string text = "+" + std::to_string(pr->additions) + " -" +
                         std::to_string(pr->deletions) + " in " +
                         std::to_string(pr->changed_files) + " files, " +
                         std::to_string(pr->commits_count) + " commits";
      text += "\nMergeable: ";
      text += pr->mergeable ? (*pr->mergeable ? "yes" : "no") : "unknown";
      if (pr->mergeable_state) {
        text += " (" + *pr->mergeable_state + ")";
      }
      return text;
    });
    return;
  }
  case RepoPane::Commits: {
    std::string sha = commits_[index].sha;
    drill("commit " + sha, [account, owner, name, sha] {
      auto commit = account->api().get_commit(owner, name, sha);
      if (!commit) {
        return "Could not load " + sha.substr(0, 7);
      }
      std::string text = "+" + std::to_string(commit->stats_additions) + " -" +
                         std::to_string(commit->stats_deletions);
      std::size_t shown = std::min(commit->files.size(), kDrillLines);
      for (std::size_t i = 0; i < shown; ++i) {
        text += "\n" + commit->files[i].display();
      }
      return text;
    });
    return;
  }
  case RepoPane::Actions: {
    std::int64_t run_id = runs_[index].id;
    drill("jobs " + std::to_string(run_id), [account, owner, name, run_id] {
      auto jobs = account->api().get_workflow_run_jobs(owner, name, run_id);
      std::time_t now = std::time(nullptr);
      std::string text = std::to_string(jobs.size()) + " jobs";
      for (const auto &job : jobs) {
        text += "\n" + job.display(now);
      }
      return text;
    });
    return;
  }
  case RepoPane::Releases: {
    std::string tag = releases_[index].tag_name;
    drill("release " + tag, [account, owner, name, tag] {
      auto release = account->api().get_release_by_tag(owner, name, tag);
      if (!release) {
        return "Could not load " + tag;
      }
      std::string text = head_lines(release->body, kDrillLines / 2);
      for (const auto &asset : release->assets) {
        text += (text.empty() ? "" : "\n") + asset.display();
      }
      return text.empty() ? "No notes or assets" : text;
    });
    return;
  }
  }
}

bool RepoBrowser::back() {
  if (!drill_down_.empty()) {
    reset_drill_down();
    return true;
  }
  if (pane_ == RepoPane::Files && !path_.empty()) {
    path_ = parent_of(path_);
    selected_ = 0;
    load(RepoPane::Files);
    return true;
  }
  return false;
}

void RepoBrowser::toggle_state() {
  if (selected_ < 0 || static_cast<std::size_t>(selected_) >= row_count()) {
    return;
  }
  auto index = static_cast<std::size_t>(selected_);
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  switch (pane_) {
  case RepoPane::Issues: {
    int number = issues_[index].number;
    bool open = issues_[index].state == "open";
    act(
        open ? "close issue" : "reopen issue",
        [account, owner, name, number, open]() -> Outcome {
          bool ok = open ? account->api().close_issue(owner, name, number)
                         : account->api().reopen_issue(owner, name, number);
          std::string tag = "issue #" + std::to_string(number);
          if (!ok) {
            return {false, "Could not update " + tag};
          }
          return {true, (open ? "Closed " : "Reopened ") + tag};
        },
        RepoPane::Issues);
    return;
  }
  case RepoPane::PullRequests: {
    int number = pulls_[index].number;
    bool open = pulls_[index].state == "open";
    act(
        open ? "close pull request" : "reopen pull request",
        [account, owner, name, number, open]() -> Outcome {
          bool ok =
              open ? account->api().close_pull_request(owner, name, number)
                   : account->api().reopen_pull_request(owner, name, number);
          std::string tag = "pull request #" + std::to_string(number);
          if (!ok) {
            return {false, "Could not update " + tag};
          }
          return {true, (open ? "Closed " : "Reopened ") + tag};
        },
        RepoPane::PullRequests);
    return;
  }
  case RepoPane::Actions: {
    std::int64_t run_id = runs_[index].id;
    int run_number = runs_[index].run_number;
    bool running = runs_[index].status != "completed";
    act(
        running ? "cancel run" : "rerun",
        [account, owner, name, run_id, run_number, running]() -> Outcome {
          bool ok = running
                        ? account->api().cancel_workflow_run(owner, name, run_id)
                        : account->api().rerun_workflow(owner, name, run_id);
          std::string tag = "run #" + std::to_string(run_number);
          if (!ok) {
            return {false, (running ? "Could not cancel " : "Could not re-run ") +
                               tag};
          }
          return {true, (running ? "Cancelled " : "Re-running ") + tag};
        },
        RepoPane::Actions);
    return;
  }
  default:
    return;
  }
}

void RepoBrowser::toggle_filter() {
  if (pane_ != RepoPane::Issues && pane_ != RepoPane::PullRequests) {
    return;
  }
  state_filter_ = state_filter_ == "open" ? "closed" : "open";
  for (RepoPane pane : {RepoPane::Issues, RepoPane::PullRequests}) {
    loaded_[index_of(pane)] = false;
    ++generation_[index_of(pane)];
  }
  selected_ = 0;
  reset_drill_down();
  load(pane_);
}

void RepoBrowser::merge() {
  if (pane_ != RepoPane::PullRequests || selected_ < 0 ||
      static_cast<std::size_t>(selected_) >= pulls_.size()) {
    return;
  }
  const auto &pr = pulls_[static_cast<std::size_t>(selected_)];
  int number = pr.number;
  if (pr.state != "open") {
    notify("#" + std::to_string(number) + " is not open");
    return;
  }
  if (permission_ && !can_write()) {
    notify("Merging needs write access to " + repo_.full_name);
    return;
  }
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  act(
      "merge",
      [account, owner, name, number]() -> Outcome {
        std::string error;
        bool ok = account->api().merge_pull_request(
            owner, name, number, MergeMethod::Merge, "", "", &error);
        std::string tag = "#" + std::to_string(number);
        if (!ok) {
          return {false, "Merge of " + tag + " refused: " + error};
        }
        return {true, "Merged " + tag};
      },
      RepoPane::PullRequests);
}

void RepoBrowser::rerun_failed() {
  if (pane_ != RepoPane::Actions || selected_ < 0 ||
      static_cast<std::size_t>(selected_) >= runs_.size()) {
    return;
  }
  const auto &run = runs_[static_cast<std::size_t>(selected_)];
  std::int64_t run_id = run.id;
  int run_number = run.run_number;
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  act(
      "rerun failed jobs",
      [account, owner, name, run_id, run_number]() -> Outcome {
        std::string tag = "run #" + std::to_string(run_number);
        if (!account->api().rerun_failed_jobs(owner, name, run_id)) {
          return {false, "Could not re-run failed jobs of " + tag};
        }
        return {true, "Re-running failed jobs of " + tag};
      },
      RepoPane::Actions);
}

void RepoBrowser::fetch_job_logs() {
  if (pane_ != RepoPane::Actions || selected_ < 0 ||
      static_cast<std::size_t>(selected_) >= runs_.size()) {
    return;
  }
  std::int64_t run_id = runs_[static_cast<std::size_t>(selected_)].id;
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  std::filesystem::path dir = download_dir();
  act("job logs", [account, owner, name, run_id, dir]() -> Outcome {
    auto jobs = account->api().get_workflow_run_jobs(owner, name, run_id);
    if (jobs.empty()) {
      return {false, "Run " + std::to_string(run_id) + " has no jobs"};
    }
    auto job = std::find_if(jobs.begin(), jobs.end(), [](const WorkflowJob &j) {
      return j.conclusion && *j.conclusion == "failure";
    });
    if (job == jobs.end()) {
      job = jobs.begin();
    }
    auto text = account->api().get_job_logs(owner, name, job->id);
    if (!text) {
      return {false, "Could not fetch the log of " + job->name};
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    auto file = dir / (name + "-job-" + std::to_string(job->id) + ".log");
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << *text;
    out.close();
    if (!out) {
      repo_log()->warn("Could not write {}", file.string());
      return {false, "Could not write " + file.string()};
    }
    return {true, "Saved log of " + job->name + " to " + file.string()};
  });
}

void RepoBrowser::download_asset() {
  if (pane_ != RepoPane::Releases || selected_ < 0 ||
      static_cast<std::size_t>(selected_) >= releases_.size()) {
    return;
  }
  const auto &release = releases_[static_cast<std::size_t>(selected_)];
  if (release.assets.empty()) {
    notify(release.tag_name + " has no assets");
    return;
  }
  ReleaseAsset asset = release.assets.front();
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  std::string dest = (download_dir() / asset.name).string();
  notify("Downloading " + asset.name);
  act("download " + asset.name, [account, owner, name, asset, dest]() -> Outcome {
    if (!account->api().download_asset(owner, name, asset.id, dest)) {
      return {false, "Download of " + asset.name + " failed"};
    }
    return {true, "Downloaded " + asset.name + " to " + dest};
  });
}

void RepoBrowser::cycle_branch() {
  if (!branches_.empty()) {
    advance_branch();
    return;
  }
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  std::weak_ptr<RepoBrowser> weak = weak_from_this();
  runner_.run_then_post(
      ui_, "branches " + repo_.full_name,
      [account, owner, name] {
        return account->api().get_branches(owner, name);
      },
      [weak](std::vector<Branch> branches) {
        auto self = weak.lock();
        if (!self) {
          return;
        }
        if (branches.empty()) {
          self->notify("No branches in " + self->repo_.full_name);
          return;
        }
        self->branches_ = std::move(branches);
        self->advance_branch();
      },
      [weak](const std::string &error) {
        if (auto self = weak.lock()) {
          self->notify(error);
        }
      });
}

void RepoBrowser::advance_branch() {
  // Cycles through every branch and then back to the default branch.
  if (!branch_index_) {
    branch_index_ = 0;
  } else if (*branch_index_ + 1 < branches_.size()) {
    ++*branch_index_;
  } else {
    branch_index_.reset();
  }
  for (RepoPane pane : {RepoPane::Commits, RepoPane::Actions, RepoPane::Files}) {
    loaded_[index_of(pane)] = false;
    ++generation_[index_of(pane)];
  }
  path_.clear();
  reset_drill_down();
  notify(branch_index_ ? "Branch " + branch() : std::string("Default branch"));
  if (pane_ == RepoPane::Commits || pane_ == RepoPane::Actions ||
      pane_ == RepoPane::Files) {
    selected_ = 0;
    load(pane_);
  }
}

void RepoBrowser::mark_notifications_read() {
  auto account = account_;
  std::string owner = repo_.owner;
  std::string name = repo_.name;
  std::string full_name = repo_.full_name;
  act("mark notifications read", [account, owner, name,
                                   full_name]() -> Outcome {
    if (!account->api().mark_repo_notifications_read(owner, name)) {
      return {false, "Could not mark notifications of " + full_name + " read"};
    }
    return {true, "Marked notifications of " + full_name + " read"};
  });
}

} // namespace fastgh
