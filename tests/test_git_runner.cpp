#include "git_runner.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace fastgh;

namespace {

Repository sample_repo() {
  Repository r;
  r.name = "tool";
  r.owner = "octo";
  r.full_name = "octo/tool";
  return r;
}

} // namespace

TEST_CASE("clone destination honours the organisation layout", "[git]") {
  Repository r = sample_repo();
  CHECK(clone_destination(r, "/src", false) == "/src/tool");
  CHECK(clone_destination(r, "/src", true) == "/src/octo/tool");
  r.owner.clear();
  CHECK(clone_destination(r, "/src", true) == "/src/tool");
}

TEST_CASE("git command lines", "[git]") {
  Repository r = sample_repo();
  CHECK(clone_command(r, "/src/tool", false) ==
        std::vector<std::string>{"git", "clone",
                                 "https://github.com/octo/tool.git",
                                 "/src/tool"});
  CHECK(clone_command(r, "/src/tool", true, "/usr/bin/git") ==
        std::vector<std::string>{"/usr/bin/git", "clone", "--recursive",
                                 "https://github.com/octo/tool.git",
                                 "/src/tool"});
  CHECK(pull_command("/src/tool") ==
        std::vector<std::string>{"git", "-C", "/src/tool", "pull"});
  CHECK(std::string(to_string(GitOutcome::Cancelled)) == "cancelled");
}

#ifndef _WIN32
TEST_CASE("successful commands stream their output", "[git]") {
  GitOperation op({"sh", "-c", "echo first; echo second 1>&2"});
  std::vector<std::string> lines;
  GitResult result =
      op.run([&](const std::string &line) { lines.push_back(line); });
  CHECK(result.outcome == GitOutcome::Success);
  CHECK(result.exit_code == 0);
  CHECK(lines.size() == 2);
  CHECK(result.output.find("first") != std::string::npos);
  CHECK(result.output.find("second") != std::string::npos);
}

TEST_CASE("non-zero exits fail", "[git]") {
  GitOperation op({"sh", "-c", "exit 3"});
  GitResult result = op.run();
  CHECK(result.outcome == GitOutcome::Failed);
  CHECK(result.exit_code == 3);
  CHECK(result.error.empty());
}

TEST_CASE("missing executables are reported", "[git]") {
  GitOperation op({"fastgh-no-such-git-binary", "pull"});
  GitResult result = op.run();
  CHECK(result.outcome == GitOutcome::Failed);
  CHECK(result.exit_code == 127);
  CHECK(result.error == "Could not execute fastgh-no-such-git-binary");
}

TEST_CASE("cancellation before and during a run", "[git]") {
  {
    GitOperation op({"sh", "-c", "echo never"});
    op.cancel();
    CHECK(op.cancel_requested());
    GitResult result = op.run();
    CHECK(result.outcome == GitOutcome::Cancelled);
    CHECK(result.output.empty());
  }
  {
    GitOperation op({"sh", "-c", "sleep 30"});
    std::thread canceller([&op] {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      op.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    GitResult result = op.run();
    canceller.join();
    CHECK(result.outcome == GitOutcome::Cancelled);
    CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(20));
  }
}
#else
TEST_CASE("successful commands stream their output", "[git]") {
  GitOperation op({"cmd", "/c", "echo first& echo second 1>&2"});
  std::vector<std::string> lines;
  GitResult result =
      op.run([&](const std::string &line) { lines.push_back(line); });
  CHECK(result.outcome == GitOutcome::Success);
  CHECK(result.exit_code == 0);
  CHECK(lines.size() == 2);
  CHECK(result.output.find("first") != std::string::npos);
  CHECK(result.output.find("second") != std::string::npos);
}

TEST_CASE("non-zero exits fail", "[git]") {
  GitOperation op({"cmd", "/c", "exit 3"});
  GitResult result = op.run();
  CHECK(result.outcome == GitOutcome::Failed);
  CHECK(result.exit_code == 3);
}

TEST_CASE("missing executables are reported", "[git]") {
  GitOperation op({"fastgh-no-such-git-binary", "pull"});
  GitResult result = op.run();
  CHECK(result.outcome == GitOutcome::Failed);
  CHECK(result.error.rfind("Could not execute fastgh-no-such-git-binary", 0) ==
        0);
}

TEST_CASE("cancellation ends the whole process tree", "[git]") {
  GitOperation op({"cmd", "/c", "ping -n 30 127.0.0.1 > nul"});
  std::thread canceller([&op] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    op.cancel();
  });
  auto started = std::chrono::steady_clock::now();
  GitResult result = op.run();
  canceller.join();
  CHECK(result.outcome == GitOutcome::Cancelled);
  CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(20));
}
#endif

TEST_CASE("empty commands are rejected", "[git]") {
  GitOperation op({});
  GitResult result = op.run();
  CHECK(result.outcome == GitOutcome::Failed);
  CHECK_FALSE(result.error.empty());
}
