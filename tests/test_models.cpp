#include "models.hpp"
#include "util/time.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace fastgh;
using nlohmann::json;

TEST_CASE("parse_repository reads the listing fields", "[models]") {
  json j = {{"id", 42},
            {"name", "tool"},
            {"full_name", "octo/tool"},
            {"description", nullptr},
            {"owner", {{"login", "octo"}}},
            {"stargazers_count", 5},
            {"forks_count", 2},
            {"open_issues_count", 1},
            {"language", "C++"},
            {"updated_at", "2024-01-02T03:04:05Z"},
            {"pushed_at", "2024-01-02T03:04:05Z"},
            {"html_url", "https://github.com/octo/tool"},
            {"private", true}};
  Repository r = parse_repository(j);
  CHECK(r.id == 42);
  CHECK(r.owner == "octo");
  CHECK_FALSE(r.description.has_value());
  CHECK(r.is_private);
  CHECK(r.single_line() == "octo/tool | 5 stars | C++ | Pushed 2024-01-02 03:04");
}

TEST_CASE("Repository::render substitutes template placeholders", "[models]") {
  Repository r;
  r.full_name = "octo/tool";
  r.stars = 7;
  r.updated_at = "2024-01-01T00:00:00Z";
  std::time_t now = *parse_iso8601("2024-01-04T00:00:00Z");
  CHECK(r.render("$full_name$ ($stars$) $description$ $language$ $updated_at$",
                 now) == "octo/tool (7) No description Unknown 3 days ago");
  CHECK(r.render("$unknown$", now) == "$unknown$");
}

TEST_CASE("parse functions tolerate missing and mistyped members", "[models]") {
  Repository r = parse_repository(json::object());
  CHECK(r.id == 0);
  CHECK(r.full_name.empty());
  User u = parse_user(json(nullptr));
  CHECK(u.login == "unknown");
  UserProfile p = parse_user_profile({{"login", "mona"}, {"followers", "many"}});
  CHECK(p.login == "mona");
  CHECK(p.followers == 0);
  CHECK(p.display_name() == "mona");
}

TEST_CASE("Notification helpers", "[models]") {
  json j = {{"id", "t1"},
            {"unread", true},
            {"reason", "review_requested"},
            {"subject",
             {{"title", "Fix it"},
              {"url", "https://api.github.com/repos/octo/tool/pulls/3"},
              {"type", "PullRequest"}}},
            {"repository",
             {{"full_name", "octo/tool"},
              {"name", "tool"},
              {"owner", {{"login", "octo"}}}}},
            {"updated_at", "2024-01-01T00:00:00Z"}};
  Notification n = parse_notification(j);
  CHECK(n.unread);
  CHECK(n.repository_owner == "octo");
  CHECK(n.reason_text() == "Review requested");
  CHECK(n.type_label() == "PR");
  CHECK(n.web_url() == "https://github.com/octo/tool/pull/3");
  std::time_t now = *parse_iso8601("2024-01-01T02:00:00Z");
  CHECK(n.display(now) ==
        "* [PR] Fix it - octo/tool (Review requested) - 2h ago");

  Notification bare;
  bare.repository_full_name = "octo/tool";
  bare.reason = "something_new";
  CHECK(bare.web_url() == "https://github.com/octo/tool");
  CHECK(bare.reason_text() == "something_new");
}

TEST_CASE("Event descriptions and links", "[models]") {
  json j = {{"id", "1"},
            {"type", "WatchEvent"},
            {"actor", {{"login", "mona"}}},
            {"repo", {{"name", "octo/tool"}}},
            {"payload", json::object()},
            {"created_at", "2024-01-01T00:00:00Z"}};
  Event e = parse_event(j);
  CHECK(e.action_description() == "starred");
  CHECK(e.web_url() == "https://github.com/octo/tool");
  std::time_t now = *parse_iso8601("2024-01-03T00:00:00Z");
  CHECK(e.display(now) == "mona starred in octo/tool - 2d ago");

  Event pr = e;
  pr.type = "PullRequestEvent";
  pr.payload = {{"pull_request", {{"number", 9}}}};
  CHECK(pr.web_url() == "https://github.com/octo/tool/pull/9");

  Event branch = e;
  branch.type = "CreateEvent";
  branch.payload = {{"ref_type", "branch"}, {"ref", "dev"}};
  CHECK(branch.action_description() == "created branch dev");
  CHECK(branch.web_url() == "https://github.com/octo/tool/tree/dev");
}

TEST_CASE("Release labels fall back to the tag", "[models]") {
  Release r = parse_release({{"tag_name", "v1.2.0"},
                             {"prerelease", true},
                             {"published_at", "2024-05-06T07:08:09Z"}});
  CHECK(r.name == "v1.2.0");
  CHECK(r.status_label() == "Pre-release");
  CHECK(r.display() == "v1.2.0 - Pre-release (0 assets) - 2024-05-06");
}

TEST_CASE("format_byte_size picks a unit", "[models]") {
  CHECK(format_byte_size(512) == "512 B");
  CHECK(format_byte_size(1536) == "1.5 KB");
  CHECK(format_byte_size(2 * 1024 * 1024) == "2.0 MB");
}
