#include "fake_http_client.hpp"
#include "update_check.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>

using namespace fastgh;
using namespace fastgh_test;
using nlohmann::json;

TEST_CASE("version strings compare numerically", "[update]") {
  CHECK(parse_version("v1.2.3") == std::optional<std::vector<int>>({1, 2, 3}));
  CHECK(parse_version("10.0") == std::optional<std::vector<int>>({10, 0}));
  CHECK_FALSE(parse_version("1.x"));
  CHECK_FALSE(parse_version("v"));
  CHECK_FALSE(parse_version("1..2"));
  CHECK(version_newer("1.10.0", "1.9.9"));
  CHECK(version_newer("v2", "1.99.0"));
  CHECK_FALSE(version_newer("1.2", "1.2.0"));
  CHECK_FALSE(version_newer("1.2.0", "1.3.0"));
  CHECK_FALSE(version_newer("garbage", "1.0.0"));
}

TEST_CASE("release body version wins over the tag", "[update]") {
  Release r;
  r.tag_name = "v2.0.0";
  CHECK(release_version(r) == "v2.0.0");
  r.body = "Highlights\n\n**Version:** 2.1.4\n";
  CHECK(release_version(r) == "2.1.4");
}

TEST_CASE("update check uses the newest release", "[update]") {
  auto server = std::make_shared<FakeServer>([](const Request &req) {
    if (req.url.find("/repos/octo/fastgh/releases") == std::string::npos) {
      return respond(404, "{}");
    }
    return respond_json(json::array(
        {{{"id", 2},
          {"tag_name", "v1.4.0"},
          {"body", "**Version:** 1.4.0"},
          {"html_url", "https://github.com/octo/fastgh/releases/tag/v1.4.0"}},
         {{"id", 1}, {"tag_name", "v1.3.0"}}}));
  });
  GitHubClient client("tok", fake_http(server));

  auto newer = check_for_update(client, "octo/fastgh", "1.3.2");
  REQUIRE(newer);
  CHECK(newer->available);
  CHECK(newer->latest_version == "1.4.0");
  CHECK(newer->current_version == "1.3.2");
  CHECK(newer->html_url ==
        "https://github.com/octo/fastgh/releases/tag/v1.4.0");

  auto same = check_for_update(client, "octo/fastgh", "1.4.0");
  REQUIRE(same);
  CHECK_FALSE(same->available);

  CHECK_FALSE(check_for_update(client, "octo/other", "1.0.0"));
  auto before = server->requests().size();
  CHECK_FALSE(check_for_update(client, "not-a-repo", "1.0.0"));
  CHECK_FALSE(check_for_update(client, "/name", "1.0.0"));
  CHECK(server->requests().size() == before);
}
