#include "fake_http_client.hpp"
#include "http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace fastgh;
using namespace fastgh_test;

namespace {

/// Fails the first @p failures calls with @p error, then returns 200.
class FlakyHttpClient : public HttpClient {
public:
  FlakyHttpClient(int failures, std::function<void()> error)
      : failures_(failures), error_(std::move(error)) {}

  int calls = 0;

  HttpResponse get(const std::string &,
                   const std::vector<std::string> &) override {
    return attempt();
  }
  HttpResponse post(const std::string &, const std::string &,
                    const std::vector<std::string> &) override {
    return attempt();
  }
  HttpResponse put(const std::string &, const std::string &,
                   const std::vector<std::string> &) override {
    return attempt();
  }
  HttpResponse patch(const std::string &, const std::string &,
                     const std::vector<std::string> &) override {
    return attempt();
  }
  HttpResponse del(const std::string &,
                   const std::vector<std::string> &) override {
    return attempt();
  }

private:
  HttpResponse attempt() {
    ++calls;
    if (calls <= failures_) {
      error_();
    }
    return respond(200, "ok");
  }

  int failures_;
  std::function<void()> error_;
};

} // namespace

TEST_CASE("RetryHttpClient retries transient network errors", "[http]") {
  auto inner = std::make_unique<FlakyHttpClient>(
      2, [] { throw TransientNetworkError("connection reset"); });
  FlakyHttpClient *raw = inner.get();
  RetryHttpClient client(std::move(inner), 3, 0);
  HttpResponse res = client.get("https://example.test", {});
  CHECK(res.status_code == 200);
  CHECK(res.body == "ok");
  CHECK(raw->calls == 3);
}

TEST_CASE("RetryHttpClient retries server errors but gives up eventually",
          "[http]") {
  auto inner = std::make_unique<FlakyHttpClient>(
      10, [] { throw HttpStatusError(502, "bad gateway"); });
  FlakyHttpClient *raw = inner.get();
  RetryHttpClient client(std::move(inner), 2, 0);
  REQUIRE_THROWS_AS(client.post("https://example.test", "x", {}),
                    HttpStatusError);
  CHECK(raw->calls == 3);
}

TEST_CASE("RetryHttpClient does not retry permanent failures", "[http]") {
  auto inner = std::make_unique<FlakyHttpClient>(
      1, [] { throw std::invalid_argument("bad request"); });
  FlakyHttpClient *raw = inner.get();
  RetryHttpClient client(std::move(inner), 5, 0);
  REQUIRE_THROWS_AS(client.del("https://example.test", {}),
                    std::invalid_argument);
  CHECK(raw->calls == 1);
}

TEST_CASE("is_transient_error classifies failures", "[http]") {
  CHECK(is_transient_error(TransientNetworkError("timeout")));
  CHECK(is_transient_error(HttpStatusError(503, "unavailable")));
  CHECK_FALSE(is_transient_error(HttpStatusError(404, "missing")));
  CHECK_FALSE(is_transient_error(std::runtime_error("other")));
}

TEST_CASE("url_encode escapes reserved characters", "[http]") {
  CHECK(url_encode("") == "");
  CHECK(url_encode("plain") == "plain");
  CHECK(url_encode("a b/c") == "a%20b%2Fc");
  CHECK(url_encode("repo user") == "repo%20user");
}

TEST_CASE("find_header matches names case-insensitively", "[http]") {
  std::vector<std::string> headers = {"HTTP/1.1 200 OK",
                                      "content-type: application/json",
                                      "Link:  <https://x/next>; rel=\"next\" "};
  auto type = find_header(headers, "Content-Type");
  REQUIRE(type);
  CHECK(*type == "application/json");
  auto link = find_header(headers, "link");
  REQUIRE(link);
  CHECK(*link == "<https://x/next>; rel=\"next\"");
  CHECK_FALSE(find_header(headers, "Retry-After"));
}

TEST_CASE("default download writes the body to disk", "[http]") {
  auto server = std::make_shared<FakeServer>(
      [](const Request &) { return respond(200, "payload"); });
  FakeHttpClient client(server);
  const char *path = "fastgh_download_test.bin";
  std::remove(path);
  std::uint64_t reported = 0;
  HttpResponse res = client.download(
      "https://example.test/file", {}, path,
      [&](std::uint64_t done, std::uint64_t) { reported = done; });
  CHECK(res.status_code == 200);
  CHECK(res.body.empty());
  CHECK(reported == 7);
  std::ifstream in(path, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  CHECK(content == "payload");
  in.close();
  std::remove(path);
}

TEST_CASE("default download leaves no file on error status", "[http]") {
  auto server = std::make_shared<FakeServer>(
      [](const Request &) { return respond(404, "missing"); });
  FakeHttpClient client(server);
  const char *path = "fastgh_download_missing.bin";
  std::remove(path);
  HttpResponse res = client.download("https://example.test/file", {}, path, {});
  CHECK(res.status_code == 404);
  std::ifstream in(path);
  CHECK_FALSE(in.good());
}
