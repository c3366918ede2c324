#include "device_flow.hpp"
#include "fake_http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <deque>
#include <sstream>
#include <variant>

using namespace fastgh;
using namespace fastgh_test;
using nlohmann::json;

namespace {

class RecordingPrompt : public DevicePrompt {
public:
  bool accept = true;
  int waits_allowed = 100;
  std::optional<DeviceCode> presented;
  int waits = 0;

  bool present(const DeviceCode &code) override {
    presented = code;
    return accept;
  }
  bool keep_waiting(std::chrono::seconds, std::chrono::seconds) override {
    return ++waits <= waits_allowed;
  }
};

const json kCode = {{"device_code", "dev-1"},
                    {"user_code", "ABCD-1234"},
                    {"verification_uri", "https://github.com/login/device"},
                    {"expires_in", 900},
                    {"interval", 5}};

/// Serves the device code, then the queued token poll replies in order.
std::shared_ptr<FakeServer> device_server(std::deque<json> polls) {
  auto queue = std::make_shared<std::deque<json>>(std::move(polls));
  return std::make_shared<FakeServer>([queue](const Request &req) {
    if (req.url.find("/login/device/code") != std::string::npos) {
      return respond_json(kCode);
    }
    if (queue->empty()) {
      return respond_json({{"error", "authorization_pending"}});
    }
    json next = queue->front();
    queue->pop_front();
    return respond_json(next);
  });
}

DeviceFlowAuthenticator make_authenticator(
    const std::shared_ptr<FakeServer> &server,
    std::vector<std::chrono::seconds> *sleeps = nullptr) {
  DeviceFlowAuthenticator auth(fake_http(server), "client-1",
                               "https://login.example/", "repo");
  auto now = std::make_shared<std::chrono::steady_clock::time_point>();
  auth.set_clock([now] { return *now; });
  auth.set_sleep_function([now, sleeps](std::chrono::seconds d) {
    *now += d;
    if (sleeps != nullptr) {
      sleeps->push_back(d);
    }
  });
  return auth;
}

} // namespace

TEST_CASE("device flow issues a token after pending polls", "[auth]") {
  auto server = device_server({{{"error", "authorization_pending"}},
                               {{"access_token", "gho_abc"}}});
  std::vector<std::chrono::seconds> sleeps;
  auto auth = make_authenticator(server, &sleeps);
  RecordingPrompt prompt;
  AuthOutcome outcome = auth.authenticate(prompt);
  REQUIRE(std::holds_alternative<AuthSuccess>(outcome));
  CHECK(std::get<AuthSuccess>(outcome).access_token == "gho_abc");
  REQUIRE(prompt.presented);
  CHECK(prompt.presented->user_code == "ABCD-1234");
  CHECK(sleeps.size() == 2);

  auto reqs = server->requests();
  REQUIRE(reqs.size() == 3);
  CHECK(reqs[0].url == "https://login.example/login/device/code");
  CHECK(reqs[0].body == "client_id=client-1&scope=repo");
  CHECK(reqs[1].url == "https://login.example/login/oauth/access_token");
  CHECK(reqs[1].body.find("device_code=dev-1") != std::string::npos);
  CHECK(reqs[1].body.find(
            "grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Adevice_code") !=
        std::string::npos);
}

TEST_CASE("slow_down increases the polling interval", "[auth]") {
  auto server = device_server(
      {{{"error", "slow_down"}}, {{"access_token", "gho_abc"}}});
  std::vector<std::chrono::seconds> sleeps;
  auto auth = make_authenticator(server, &sleeps);
  RecordingPrompt prompt;
  AuthOutcome outcome = auth.authenticate(prompt);
  REQUIRE(std::holds_alternative<AuthSuccess>(outcome));
  REQUIRE(sleeps.size() == 2);
  CHECK(sleeps[0] == std::chrono::seconds(5));
  CHECK(sleeps[1] == std::chrono::seconds(10));
}

TEST_CASE("declining the prompt cancels sign-in", "[auth]") {
  auto server = device_server({});
  auto auth = make_authenticator(server);
  RecordingPrompt prompt;
  prompt.accept = false;
  AuthOutcome outcome = auth.authenticate(prompt);
  CHECK(std::holds_alternative<AuthCancelled>(outcome));
  CHECK(server->requests().size() == 1);
}

TEST_CASE("cancelling while waiting ends the flow", "[auth]") {
  auto server = device_server({});
  auto auth = make_authenticator(server);
  RecordingPrompt prompt;
  prompt.waits_allowed = 2;
  AuthOutcome outcome = auth.authenticate(prompt);
  REQUIRE(std::holds_alternative<AuthCancelled>(outcome));
  CHECK(std::get<AuthCancelled>(outcome).reason == "Sign-in cancelled");
}

TEST_CASE("expired device codes cancel sign-in", "[auth]") {
  auto server = device_server({});
  auto auth = make_authenticator(server);
  RecordingPrompt prompt;
  prompt.waits_allowed = 1000;
  AuthOutcome outcome = auth.authenticate(prompt);
  REQUIRE(std::holds_alternative<AuthCancelled>(outcome));
  CHECK(std::get<AuthCancelled>(outcome).reason == "Device code expired");
  CHECK(prompt.waits == 179);
}

TEST_CASE("access_denied cancels and unknown errors fail", "[auth]") {
  {
    auto server = device_server({{{"error", "access_denied"},
                                  {"error_description", "User denied"}}});
    auto auth = make_authenticator(server);
    RecordingPrompt prompt;
    AuthOutcome outcome = auth.authenticate(prompt);
    REQUIRE(std::holds_alternative<AuthCancelled>(outcome));
    CHECK(std::get<AuthCancelled>(outcome).reason == "User denied");
  }
  {
    auto server = device_server({{{"error", "incorrect_client_credentials"}}});
    auto auth = make_authenticator(server);
    RecordingPrompt prompt;
    AuthOutcome outcome = auth.authenticate(prompt);
    REQUIRE(std::holds_alternative<AuthFailed>(outcome));
    CHECK(std::get<AuthFailed>(outcome).reason ==
          "incorrect_client_credentials");
  }
}

TEST_CASE("device code request failures are reported", "[auth]") {
  auto server = std::make_shared<FakeServer>(
      [](const Request &) { return respond(404, "Not Found"); });
  auto auth = make_authenticator(server);
  std::string error;
  CHECK_FALSE(auth.request_code(&error));
  CHECK(error == "HTTP 404");

  server->set_handler([](const Request &) {
    return respond_json({{"device_code", "x"}});
  });
  CHECK_FALSE(auth.request_code(&error));
  CHECK(error.find("user_code") != std::string::npos);

  RecordingPrompt prompt;
  AuthOutcome outcome = auth.authenticate(prompt);
  CHECK(std::holds_alternative<AuthFailed>(outcome));
  CHECK_FALSE(prompt.presented);
}

TEST_CASE("console prompt prints the verification instructions", "[auth]") {
  std::ostringstream out;
  ConsoleDevicePrompt prompt(out, false);
  DeviceCode code;
  code.user_code = "WXYZ-0000";
  code.verification_uri = "https://github.com/login/device";
  CHECK(prompt.present(code));
  CHECK(out.str().find("https://github.com/login/device") != std::string::npos);
  CHECK(out.str().find("WXYZ-0000") != std::string::npos);
  CHECK(prompt.keep_waiting(std::chrono::seconds(5), std::chrono::seconds(900)));
}
