#include "account.hpp"
#include "fake_http_client.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <memory>
#include <variant>

using namespace fastgh;
using namespace fastgh_test;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

/// Accepts tokens starting with "good", rejects everything else.
std::shared_ptr<FakeServer> user_server() {
  return std::make_shared<FakeServer>([](const Request &req) {
    bool good = std::any_of(req.headers.begin(), req.headers.end(),
                            [](const std::string &h) {
                              return h.rfind("Authorization: Bearer good", 0) ==
                                     0;
                            });
    if (!good) {
      return respond(401, R"({"message":"Bad credentials"})");
    }
    return respond_json({{"login", "mona"}, {"name", "Mona Lisa"}});
  });
}

AccountSetup::ClientFactory factory(const std::shared_ptr<FakeServer> &server) {
  return [server](const std::string &token) {
    return std::make_unique<GitHubClient>(token, fake_http(server));
  };
}

} // namespace

TEST_CASE("stored valid token opens without authorization", "[accounts]") {
  fs::path root = fresh_dir("fastgh_account_stored");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "good-1"));
  int auth_calls = 0;
  AccountSetup setup(store, factory(user_server()), [&]() -> AuthOutcome {
    ++auth_calls;
    return AuthCancelled{"unexpected"};
  });
  SetupResult result = setup.open(0);
  REQUIRE(std::holds_alternative<std::shared_ptr<Account>>(result));
  auto account = std::get<std::shared_ptr<Account>>(result);
  CHECK(account->slot() == 0);
  CHECK(account->username() == "mona");
  CHECK(account->display_name() == "Mona Lisa");
  CHECK(account->state() == AuthState::Ready);
  CHECK(auth_calls == 0);
  CHECK(setup.transitions() ==
        std::vector<AuthState>{AuthState::Verifying, AuthState::Ready});
  fs::remove_all(root);
}

TEST_CASE("missing token runs authorization and stores the result",
          "[accounts]") {
  fs::path root = fresh_dir("fastgh_account_new");
  CredentialStore store(root);
  AccountSetup setup(store, factory(user_server()),
                     []() -> AuthOutcome { return AuthSuccess{"good-new"}; });
  SetupResult result = setup.open(0);
  REQUIRE(std::holds_alternative<std::shared_ptr<Account>>(result));
  CHECK(*store.load_token(0) == "good-new");
  CHECK(setup.transitions() ==
        std::vector<AuthState>{AuthState::NoCredential,
                               AuthState::AuthenticationPending,
                               AuthState::Verifying, AuthState::Ready});
  fs::remove_all(root);
}

TEST_CASE("cancelled authorization yields a cancelled result", "[accounts]") {
  fs::path root = fresh_dir("fastgh_account_cancel");
  CredentialStore store(root);
  AccountSetup setup(store, factory(user_server()), []() -> AuthOutcome {
    return AuthCancelled{"closed the dialog"};
  });
  SetupResult result = setup.open(0);
  REQUIRE(std::holds_alternative<SetupCancelled>(result));
  CHECK(std::get<SetupCancelled>(result).reason == "closed the dialog");
  CHECK(setup.transitions().back() == AuthState::Cancelled);
  CHECK_FALSE(store.has_token(0));
  fs::remove_all(root);
}

TEST_CASE("rejected stored token is replaced by a new sign-in", "[accounts]") {
  fs::path root = fresh_dir("fastgh_account_rejected");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "revoked"));
  AccountSetup setup(store, factory(user_server()),
                     []() -> AuthOutcome { return AuthSuccess{"good-2"}; });
  SetupResult result = setup.open(0);
  REQUIRE(std::holds_alternative<std::shared_ptr<Account>>(result));
  CHECK(*store.load_token(0) == "good-2");
  CHECK(setup.transitions() ==
        std::vector<AuthState>{AuthState::Verifying, AuthState::NoCredential,
                               AuthState::AuthenticationPending,
                               AuthState::Verifying, AuthState::Ready});
  fs::remove_all(root);
}

TEST_CASE("repeatedly rejected tokens fail the slot", "[accounts]") {
  fs::path root = fresh_dir("fastgh_account_reject_loop");
  CredentialStore store(root);
  int auth_calls = 0;
  AccountSetup setup(store, factory(user_server()), [&]() -> AuthOutcome {
    ++auth_calls;
    return AuthSuccess{"bad-" + std::to_string(auth_calls)};
  });
  SetupResult result = setup.open(0);
  REQUIRE(std::holds_alternative<SetupFailed>(result));
  CHECK(auth_calls == 2);
  fs::remove_all(root);
}

TEST_CASE("verification and authorization failures are terminal",
          "[accounts]") {
  fs::path root = fresh_dir("fastgh_account_failures");
  CredentialStore store(root);
  {
    auto server = std::make_shared<FakeServer>(
        [](const Request &) { return respond(502, "{}"); });
    REQUIRE(store.save_token(0, "good-1"));
    AccountSetup setup(store, factory(server),
                       []() -> AuthOutcome { return AuthCancelled{}; });
    SetupResult result = setup.open(0);
    REQUIRE(std::holds_alternative<SetupFailed>(result));
    CHECK(std::get<SetupFailed>(result).reason ==
          "Verification returned HTTP 502");
    CHECK(store.has_token(0));
  }
  {
    AccountSetup setup(store, factory(user_server()), []() -> AuthOutcome {
      return AuthFailed{"device flow disabled"};
    });
    SetupResult result = setup.open(1);
    REQUIRE(std::holds_alternative<SetupFailed>(result));
    CHECK(std::get<SetupFailed>(result).reason == "device flow disabled");
  }
  fs::remove_all(root);
}

TEST_CASE("auth states have printable names", "[accounts]") {
  CHECK(std::string(to_string(AuthState::AuthenticationPending)) ==
        "AuthenticationPending");
  CHECK(std::string(to_string(AuthState::Ready)) == "Ready");
}
