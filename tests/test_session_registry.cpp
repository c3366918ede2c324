#include "fake_http_client.hpp"
#include "session_registry.hpp"
#include <catch2/catch_test_macros.hpp>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace fastgh;
using namespace fastgh_test;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

/// Tokens of the form "good-<login>" sign in as <login>.
std::shared_ptr<FakeServer> login_server() {
  return std::make_shared<FakeServer>([](const Request &req) {
    const std::string prefix = "Authorization: Bearer good-";
    for (const auto &h : req.headers) {
      if (h.rfind(prefix, 0) == 0) {
        return respond_json({{"login", h.substr(prefix.size())}});
      }
    }
    return respond(401, "{}");
  });
}

/// Owns the stores and setup used by one registry.
struct Harness {
  explicit Harness(const std::string &name)
      : root(fresh_dir(name)), store(root), server(login_server()),
        setup(store,
              [this](const std::string &token) {
                return std::make_unique<GitHubClient>(token, fake_http(server));
              },
              [this]() -> AuthOutcome {
                if (outcomes.empty()) {
                  return AuthCancelled{"closed"};
                }
                AuthOutcome next = outcomes.front();
                outcomes.pop_front();
                return next;
              }),
        registry(store, prefs, [this](std::size_t slot) {
          return setup.open(slot);
        }) {}

  ~Harness() { fs::remove_all(root); }

  std::vector<std::string> usernames() const {
    std::vector<std::string> names;
    for (const auto &a : registry.accounts()) {
      names.push_back(a->username());
    }
    return names;
  }

  fs::path root;
  CredentialStore store;
  PreferenceStore prefs;
  std::shared_ptr<FakeServer> server;
  std::deque<AuthOutcome> outcomes;
  AccountSetup setup;
  SessionRegistry registry;
};

} // namespace

TEST_CASE("load_all opens every configured slot", "[accounts]") {
  Harness h("fastgh_registry_load");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.store.save_token(1, "good-bob"));
  REQUIRE(h.store.save_token(2, "good-cat"));
  h.prefs.set(pref::kAccounts, 3);
  CHECK(h.registry.load_all() == AddAccountStatus::Added);
  CHECK(h.usernames() == std::vector<std::string>{"ann", "bob", "cat"});
  REQUIRE(h.registry.current());
  CHECK(h.registry.current()->username() == "ann");
  CHECK(h.registry.current_slot() == std::optional<std::size_t>(0));
}

TEST_CASE("load_all on a fresh install signs in the first account",
          "[accounts]") {
  Harness h("fastgh_registry_fresh");
  h.outcomes.push_back(AuthSuccess{"good-ann"});
  CHECK(h.registry.load_all() == AddAccountStatus::Added);
  CHECK(h.registry.size() == 1);
  CHECK(*h.store.load_token(0) == "good-ann");
}

TEST_CASE("load_all stops at the first slot that does not open",
          "[accounts]") {
  Harness h("fastgh_registry_partial");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.store.save_token(1, "revoked"));
  REQUIRE(h.store.save_token(2, "good-cat"));
  h.prefs.set(pref::kAccounts, 3);
  CHECK(h.registry.load_all() == AddAccountStatus::Cancelled);
  CHECK(h.usernames() == std::vector<std::string>{"ann"});
}

TEST_CASE("cancelling the only sign-in requests exit", "[accounts]") {
  Harness h("fastgh_registry_exit");
  CHECK(h.registry.load_all() == AddAccountStatus::ExitRequested);
  CHECK(h.registry.empty());

  AddAccountResult result = h.registry.add_account();
  CHECK(result.status == AddAccountStatus::ExitRequested);
  CHECK(result.message == "closed");
  CHECK(h.registry.empty());
  CHECK_FALSE(h.registry.current());
}

TEST_CASE("add_account appends and persists the count", "[accounts]") {
  Harness h("fastgh_registry_add");
  h.outcomes.push_back(AuthSuccess{"good-ann"});
  h.outcomes.push_back(AuthSuccess{"good-bob"});
  REQUIRE(h.registry.load_all() == AddAccountStatus::Added);

  AddAccountResult added = h.registry.add_account();
  REQUIRE(added.status == AddAccountStatus::Added);
  CHECK(added.account->slot() == 1);
  CHECK(added.account->username() == "bob");
  CHECK(h.prefs.get(pref::kAccounts, 0) == 2);
  CHECK(h.registry.current()->username() == "ann");

  AddAccountResult cancelled = h.registry.add_account();
  CHECK(cancelled.status == AddAccountStatus::Cancelled);
  CHECK(h.registry.size() == 2);

  AddAccountResult wrong_slot = h.registry.add_account(std::size_t{5});
  CHECK(wrong_slot.status == AddAccountStatus::Failed);
  CHECK(h.registry.size() == 2);
}

TEST_CASE("removing a middle account compacts slots", "[accounts]") {
  Harness h("fastgh_registry_remove");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.store.save_token(1, "good-bob"));
  REQUIRE(h.store.save_token(2, "good-cat"));
  h.prefs.set(pref::kAccounts, 3);
  REQUIRE(h.registry.load_all() == AddAccountStatus::Added);
  REQUIRE(h.registry.switch_account(1));

  std::string error;
  REQUIRE(h.registry.remove_account(1, &error));
  CHECK(h.usernames() == std::vector<std::string>{"ann", "cat"});
  CHECK(h.registry.accounts()[1]->slot() == 1);
  CHECK(h.store.count_slots() == 2);
  CHECK(*h.store.load_token(0) == "good-ann");
  CHECK(*h.store.load_token(1) == "good-cat");
  CHECK(h.prefs.get(pref::kAccounts, 0) == 2);
  REQUIRE(h.registry.current());
  CHECK(h.registry.current()->username() == "ann");

  CHECK_FALSE(h.registry.remove_account(7, &error));
  CHECK(error == "No account in slot 7");
}

TEST_CASE("removing after a partial load keeps the unloaded slots",
          "[accounts]") {
  Harness h("fastgh_registry_remove_partial");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.store.save_token(1, "good-bob"));
  REQUIRE(h.store.save_token(2, "good-cat"));
  h.prefs.set(pref::kAccounts, 3);

  // Slot 1 fails to open, so only slot 0 is loaded.
  SessionRegistry registry(h.store, h.prefs,
                           [&h](std::size_t slot) -> SetupResult {
                             if (slot != 0) {
                               return SetupFailed{"network down"};
                             }
                             UserProfile profile;
                             profile.login = "ann";
                             return std::make_shared<Account>(
                                 slot,
                                 std::make_unique<GitHubClient>(
                                     *h.store.load_token(slot),
                                     fake_http(h.server)),
                                 profile);
                           });
  registry.load_all();
  REQUIRE(registry.size() == 1);

  std::string error;
  REQUIRE(registry.remove_account(0, &error));
  CHECK(registry.empty());
  CHECK(*h.store.load_token(0) == "good-bob");
  CHECK(*h.store.load_token(1) == "good-cat");
  CHECK_FALSE(h.store.load_token(2));
  CHECK(h.store.count_slots() == 2);
  CHECK(h.prefs.get(pref::kAccounts, 0) == 2);
}

TEST_CASE("a failed removal keeps the registry unchanged", "[accounts]") {
  Harness h("fastgh_registry_remove_failed");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.store.save_token(1, "good-bob"));
  REQUIRE(h.store.save_token(3, "good-dan"));
  REQUIRE(h.store.save_token(4, "good-eve"));
  h.prefs.set(pref::kAccounts, 2);
  REQUIRE(h.registry.load_all() == AddAccountStatus::Added);
  {
    std::ofstream blocker(h.root / "account2");
    blocker << "not a slot";
  }

  std::string error;
  CHECK_FALSE(h.registry.remove_account(0, &error));
  CHECK_FALSE(error.empty());
  CHECK(h.usernames() == std::vector<std::string>{"ann", "bob"});
  CHECK(h.registry.accounts()[1]->slot() == 1);
  CHECK(*h.store.load_token(0) == "good-ann");
  CHECK(*h.store.load_token(1) == "good-bob");
  CHECK(*h.store.load_token(3) == "good-dan");
  CHECK(*h.store.load_token(4) == "good-eve");
  CHECK(h.prefs.get(pref::kAccounts, 0) == 2);
}

TEST_CASE("removing the only account empties the registry", "[accounts]") {
  Harness h("fastgh_registry_remove_only");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.registry.load_all() == AddAccountStatus::Added);
  REQUIRE(h.registry.remove_account(0));
  CHECK(h.registry.empty());
  CHECK_FALSE(h.registry.current());
  CHECK(h.store.count_slots() == 0);
}

TEST_CASE("switch_account never re-authenticates", "[accounts]") {
  Harness h("fastgh_registry_switch");
  REQUIRE(h.store.save_token(0, "good-ann"));
  REQUIRE(h.store.save_token(1, "good-bob"));
  h.prefs.set(pref::kAccounts, 2);
  REQUIRE(h.registry.load_all() == AddAccountStatus::Added);
  auto before = h.server->requests().size();
  CHECK(h.registry.switch_account(1));
  CHECK(h.registry.current()->username() == "bob");
  CHECK_FALSE(h.registry.switch_account(2));
  CHECK(h.registry.current()->username() == "bob");
  CHECK(h.server->requests().size() == before);
}

TEST_CASE("registry mutations are rejected off the owning thread",
          "[accounts]") {
  Harness h("fastgh_registry_thread");
  bool threw = false;
  std::thread worker([&] {
    try {
      h.registry.switch_account(0);
    } catch (const std::logic_error &) {
      threw = true;
    }
  });
  worker.join();
  CHECK(threw);
}
