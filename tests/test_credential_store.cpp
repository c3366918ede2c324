#include "credential_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace fastgh;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

} // namespace

TEST_CASE("tokens round trip through slot directories", "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_basic");
  CredentialStore store(root);
  CHECK(store.count_slots() == 0);
  CHECK_FALSE(store.load_token(0));

  std::string error;
  REQUIRE(store.save_token(0, "tok-0", &error));
  CHECK(fs::exists(root / "account0" / "credentials.json"));
  CHECK(store.has_token(0));
  CHECK(*store.load_token(0) == "tok-0");
  CHECK(store.count_slots() == 1);

  REQUIRE(store.save_token(0, "tok-0b"));
  CHECK(*store.load_token(0) == "tok-0b");

  REQUIRE(store.clear_token(0));
  CHECK_FALSE(store.has_token(0));
  CHECK(fs::is_directory(root / "account0"));
  CHECK(store.count_slots() == 1);
  fs::remove_all(root);
}

TEST_CASE("malformed credential files are ignored", "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_malformed");
  CredentialStore store(root);
  fs::create_directories(store.slot_dir(0));
  {
    std::ofstream out(store.credential_file(0));
    out << "{not json";
  }
  CHECK_FALSE(store.load_token(0));
  {
    std::ofstream out(store.credential_file(0), std::ios::trunc);
    out << R"({"access_token": ""})";
  }
  CHECK_FALSE(store.load_token(0));
  fs::remove_all(root);
}

TEST_CASE("removing a middle slot shifts later slots down", "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_remove");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "tok-0"));
  REQUIRE(store.save_token(1, "tok-1"));
  REQUIRE(store.save_token(2, "tok-2"));

  std::string error;
  REQUIRE(store.remove_slot(1, &error));
  CHECK(store.count_slots() == 2);
  CHECK(*store.load_token(0) == "tok-0");
  CHECK(*store.load_token(1) == "tok-2");
  CHECK_FALSE(fs::exists(root / "account2"));
  fs::remove_all(root);
}

TEST_CASE("removing the last slot leaves earlier slots alone",
          "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_remove_last");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "tok-0"));
  REQUIRE(store.save_token(1, "tok-1"));
  REQUIRE(store.remove_slot(1));
  CHECK(store.count_slots() == 1);
  CHECK(*store.load_token(0) == "tok-0");
  fs::remove_all(root);
}

TEST_CASE("removing a slot closes a gap left by a missing directory",
          "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_gap");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "tok-0"));
  REQUIRE(store.save_token(2, "tok-2"));
  REQUIRE(store.save_token(3, "tok-3"));
  CHECK(store.count_slots() == 1);

  std::string error;
  REQUIRE(store.remove_slot(0, &error));
  CHECK(*store.load_token(0) == "tok-2");
  CHECK(*store.load_token(1) == "tok-3");
  CHECK(store.count_slots() == 2);
  CHECK_FALSE(fs::exists(root / "account2"));
  CHECK_FALSE(fs::exists(root / "account3"));
  CHECK_FALSE(fs::exists(root / ".removing-account0"));
  fs::remove_all(root);
}

TEST_CASE("slots beyond the contiguous count still move down",
          "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_beyond");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "tok-0"));
  REQUIRE(store.save_token(1, "tok-1"));
  REQUIRE(store.save_token(2, "tok-2"));
  REQUIRE(store.save_token(3, "tok-3"));
  REQUIRE(store.remove_slot(1));
  CHECK(*store.load_token(0) == "tok-0");
  CHECK(*store.load_token(1) == "tok-2");
  CHECK(*store.load_token(2) == "tok-3");
  CHECK(store.count_slots() == 3);
  fs::remove_all(root);
}

TEST_CASE("a failed move restores every slot", "[credentials]") {
  fs::path root = fresh_dir("fastgh_credentials_rollback");
  CredentialStore store(root);
  REQUIRE(store.save_token(0, "tok-0"));
  REQUIRE(store.save_token(2, "tok-2"));
  REQUIRE(store.save_token(3, "tok-3"));
  {
    // A plain file occupies the index slot 3 has to move into.
    std::ofstream blocker(root / "account1");
    blocker << "not a slot";
  }

  std::string error;
  CHECK_FALSE(store.remove_slot(0, &error));
  CHECK(error.find("already exists") != std::string::npos);
  CHECK(*store.load_token(0) == "tok-0");
  CHECK(*store.load_token(2) == "tok-2");
  CHECK(*store.load_token(3) == "tok-3");
  CHECK(fs::is_regular_file(root / "account1"));
  CHECK_FALSE(fs::exists(root / ".removing-account0"));
  fs::remove_all(root);
}
