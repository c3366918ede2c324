#include "token_loader.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fastgh;
namespace fs = std::filesystem;

namespace {

std::string write_tokens(const std::string &name, const std::string &content) {
  fs::path dir = fs::temp_directory_path() / "fastgh_token_tests";
  fs::create_directories(dir);
  fs::path file = dir / name;
  std::ofstream out(file, std::ios::trunc);
  out << content;
  return file.string();
}

} // namespace

TEST_CASE("plain token files skip comments and duplicates", "[tokens]") {
  auto path = write_tokens("tokens.txt", "# personal tokens\n"
                                         "ghp_one\n"
                                         "\n"
                                         "  ghp_two  \n"
                                         "ghp_one\n");
  CHECK(load_tokens_from_file(path) ==
        std::vector<std::string>{"ghp_one", "ghp_two"});
}

TEST_CASE("structured token files", "[tokens]") {
  CHECK(load_tokens_from_file(write_tokens("list.json", R"(["a", "b"])")) ==
        std::vector<std::string>{"a", "b"});
  CHECK(load_tokens_from_file(write_tokens(
            "object.json", R"({"token": "a", "tokens": ["b", "a", " "]})")) ==
        std::vector<std::string>{"a", "b"});
  CHECK(load_tokens_from_file(
            write_tokens("tokens.yaml", "tokens:\n  - y1\n  - y2\n")) ==
        std::vector<std::string>{"y1", "y2"});
  CHECK(load_tokens_from_file(
            write_tokens("tokens.toml", "token = \"t1\"\ntokens = [\"t2\"]\n")) ==
        std::vector<std::string>{"t1", "t2"});
}

TEST_CASE("invalid token files throw", "[tokens]") {
  CHECK_THROWS_AS(
      load_tokens_from_file(write_tokens("numbers.json", "[1, 2]")),
      std::runtime_error);
  CHECK_THROWS_AS(load_tokens_from_file(
                      write_tokens("scalar.json", R"({"tokens": "abc"})")),
                  std::runtime_error);
  CHECK_THROWS(load_tokens_from_file(
      (fs::temp_directory_path() / "fastgh_token_tests" / "missing.txt")
          .string()));
  CHECK_THROWS(load_tokens_from_file(
      (fs::temp_directory_path() / "fastgh_token_tests" / "missing.json")
          .string()));
}
