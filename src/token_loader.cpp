#include "token_loader.hpp"
#include "config.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <unordered_set>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> token_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("credentials");
  }();
  return logger;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool structured_extension(const std::string &path) {
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    return false;
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext == "json" || ext == "yaml" || ext == "yml" || ext == "toml" ||
         ext == "tml";
}

void append_string_array(const nlohmann::json &array,
                         std::vector<std::string> &tokens) {
  if (!array.is_array()) {
    throw std::runtime_error("tokens entry must be an array");
  }
  for (const auto &item : array) {
    if (!item.is_string()) {
      throw std::runtime_error("tokens entry must contain strings");
    }
    tokens.push_back(item.get<std::string>());
  }
}

std::vector<std::string> tokens_from_document(const nlohmann::json &j) {
  std::vector<std::string> tokens;
  if (j.is_array()) {
    append_string_array(j, tokens);
  } else if (j.is_object()) {
    if (j.contains("token")) {
      tokens.push_back(j["token"].get<std::string>());
    }
    if (j.contains("tokens")) {
      append_string_array(j["tokens"], tokens);
    }
  } else if (j.is_string()) {
    tokens.push_back(j.get<std::string>());
  }
  return tokens;
}

std::vector<std::string> tokens_from_lines(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open token file");
  }
  std::vector<std::string> tokens;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    tokens.push_back(line);
  }
  return tokens;
}

} // namespace

std::vector<std::string> load_tokens_from_file(const std::string &path) {
  std::vector<std::string> raw = structured_extension(path)
                                     ? tokens_from_document(
                                           load_config_document(path))
                                     : tokens_from_lines(path);
  std::vector<std::string> tokens;
  std::unordered_set<std::string> seen;
  for (auto &token : raw) {
    token = trim(token);
    if (token.empty() || !seen.insert(token).second) {
      continue;
    }
    tokens.push_back(std::move(token));
  }
  token_log()->info("Loaded {} token(s) from {}", tokens.size(), path);
  return tokens;
}

} // namespace fastgh
