#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML scalar into a JSON number, boolean or string.
 */
nlohmann::json yaml_scalar_to_json(const std::string &s) {
  if (s == "true" || s == "True" || s == "TRUE")
    return true;
  if (s == "false" || s == "False" || s == "FALSE")
    return false;
  if (s.empty())
    return s;
  const char *begin = s.c_str();
  char *end = nullptr;
  errno = 0;
  long long i = std::strtoll(begin, &end, 0);
  if (errno == 0 && end == begin + s.size())
    return i;
  errno = 0;
  double d = std::strtod(begin, &end);
  if (errno == 0 && end == begin + s.size())
    return d;
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * The conversion preserves scalar types where possible and recursively maps
 * sequences and maps to JSON arrays and objects respectively.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar:
    return yaml_scalar_to_json(node.Scalar());
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 *
 * @param node TOML node read from a parsed document.
 * @return JSON value containing the equivalent data.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files expose the same flat keys the loader expects.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"core", "logging", "network", "auth", "ui"}) {
    merge_section(section);
  }

  return normalized;
}

std::pair<std::string, std::string> split_category(const std::string &raw) {
  auto pos = raw.find('=');
  if (pos == std::string::npos) {
    return {raw, "debug"};
  }
  return {raw.substr(0, pos), raw.substr(pos + 1)};
}

} // namespace

void Config::set_preference_overrides(nlohmann::json overrides) {
  if (!overrides.is_object()) {
    config_log()->warn("Ignoring preferences entry; expected an object");
    return;
  }
  preference_overrides_ = std::move(overrides);
}

/**
 * Populate the configuration from a JSON object.
 *
 * @throws nlohmann::json::exception When values cannot be converted to the
 *         expected types.
 */
void Config::load_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("Configuration root must be an object");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("http_timeout")) {
    set_http_timeout(cfg["http_timeout"].get<int>());
  }
  if (cfg.contains("http_retries")) {
    set_http_retries(cfg["http_retries"].get<int>());
  }
  if (cfg.contains("request_delay_ms")) {
    set_request_delay_ms(cfg["request_delay_ms"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("api_base")) {
    set_api_base(cfg["api_base"].get<std::string>());
  }
  if (cfg.contains("login_base")) {
    set_login_base(cfg["login_base"].get<std::string>());
  }
  if (cfg.contains("client_id")) {
    set_client_id(cfg["client_id"].get<std::string>());
  }
  if (cfg.contains("config_dir")) {
    set_config_dir(cfg["config_dir"].get<std::string>());
  }
  if (cfg.contains("update_repository")) {
    set_update_repository(cfg["update_repository"].get<std::string>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_buffer_lines")) {
    set_log_buffer_lines(cfg["log_buffer_lines"].get<int>());
  }
  if (cfg.contains("log_categories")) {
    const auto &value = cfg["log_categories"];
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          set_log_category(key, v.get<std::string>());
        } else if (v.is_null()) {
          set_log_category(key, "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (!item.is_string()) {
          continue;
        }
        auto [name, level] = split_category(item.get<std::string>());
        if (!name.empty()) {
          set_log_category(name, level);
        }
      }
    } else if (value.is_string()) {
      auto [name, level] = split_category(value.get<std::string>());
      if (!name.empty()) {
        set_log_category(name, level);
      }
    }
  }
  if (cfg.contains("hotkeys_enabled")) {
    set_hotkeys_enabled(cfg["hotkeys_enabled"].get<bool>());
  }
  if (cfg.contains("hotkeys")) {
    const auto &hot = cfg["hotkeys"];
    if (hot.is_boolean()) {
      set_hotkeys_enabled(hot.get<bool>());
    } else if (hot.is_object()) {
      if (hot.contains("enabled") && hot["enabled"].is_boolean()) {
        set_hotkeys_enabled(hot["enabled"].get<bool>());
      }
      const nlohmann::json &bindings =
          hot.contains("bindings") && hot["bindings"].is_object()
              ? hot["bindings"]
              : hot;
      for (const auto &[action, value] : bindings.items()) {
        if (action == "enabled" || action == "bindings") {
          continue;
        }
        if (value.is_string()) {
          set_hotkey_binding(action, value.get<std::string>());
        } else if (value.is_array()) {
          std::string merged;
          for (const auto &item : value) {
            if (!item.is_string()) {
              continue;
            }
            if (!merged.empty()) {
              merged.push_back(',');
            }
            merged += item.get<std::string>();
          }
          set_hotkey_binding(action, merged);
        } else if (value.is_null()) {
          set_hotkey_binding(action, "");
        }
      }
    }
  }
  if (cfg.contains("preferences")) {
    set_preference_overrides(cfg["preferences"]);
  }
}

/**
 * Construct a configuration object from a JSON representation.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

nlohmann::json load_config_document(const std::string &path) {
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = to_lower_copy(ext);
  config_log()->debug("Detected config file type: {}", ext_lower);
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      return yaml_to_json(node);
    }
    if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        config_log()->error("Failed to open config file {}", path);
        throw std::runtime_error("Failed to open config file");
      }
      nlohmann::json j;
      f >> j;
      return j;
    }
    if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      return toml_to_json(tbl);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  config_log()->error("Unsupported config format: {}", ext);
  throw std::runtime_error("Unsupported config format");
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  nlohmann::json j = load_config_document(path);
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

std::string default_config_dir() {
#ifdef _WIN32
  if (const char *appdata = std::getenv("APPDATA")) {
    return (std::filesystem::path(appdata) / "fastgh").string();
  }
#endif
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME")) {
    if (*xdg != '\0') {
      return (std::filesystem::path(xdg) / "fastgh").string();
    }
  }
  const char *home = std::getenv("HOME");
#ifdef _WIN32
  if (home == nullptr) {
    home = std::getenv("USERPROFILE");
  }
#endif
  std::filesystem::path base = home != nullptr ? std::filesystem::path(home)
                                               : std::filesystem::current_path();
  return (base / ".config" / "fastgh").string();
}

} // namespace fastgh
