#include "config.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace rscan {

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
 * Convert a YAML scalar to the narrowest matching JSON value.
 *
 * Booleans and numbers are recognised; everything else stays a string.
 */
nlohmann::json yaml_scalar_to_json(const std::string &s) {
  const std::string lower = to_lower_copy(s);
  if (lower == "true")
    return true;
  if (lower == "false")
    return false;
  if (s.empty())
    return s;
  char *end = nullptr;
  errno = 0;
  long long i = std::strtoll(s.c_str(), &end, 10);
  if (errno == 0 && end == s.c_str() + s.size())
    return i;
  errno = 0;
  double d = std::strtod(s.c_str(), &end);
  if (errno == 0 && end == s.c_str() + s.size())
    return d;
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
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
 * Only the value kinds a settings file can meaningfully hold are mapped;
 * dates and times become null.
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
  return nullptr;
}

/**
 * Flatten the `scan`, `output` and `logging` sections into the root object.
 *
 * Keys already present at the root win over sectioned ones.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  if (source.is_null()) {
    return nlohmann::json::object();
  }
  if (!source.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json normalized = source;
  for (std::string_view name : {"scan", "output", "logging"}) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      continue;
    }
    const nlohmann::json section = *it;
    normalized.erase(it);
    for (const auto &[key, value] : section.items()) {
      if (!normalized.contains(key)) {
        normalized[key] = value;
      }
    }
  }
  return normalized;
}

/**
 * Parse a `log_categories` value given either as a mapping or as a list of
 * `NAME=LEVEL` entries.
 */
std::unordered_map<std::string, std::string>
parse_log_categories(const nlohmann::json &value) {
  std::unordered_map<std::string, std::string> categories;
  auto assign_category = [&categories](std::string name, std::string level) {
    if (name.empty()) {
      return;
    }
    if (level.empty()) {
      level = "debug";
    }
    categories[std::move(name)] = std::move(level);
  };
  if (value.is_object()) {
    for (const auto &[name, level] : value.items()) {
      assign_category(name, level.get<std::string>());
    }
  } else if (value.is_array()) {
    for (const auto &entry : value) {
      auto text = entry.get<std::string>();
      auto pos = text.find('=');
      if (pos == std::string::npos) {
        assign_category(text, "debug");
      } else {
        assign_category(text.substr(0, pos), text.substr(pos + 1));
      }
    }
  } else if (!value.is_null()) {
    throw std::runtime_error("log_categories must be a mapping or a list");
  }
  return categories;
}

} // namespace

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 * @throws nlohmann::json::exception When values have the wrong type.
 * @throws std::invalid_argument When the output format is unknown.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("directory")) {
    set_directory(cfg["directory"].get<std::string>());
  }
  if (cfg.contains("tree")) {
    set_tree(cfg["tree"].get<bool>());
  }
  if (cfg.contains("follow_symlinks")) {
    set_follow_symlinks(cfg["follow_symlinks"].get<bool>());
  }
  if (cfg.contains("format")) {
    set_format(output_format_from_string(cfg["format"].get<std::string>()));
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
  if (cfg.contains("log_categories")) {
    set_log_categories(parse_log_categories(cfg["log_categories"]));
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown as
 * `std::runtime_error`.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be opened or parsed, or
 *         when the extension is unsupported.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension: " + path);
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  config_log()->debug("Detected config file type: {}", ext);
  Config cfg;
  try {
    nlohmann::json j;
    if (ext == "yaml" || ext == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format '" + ext + "'");
    }
    cfg.load_json(j);
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw std::runtime_error("Failed to load config " + path + ": " +
                             e.what());
  }
  config_log()->debug("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace rscan
