/**
 * @file render.cpp
 * @brief Implements plain, JSON and YAML output of ResultNode trees.
 */
#include "render.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace rscan {

namespace {

std::shared_ptr<spdlog::logger> render_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("render");
  }();
  return logger;
}

std::string normalize(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string pad(std::size_t level) { return std::string(level * 2, ' '); }

/**
 * Whether a plain YAML scalar with this text would be read back as null, a
 * bool or a number instead of a string.
 */
bool resolves_to_non_string(const std::string &text) {
  static const std::unordered_set<std::string> null_forms = {
      "", "~", "null", "Null", "NULL"};
  if (null_forms.count(text) != 0) {
    return true;
  }
  const YAML::Node scalar(text);
  bool as_bool = false;
  long long as_integer = 0;
  double as_double = 0.0;
  return YAML::convert<bool>::decode(scalar, as_bool) ||
         YAML::convert<long long>::decode(scalar, as_integer) ||
         YAML::convert<double>::decode(scalar, as_double);
}

/// Emit @p text so that it always loads back as a string.
void emit_string(YAML::Emitter &out, const std::string &text) {
  if (resolves_to_non_string(text)) {
    out << YAML::DoubleQuoted;
  }
  out << text;
}

void emit_node(YAML::Emitter &out, const ResultNode &node) {
  out << YAML::BeginMap;
  out << YAML::Key << "path" << YAML::Value;
  emit_string(out, node.path.string());
  if (!node.remotes.empty()) {
    out << YAML::Key << "remotes" << YAML::Value << YAML::BeginMap;
    for (const auto &[name, url] : node.remotes) {
      out << YAML::Key;
      emit_string(out, name);
      out << YAML::Value;
      emit_string(out, url);
    }
    out << YAML::EndMap;
  }
  if (!node.children.empty()) {
    out << YAML::Key << "children" << YAML::Value << YAML::BeginSeq;
    for (const auto &child : node.children) {
      emit_node(out, child);
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;
}

} // namespace

std::string to_string(OutputFormat format) {
  switch (format) {
  case OutputFormat::Plain:
    return "plain";
  case OutputFormat::Yaml:
    return "yaml";
  case OutputFormat::Json:
    return "json";
  }
  return "plain";
}

OutputFormat output_format_from_string(const std::string &value) {
  static const std::unordered_map<std::string, OutputFormat> lookup = {
      {"plain", OutputFormat::Plain},
      {"yaml", OutputFormat::Yaml},
      {"json", OutputFormat::Json}};

  auto it = lookup.find(normalize(value));
  if (it == lookup.end()) {
    throw std::invalid_argument("Unknown output format: " + value);
  }
  return it->second;
}

nlohmann::json to_json(const ResultNode &node) {
  nlohmann::json j;
  j["path"] = node.path.string();
  if (!node.remotes.empty()) {
    nlohmann::json remotes = nlohmann::json::object();
    for (const auto &[name, url] : node.remotes) {
      remotes[name] = url;
    }
    j["remotes"] = std::move(remotes);
  }
  if (!node.children.empty()) {
    nlohmann::json children = nlohmann::json::array();
    for (const auto &child : node.children) {
      children.push_back(to_json(child));
    }
    j["children"] = std::move(children);
  }
  return j;
}

std::string to_yaml(const ResultNode &node) {
  YAML::Emitter out;
  emit_node(out, node);
  if (!out.good()) {
    throw RenderError("YAML serialization failed: " + out.GetLastError());
  }
  return out.c_str();
}

void render_plain(const ResultNode &node, std::ostream &out,
                  std::size_t indent) {
  out << pad(indent) << "path: " << node.path.string() << '\n';
  if (!node.remotes.empty()) {
    out << pad(indent + 1) << "remotes:\n";
    for (const auto &[name, url] : node.remotes) {
      out << pad(indent + 2) << name << ": " << url << '\n';
    }
  }
  if (!node.children.empty()) {
    out << pad(indent) << "children:\n";
    for (const auto &child : node.children) {
      render_plain(child, out, indent + 1);
    }
  }
}

void render(const ResultNode &node, OutputFormat format, std::ostream &out) {
  render_log()->debug("Rendering {} as {}", node.path.string(),
                      to_string(format));
  switch (format) {
  case OutputFormat::Plain:
    render_plain(node, out);
    return;
  case OutputFormat::Yaml:
    out << to_yaml(node) << '\n';
    return;
  case OutputFormat::Json:
    try {
      out << to_json(node).dump(2) << '\n';
    } catch (const nlohmann::json::exception &e) {
      render_log()->error("JSON serialization failed: {}", e.what());
      throw RenderError(std::string("JSON serialization failed: ") +
                        e.what());
    }
    return;
  }
}

} // namespace rscan
