#ifndef REMOTESCAN_CONFIG_HPP
#define REMOTESCAN_CONFIG_HPP

#include "render.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace rscan {

/// Scan defaults loaded from a YAML, TOML, or JSON settings file.
class Config {
public:
  /// Directory to search when none is given on the command line.
  const std::string &directory() const { return directory_; }

  /// Set the default search directory.
  void set_directory(const std::string &directory) { directory_ = directory; }

  /** Check whether recursive tree mode is enabled. */
  bool tree() const { return tree_; }

  /// Enable or disable recursive tree mode.
  void set_tree(bool tree) { tree_ = tree; }

  /// Whether symlinked directories are searched.
  bool follow_symlinks() const { return follow_symlinks_; }

  /// Enable or disable following symlinked directories.
  void set_follow_symlinks(bool follow) { follow_symlinks_ = follow; }

  /// Report format.
  OutputFormat format() const { return format_; }

  /// Set report format.
  void set_format(OutputFormat format) { format_ = format; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to log file.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 = no rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace all category log level overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Load configuration from a YAML, TOML, or JSON file.
  static Config from_file(const std::string &path);

  /// Load configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate fields from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  std::string directory_;
  bool tree_ = false;
  bool follow_symlinks_ = false;
  OutputFormat format_ = OutputFormat::Plain;
  std::string log_level_ = "warn";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 0;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace rscan

#endif // REMOTESCAN_CONFIG_HPP
