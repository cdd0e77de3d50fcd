#include "app.hpp"
#include "log.hpp"
#include "render.hpp"
#include "tree_builder.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace rscan {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

/**
 * Translate a level name, falling back to warnings for unknown names.
 */
spdlog::level::level_enum parse_level(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    app_log()->warn("Ignoring invalid log level '{}'", name);
    return spdlog::level::warn;
  }
  return level;
}
} // namespace

App::App() : App(std::cout, std::cerr) {}

App::App(std::ostream &out, std::ostream &err) : out_(out), err_(err) {}

/**
 * Combine CLI options with the settings file. Values given on the command
 * line always win; the settings object is updated so it reflects the
 * effective configuration.
 */
void App::merge_options() {
  if (options_.tree_explicit) {
    config_.set_tree(options_.tree);
  }
  if (options_.follow_symlinks_explicit) {
    config_.set_follow_symlinks(options_.follow_symlinks);
  }
  if (options_.format_explicit) {
    config_.set_format(options_.format);
  }
  if (!options_.directory.empty()) {
    config_.set_directory(options_.directory);
  }
  if (options_.verbose) {
    config_.set_log_level("debug");
  }
  if (!options_.log_level.empty()) {
    config_.set_log_level(options_.log_level);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  }
}

void App::setup_logging() const {
  init_logger(parse_level(config_.log_level()), config_.log_pattern(),
              config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()));
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    category_levels[category] = parse_level(level_str);
  }
  configure_log_categories(category_levels);
}

/**
 * Execute one scan.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero on any failure.
 */
int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  } catch (const std::exception &e) {
    err_ << "error: " << e.what() << '\n';
    return 1;
  }

  try {
    config_ = options_.config_file.empty()
                  ? Config{}
                  : Config::from_file(options_.config_file);
    merge_options();
    setup_logging();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    err_ << "error: " << e.what() << '\n';
    return 1;
  }

  std::error_code ec;
  search_root_ = config_.directory().empty()
                     ? std::filesystem::current_path(ec)
                     : std::filesystem::path(config_.directory());
  if (ec) {
    err_ << "error: Failed to get current directory: " << ec.message()
         << '\n';
    return 1;
  }
  if (!std::filesystem::is_directory(search_root_, ec)) {
    app_log()->error("Search root {} is not a directory",
                     search_root_.string());
    err_ << "error: The specified path is not a directory: "
         << search_root_.string() << '\n';
    return 1;
  }

  ScanOptions scan;
  scan.recursive = config_.tree();
  scan.follow_symlinks = config_.follow_symlinks();
  app_log()->debug("Searching {} (tree={}, follow_symlinks={}, format={})",
                   search_root_.string(), scan.recursive,
                   scan.follow_symlinks, to_string(config_.format()));
  std::ostringstream report;
  try {
    result_ = build_tree(search_root_, scan);
    render(result_, config_.format(), report);
  } catch (const ScanError &e) {
    app_log()->error("Scan failed: {}", e.what());
    err_ << "error: Error while searching for .git/config files: "
         << e.what() << '\n';
    return 1;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    err_ << "error: " << e.what() << '\n';
    return 1;
  }
  out_ << report.str();
  out_.flush();
  return 0;
}

} // namespace rscan
