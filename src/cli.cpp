#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace rscan {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 7> categories = {
      "app", "cli", "config", "git.config", "logging", "render", "tree"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., tree=debug).";
  return oss.str();
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Find git repositories below a directory and list their "
               "remotes"};
  app.footer(log_category_help_text());
  CliOptions options;
  std::string format_str;
  std::vector<std::string> category_values;

  app.add_option("directory", options.directory,
                 "Directory to search in (defaults to current directory)")
      ->type_name("DIR");
  auto *tree_flag =
      app.add_flag("-t,--tree", options.tree,
                   "Recursively search through subdirectories")
          ->group("Search");
  auto *symlink_flag =
      app.add_flag("--follow-symlinks", options.follow_symlinks,
                   "Descend into symlinked directories")
          ->group("Search");
  auto *format_option =
      app.add_option("-f,--format", format_str, "Output format")
          ->type_name("FORMAT")
          ->transform(CLI::IsMember({"plain", "yaml", "json"},
                                    CLI::ignore_case))
          ->group("Output");
  app.add_option("-C,--config", options.config_file,
                 "Path to settings file (YAML, JSON or TOML)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "remotescan " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->transform(CLI::IsMember({"trace", "debug", "info", "warn", "error",
                                 "critical", "off"},
                                CLI::ignore_case))
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_option("--log-category", category_values,
                 "Set a logging category level (NAME or NAME=LEVEL). See "
                 "help footer for available categories.")
      ->type_name("NAME[=LEVEL]")
      ->allow_extra_args(false)
      ->group("Logging");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  for (const auto &value : category_values) {
    auto pos = value.find('=');
    std::string name = pos == std::string::npos ? value : value.substr(0, pos);
    std::string level =
        pos == std::string::npos ? std::string{} : value.substr(pos + 1);
    if (name.empty()) {
      std::cerr << "--log-category: category name must not be empty"
                << std::endl;
      throw CliParseExit(static_cast<int>(CLI::ExitCodes::ValidationError));
    }
    options.log_categories[name] = level.empty() ? "debug" : level;
  }
  options.tree_explicit = tree_flag->count() > 0U;
  options.follow_symlinks_explicit = symlink_flag->count() > 0U;
  if (format_option->count() > 0U) {
    options.format = output_format_from_string(format_str);
    options.format_explicit = true;
  }
  cli_log()->debug("Parsed CLI: directory='{}' tree={} format={}",
                   options.directory, options.tree,
                   to_string(options.format));
  return options;
}

} // namespace rscan
