/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for remotescan.
 *
 * Declares the CLI parsing entry point, the option structure it fills, and
 * the exception used to request an early exit.
 */

#ifndef REMOTESCAN_CLI_HPP
#define REMOTESCAN_CLI_HPP

#include "render.hpp"
#include <exception>
#include <string>
#include <unordered_map>

namespace rscan {

/**
 * Signals that CLI parsing requested an immediate exit (help, version, parse
 * errors). Carries the exit code back to the entry point without treating it
 * as a fatal error.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * `*_explicit` members record whether a value came from the command line so
 * settings file values can fill in the rest.
 */
struct CliOptions {
  std::string directory;           ///< Directory to search (empty = default)
  bool tree{false};                ///< Recursive tree mode
  bool tree_explicit{false};       ///< True if CLI set tree mode
  OutputFormat format{OutputFormat::Plain}; ///< Report format
  bool format_explicit{false};     ///< True if CLI set the format
  bool follow_symlinks{false};     ///< Search symlinked directories
  bool follow_symlinks_explicit{false};
  std::string config_file;         ///< Optional settings file
  bool verbose{false};             ///< Shortcut for debug logging
  std::string log_level;           ///< Logging level (empty = default)
  std::string log_file;            ///< Optional log file
  int log_rotate{0};               ///< Rotated log files to keep
  bool log_rotate_explicit{false}; ///< True if CLI set log rotation
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides
};

/**
 * Parse command line arguments.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Raw CLI argument strings.
 * @return Populated options structure.
 * @throws CliParseExit When `--help`, `--version` or a parse error requires
 *         the application to exit early. Messages have already been printed.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace rscan

#endif // REMOTESCAN_CLI_HPP
