/**
 * @file app.hpp
 * @brief Application orchestrator for remotescan.
 *
 * Declares the App class, which ties together CLI parsing, settings file
 * loading, logger setup, the directory scan and report rendering.
 */

#ifndef REMOTESCAN_APP_HPP
#define REMOTESCAN_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "result_node.hpp"
#include <filesystem>
#include <iosfwd>

namespace rscan {

/**
 * Runs one scan from raw command line arguments to a rendered report.
 */
class App {
public:
  /// Write the report to standard output and errors to standard error.
  App();

  /**
   * Construct an application writing to custom streams.
   *
   * @param out Destination for the rendered report.
   * @param err Destination for user facing error messages.
   */
  App(std::ostream &out, std::ostream &err);

  /**
   * Run the application with the given command line arguments.
   *
   * Nothing is written to the report stream unless the whole scan and the
   * rendering succeed.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Raw CLI arguments.
   * @return Zero on success, non-zero when any step failed.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Settings after merging the settings file with CLI overrides.
  const Config &config() const { return config_; }

  /// Directory that was searched.
  const std::filesystem::path &search_root() const { return search_root_; }

  /// Tree produced by the last successful run.
  const ResultNode &result() const { return result_; }

private:
  void merge_options();
  void setup_logging() const;

  std::ostream &out_;
  std::ostream &err_;
  CliOptions options_;
  Config config_;
  std::filesystem::path search_root_;
  ResultNode result_;
};

} // namespace rscan

#endif // REMOTESCAN_APP_HPP
