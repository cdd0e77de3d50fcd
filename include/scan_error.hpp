/**
 * @file scan_error.hpp
 * @brief Exceptions raised while scanning a directory tree.
 */

#ifndef REMOTESCAN_SCAN_ERROR_HPP
#define REMOTESCAN_SCAN_ERROR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace rscan {

/**
 * Fatal failure while walking the search tree.
 *
 * Raised for unreadable directories, entries that vanish mid-walk and paths
 * that cannot be expressed relative to their parent. The offending path is
 * kept so callers can report it.
 */
class ScanError : public std::runtime_error {
public:
  /**
   * @param path Filesystem location the failure relates to.
   * @param message Human readable description, without the path.
   */
  ScanError(std::filesystem::path path, const std::string &message)
      : std::runtime_error(message + ": " + path.string()),
        path_(std::move(path)) {}

  /// Location that triggered the failure.
  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/// A `.git/config` file exists but could not be opened or read.
class GitConfigError : public ScanError {
public:
  using ScanError::ScanError;
};

} // namespace rscan

#endif // REMOTESCAN_SCAN_ERROR_HPP
