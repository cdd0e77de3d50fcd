/**
 * @file tree_builder.cpp
 * @brief Implements the depth-first directory walk producing ResultNode trees.
 */
#include "tree_builder.hpp"
#include "git_config.hpp"
#include "log.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace rscan {

namespace {

namespace fs = std::filesystem;

/// Canonical paths of the directories on the current descent path.
using Ancestry = std::vector<fs::path>;

std::shared_ptr<spdlog::logger> tree_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tree");
  }();
  return logger;
}

/**
 * Express @p child relative to @p parent.
 *
 * @throws ScanError When the paths share no usable prefix.
 */
fs::path relative_to(const fs::path &child, const fs::path &parent) {
  fs::path rel = child.lexically_relative(parent);
  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    throw ScanError(child,
                    "Failed to make path relative to " + parent.string());
  }
  return rel;
}

std::optional<fs::path> canonical_path(const fs::path &path) {
  std::error_code ec;
  auto canonical = fs::canonical(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return canonical;
}

/**
 * Decide whether a directory entry should be inspected as a directory.
 *
 * Broken links and entries whose type cannot be determined are treated as
 * non-directories.
 */
bool is_searchable_directory(const fs::directory_entry &entry,
                             const ScanOptions &options,
                             const Ancestry &ancestry) {
  std::error_code ec;
  if (entry.is_symlink(ec)) {
    if (!options.follow_symlinks) {
      tree_log()->debug("Skipping symlink {}", entry.path().string());
      return false;
    }
    if (!entry.is_directory(ec) || ec) {
      return false;
    }
    auto target = canonical_path(entry.path());
    if (!target) {
      return false;
    }
    if (std::find(ancestry.begin(), ancestry.end(), *target) !=
        ancestry.end()) {
      tree_log()->warn("Skipping symlink cycle {} -> {}",
                       entry.path().string(), target->string());
      return false;
    }
    return true;
  }
  ec.clear();
  return entry.is_directory(ec) && !ec;
}

ResultNode build_node(const fs::path &directory, const ScanOptions &options,
                      Ancestry &ancestry) {
  tree_log()->debug("Scanning {}", directory.string());
  ResultNode node;
  node.path = directory;
  if (auto remotes = try_extract_remotes(directory)) {
    tree_log()->debug("Found repository {} ({} remote(s))", directory.string(),
                      remotes->size());
    node.remotes = std::move(*remotes);
  }

  const bool track_ancestry = options.recursive && options.follow_symlinks;
  if (track_ancestry) {
    if (auto canonical = canonical_path(directory)) {
      ancestry.push_back(*canonical);
    } else {
      ancestry.push_back(directory);
    }
  }

  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    const fs::directory_entry &entry = *it;
    if (!is_searchable_directory(entry, options, ancestry)) {
      continue;
    }
    const fs::path &child_path = entry.path();
    if (options.recursive) {
      ResultNode child = build_node(child_path, options, ancestry);
      if (!child.has_content()) {
        continue;
      }
      child.path = relative_to(child_path, directory);
      node.children.push_back(std::move(child));
    } else if (auto remotes = try_extract_remotes(child_path)) {
      tree_log()->debug("Found repository {} ({} remote(s))",
                        child_path.string(), remotes->size());
      ResultNode child;
      child.path = relative_to(child_path, directory);
      child.remotes = std::move(*remotes);
      node.children.push_back(std::move(child));
    }
  }
  if (ec) {
    tree_log()->error("Failed to read directory {}: {}", directory.string(),
                      ec.message());
    throw ScanError(directory, "Failed to read directory (" + ec.message() +
                                   ")");
  }

  if (track_ancestry) {
    ancestry.pop_back();
  }
  return node;
}

} // namespace

ResultNode build_tree(const std::filesystem::path &root_directory,
                      const ScanOptions &options) {
  Ancestry ancestry;
  ResultNode root = build_node(root_directory, options, ancestry);
  tree_log()->debug("Scan of {} finished with {} top-level child(ren)",
                    root_directory.string(), root.children.size());
  return root;
}

ResultNode build_tree(const std::filesystem::path &root_directory,
                      bool recursive) {
  ScanOptions options;
  options.recursive = recursive;
  return build_tree(root_directory, options);
}

} // namespace rscan
