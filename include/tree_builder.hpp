/**
 * @file tree_builder.hpp
 * @brief Builds the tree of repositories found beneath a search root.
 */
#ifndef REMOTESCAN_TREE_BUILDER_HPP
#define REMOTESCAN_TREE_BUILDER_HPP

#include "result_node.hpp"
#include "scan_error.hpp"

#include <filesystem>

namespace rscan {

/// Options controlling how far and through what the builder descends.
struct ScanOptions {
  bool recursive = false;       ///< Descend into every subdirectory level
  bool follow_symlinks = false; ///< Treat symlinks to directories as dirs
};

/**
 * @brief Build the result tree rooted at @p root_directory.
 *
 * The root node always exists and keeps @p root_directory as given. In
 * recursive mode every subdirectory is searched and subtrees without remotes
 * or children are pruned. Otherwise only direct subdirectories are inspected
 * and each repository found becomes a leaf child. Child paths are relative to
 * their parent node.
 *
 * Symlinked directories are skipped unless @ref ScanOptions::follow_symlinks
 * is set; when following, a link back to a directory on the current descent
 * path is skipped to break the cycle.
 *
 * @param root_directory Existing directory to search.
 * @param options Recursion and symlink policy.
 * @return Root of the result tree.
 * @throws ScanError When a directory cannot be enumerated or a child path
 *         cannot be made relative to its parent.
 * @throws GitConfigError When a `.git/config` file cannot be read.
 */
ResultNode build_tree(const std::filesystem::path &root_directory,
                      const ScanOptions &options);

/// Convenience overload using default symlink handling.
ResultNode build_tree(const std::filesystem::path &root_directory,
                      bool recursive);

} // namespace rscan

#endif // REMOTESCAN_TREE_BUILDER_HPP
