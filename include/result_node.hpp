/**
 * @file result_node.hpp
 * @brief Tree of discovered repository locations.
 */

#ifndef REMOTESCAN_RESULT_NODE_HPP
#define REMOTESCAN_RESULT_NODE_HPP

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace rscan {

/// Remote name -> remote URL, ordered by name.
using RemoteMap = std::map<std::string, std::string>;

/**
 * One filesystem location of interest.
 *
 * The root node stores the search path as given. Every other node stores its
 * path relative to its immediate parent node.
 */
struct ResultNode {
  std::filesystem::path path;     ///< Root path or path relative to parent
  RemoteMap remotes;              ///< Remotes declared in `.git/config`
  std::vector<ResultNode> children; ///< Child nodes in enumeration order

  /// True when the node carries remotes or children.
  bool has_content() const { return !remotes.empty() || !children.empty(); }
};

} // namespace rscan

#endif // REMOTESCAN_RESULT_NODE_HPP
