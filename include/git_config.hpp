/**
 * @file git_config.hpp
 * @brief Extraction of remote declarations from `.git/config` files.
 *
 * Only `[remote "<name>"]` section headers and `url = <value>` lines are
 * interpreted; all other git-config syntax is ignored.
 */
#ifndef REMOTESCAN_GIT_CONFIG_HPP
#define REMOTESCAN_GIT_CONFIG_HPP

#include "result_node.hpp"
#include "scan_error.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace rscan {

/// Parser state before any `[remote ...]` header has been seen.
struct NoActiveRemote {
  bool operator==(const NoActiveRemote &) const { return true; }
};

/// Parser state inside a `[remote ...]` section.
struct ActiveRemote {
  std::string name; ///< Section name with quote characters removed
  bool operator==(const ActiveRemote &other) const {
    return name == other.name;
  }
};

/// Line-to-line state of the remote section parser.
using RemoteSectionState = std::variant<NoActiveRemote, ActiveRemote>;

/**
 * @brief Compute the parser state after a trimmed config line.
 *
 * A line starting with `[remote ` and ending with `]` activates the remote
 * named by the text in between, with `"` characters removed. Every other
 * line leaves the state unchanged.
 *
 * @param state Current parser state.
 * @param trimmed_line Config line without surrounding whitespace.
 * @return Parser state to use for the next line.
 */
RemoteSectionState advance_section_state(const RemoteSectionState &state,
                                         std::string_view trimmed_line);

/**
 * @brief Parse remote declarations from git-config text.
 *
 * @param input Stream positioned at the start of the config text.
 * @return Remote name to URL mapping. Later `url = ` lines for the same remote
 *         replace earlier ones.
 * @throws std::ios_base::failure When the stream reports a read error or a
 *         line is not valid UTF-8.
 */
RemoteMap parse_git_config_text(std::istream &input);

/**
 * @brief Parse remote declarations from a git config file.
 *
 * @param config_path Path to an existing `config` file.
 * @return Remote name to URL mapping, possibly empty.
 * @throws GitConfigError When the file cannot be opened or read, or a line
 *         cannot be decoded as UTF-8 text.
 */
RemoteMap parse_git_config(const std::filesystem::path &config_path);

/**
 * @brief Read the remotes of the repository rooted at @p directory.
 *
 * @param directory Candidate repository root.
 * @return `std::nullopt` when `<directory>/.git/config` is not a regular
 *         file, otherwise the remotes it declares (possibly none).
 * @throws GitConfigError When the config file exists but cannot be read.
 */
std::optional<RemoteMap>
try_extract_remotes(const std::filesystem::path &directory);

} // namespace rscan

#endif // REMOTESCAN_GIT_CONFIG_HPP
