/**
 * @file git_config.cpp
 * @brief Implements remote extraction from `.git/config` files.
 */
#include "git_config.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

namespace rscan {

namespace {

constexpr std::string_view kRemotePrefix = "[remote ";
constexpr std::string_view kSectionSuffix = "]";
constexpr std::string_view kUrlPrefix = "url = ";

std::shared_ptr<spdlog::logger> git_config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git.config");
  }();
  return logger;
}

/**
 * Trim whitespace from both ends of a string.
 *
 * @param s Input string possibly containing leading/trailing whitespace.
 * @return View of the string without surrounding whitespace.
 */
std::string_view trim(std::string_view s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end())
    return {};
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return s.substr(static_cast<std::size_t>(first - s.begin()),
                  static_cast<std::size_t>(last - first));
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

/**
 * Check that a line is well-formed UTF-8.
 *
 * Overlong encodings, surrogate code points and values above U+10FFFF are
 * rejected.
 */
bool is_valid_utf8(std::string_view s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto lead = static_cast<unsigned char>(s[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }
    std::size_t extra = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      extra = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      extra = 2;
      if (lead == 0xE0)
        min_second = 0xA0;
      else if (lead == 0xED)
        max_second = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      extra = 3;
      if (lead == 0xF0)
        min_second = 0x90;
      else if (lead == 0xF4)
        max_second = 0x8F;
    } else {
      return false;
    }
    if (s.size() - i <= extra)
      return false;
    const auto second = static_cast<unsigned char>(s[i + 1]);
    if (second < min_second || second > max_second)
      return false;
    for (std::size_t k = 2; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(s[i + k]);
      if (cont < 0x80 || cont > 0xBF)
        return false;
    }
    i += extra + 1;
  }
  return true;
}

} // namespace

RemoteSectionState advance_section_state(const RemoteSectionState &state,
                                         std::string_view trimmed_line) {
  if (trimmed_line.size() < kRemotePrefix.size() + kSectionSuffix.size() ||
      !starts_with(trimmed_line, kRemotePrefix) ||
      !ends_with(trimmed_line, kSectionSuffix)) {
    return state;
  }
  std::string_view body = trimmed_line.substr(
      kRemotePrefix.size(),
      trimmed_line.size() - kRemotePrefix.size() - kSectionSuffix.size());
  std::string name;
  name.reserve(body.size());
  std::copy_if(body.begin(), body.end(), std::back_inserter(name),
               [](char c) { return c != '"'; });
  return ActiveRemote{std::move(name)};
}

RemoteMap parse_git_config_text(std::istream &input) {
  RemoteMap remotes;
  RemoteSectionState state = NoActiveRemote{};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (!is_valid_utf8(line)) {
      throw std::ios_base::failure("line " + std::to_string(line_number) +
                                   " is not valid UTF-8");
    }
    std::string_view trimmed = trim(line);
    state = advance_section_state(state, trimmed);
    if (!starts_with(trimmed, kUrlPrefix))
      continue;
    if (const auto *active = std::get_if<ActiveRemote>(&state)) {
      remotes[active->name] = std::string(trimmed.substr(kUrlPrefix.size()));
    }
  }
  if (input.bad()) {
    throw std::ios_base::failure("read error while parsing git config");
  }
  return remotes;
}

RemoteMap parse_git_config(const std::filesystem::path &config_path) {
  std::ifstream config(config_path);
  if (!config) {
    git_config_log()->error("Failed to open git config {}",
                            config_path.string());
    throw GitConfigError(config_path, "Failed to open git config file");
  }
  try {
    auto remotes = parse_git_config_text(config);
    git_config_log()->debug("Parsed {} remote(s) from {}", remotes.size(),
                            config_path.string());
    return remotes;
  } catch (const std::ios_base::failure &e) {
    git_config_log()->error("Failed to read git config {}: {}",
                            config_path.string(), e.what());
    throw GitConfigError(config_path,
                         std::string("Failed to read line from git config (") +
                             e.what() + ")");
  }
}

std::optional<RemoteMap>
try_extract_remotes(const std::filesystem::path &directory) {
  const auto config_path = directory / ".git" / "config";
  std::error_code ec;
  if (!std::filesystem::is_regular_file(config_path, ec)) {
    return std::nullopt;
  }
  return parse_git_config(config_path);
}

} // namespace rscan
