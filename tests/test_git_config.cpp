#include "git_config.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <variant>

using rscan::test::TempDir;
using rscan::test::write_git_config;

namespace {
/// Serves a fixed prefix and then fails like a device read error.
class FailingStreambuf : public std::streambuf {
public:
  explicit FailingStreambuf(std::string prefix) : prefix_(std::move(prefix)) {
    setg(prefix_.data(), prefix_.data(), prefix_.data() + prefix_.size());
  }

protected:
  int_type underflow() override {
    throw std::runtime_error("simulated read failure");
  }

private:
  std::string prefix_;
};
} // namespace

TEST_CASE("git config parses a single remote", "[git_config]") {
  TempDir tmp;
  auto path = write_git_config(
      tmp.path,
      "[remote \"origin\"]\n    url = https://github.com/user/repo.git\n");

  auto remotes = rscan::parse_git_config(path);
  REQUIRE(remotes.size() == 1);
  REQUIRE(remotes.at("origin") == "https://github.com/user/repo.git");
}

TEST_CASE("git config parses several remotes", "[git_config]") {
  std::istringstream text(R"(
[core]
	repositoryformatversion = 0
	bare = false
[remote "origin"]
	url = https://github.com/user/repo.git
	fetch = +refs/heads/*:refs/remotes/origin/*
[remote "upstream"]
    url = https://github.com/upstream/repo.git
[branch "main"]
	remote = origin
)");
  auto remotes = rscan::parse_git_config_text(text);
  REQUIRE(remotes.size() == 2);
  REQUIRE(remotes.at("origin") == "https://github.com/user/repo.git");
  REQUIRE(remotes.at("upstream") == "https://github.com/upstream/repo.git");
}

TEST_CASE("git config keeps the last url of a remote", "[git_config]") {
  std::istringstream text("[remote \"origin\"]\n"
                          "url = https://first.example/a.git\n"
                          "url = https://second.example/a.git\n");
  auto remotes = rscan::parse_git_config_text(text);
  REQUIRE(remotes.size() == 1);
  REQUIRE(remotes.at("origin") == "https://second.example/a.git");
}

TEST_CASE("git config ignores urls outside remote sections", "[git_config]") {
  std::istringstream text("url = https://orphan.example/a.git\n"
                          "# url = https://comment.example\n"
                          "[core]\n"
                          "url = https://core.example/a.git\n");
  REQUIRE(rscan::parse_git_config_text(text).empty());
}

TEST_CASE("git config line matching is literal", "[git_config]") {
  std::istringstream text("[remote \"origin\"]\n"
                          "url=https://no-spaces.example\n"
                          "URL = https://upper.example\n"
                          "pushurl = https://push.example\n"
                          "  url = https://kept.example/x.git  \r\n");
  auto remotes = rscan::parse_git_config_text(text);
  REQUIRE(remotes.size() == 1);
  REQUIRE(remotes.at("origin") == "https://kept.example/x.git");
}

TEST_CASE("other sections do not end a remote section", "[git_config]") {
  std::istringstream text("[remote \"origin\"]\n"
                          "[branch \"main\"]\n"
                          "url = https://still-origin.example\n");
  auto remotes = rscan::parse_git_config_text(text);
  REQUIRE(remotes.at("origin") == "https://still-origin.example");
}

TEST_CASE("remote section state transitions", "[git_config]") {
  rscan::RemoteSectionState idle = rscan::NoActiveRemote{};

  auto origin = rscan::advance_section_state(idle, "[remote \"origin\"]");
  REQUIRE(std::holds_alternative<rscan::ActiveRemote>(origin));
  REQUIRE(std::get<rscan::ActiveRemote>(origin).name == "origin");

  auto unchanged = rscan::advance_section_state(origin, "url = x");
  REQUIRE(unchanged == origin);

  auto garbled = rscan::advance_section_state(idle, "[remote \"a\"b\"]");
  REQUIRE(std::get<rscan::ActiveRemote>(garbled).name == "ab");

  auto unnamed = rscan::advance_section_state(idle, "[remote ]");
  REQUIRE(std::get<rscan::ActiveRemote>(unnamed).name.empty());

  REQUIRE(rscan::advance_section_state(idle, "[remote]") == idle);
  REQUIRE(rscan::advance_section_state(idle, "[remotes \"x\"]") == idle);
  REQUIRE(rscan::advance_section_state(idle, "[remote \"x\"") == idle);
}

TEST_CASE("missing config means not a repository", "[git_config]") {
  TempDir tmp;
  REQUIRE_FALSE(rscan::try_extract_remotes(tmp.path).has_value());

  std::filesystem::create_directories(tmp.path / ".git");
  REQUIRE_FALSE(rscan::try_extract_remotes(tmp.path).has_value());
}

TEST_CASE("empty config is a repository without remotes", "[git_config]") {
  TempDir tmp;
  write_git_config(tmp.path, "");
  auto remotes = rscan::try_extract_remotes(tmp.path);
  REQUIRE(remotes.has_value());
  REQUIRE(remotes->empty());

  write_git_config(tmp.path, "[core]\n\tbare = false\n");
  remotes = rscan::try_extract_remotes(tmp.path);
  REQUIRE(remotes.has_value());
  REQUIRE(remotes->empty());
}

TEST_CASE("unreadable config is an error", "[git_config]") {
  TempDir tmp;
  auto path = tmp.path / "does-not-exist" / "config";
  REQUIRE_THROWS_AS(rscan::parse_git_config(path), rscan::GitConfigError);
  try {
    rscan::parse_git_config(path);
  } catch (const rscan::GitConfigError &e) {
    REQUIRE(e.path() == path);
  }
}

TEST_CASE("invalid utf-8 in a config is an error naming the file",
          "[git_config]") {
  TempDir tmp;
  auto path = write_git_config(tmp.path,
                               "[remote \"origin\"]\n    url = https://\xff\xfe\n");
  REQUIRE_THROWS_AS(rscan::try_extract_remotes(tmp.path), rscan::GitConfigError);
  try {
    rscan::parse_git_config(path);
    FAIL("expected GitConfigError");
  } catch (const rscan::GitConfigError &e) {
    REQUIRE(e.path() == path);
  }

  write_git_config(tmp.path, "[remote \"origin\"]\n    url = https://\xc0\xaf\n");
  REQUIRE_THROWS_AS(rscan::parse_git_config(path), rscan::GitConfigError);

  write_git_config(tmp.path,
                   "[remote \"origin\"]\n    url = https://\xe2\x82\n");
  REQUIRE_THROWS_AS(rscan::parse_git_config(path), rscan::GitConfigError);
}

TEST_CASE("multibyte utf-8 in a config is accepted", "[git_config]") {
  TempDir tmp;
  auto path = write_git_config(
      tmp.path, "[remote \"origin\"]\n    url = https://example.com/m\xc3\xbcller.git\n");
  auto remotes = rscan::parse_git_config(path);
  REQUIRE(remotes.at("origin") == "https://example.com/m\xc3\xbcller.git");
}

TEST_CASE("a failing stream stops parsing with an error", "[git_config]") {
  FailingStreambuf buf("[remote \"origin\"]\n    url = https://example.com/a.git\n");
  std::istream input(&buf);
  REQUIRE_THROWS_AS(rscan::parse_git_config_text(input), std::ios_base::failure);
}
