#include "app.hpp"
#include "test_support.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using rscan::test::origin_config;
using rscan::test::TempDir;
using rscan::test::write_git_config;

namespace {
struct RunResult {
  int code;
  std::string out;
  std::string err;
};

RunResult run_app(std::vector<std::string> args) {
  args.insert(args.begin(), "remotescan");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  std::ostringstream out;
  std::ostringstream err;
  rscan::App app(out, err);
  int code = app.run(static_cast<int>(args.size()), argv.data());
  return {code, out.str(), err.str()};
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}
} // namespace

TEST_CASE("single repository without tree mode", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path, origin_config("https://example.com/a.git"));

  auto result = run_app({tmp.path.string()});
  REQUIRE(result.code == 0);
  REQUIRE(result.out == "path: " + tmp.path.string() +
                            "\n"
                            "  remotes:\n"
                            "    origin: https://example.com/a.git\n");
}

TEST_CASE("nested repository in tree mode", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path, origin_config("https://github.com/user/repo.git"));
  write_git_config(tmp.path / "subdir",
                   origin_config("https://github.com/user/subrepo.git"));

  auto result = run_app({tmp.path.string(), "-t"});
  REQUIRE(result.code == 0);
  REQUIRE(contains(result.out, "origin: https://github.com/user/repo.git"));
  REQUIRE(contains(result.out, "children:\n  path: subdir\n"));
  REQUIRE(contains(result.out, "origin: https://github.com/user/subrepo.git"));
}

TEST_CASE("directory without repositories prints only the root", "[app]") {
  TempDir tmp;
  fs::create_directories(tmp.path / "empty_dir");

  auto tree = run_app({tmp.path.string(), "--tree"});
  REQUIRE(tree.code == 0);
  REQUIRE(tree.out == "path: " + tmp.path.string() + "\n");

  auto flat = run_app({tmp.path.string()});
  REQUIRE(flat.code == 0);
  REQUIRE(flat.out == "path: " + tmp.path.string() + "\n");
}

TEST_CASE("json output lists remotes by name", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path, origin_config("https://github.com/user/repo.git"));

  auto result = run_app({tmp.path.string(), "-f", "json"});
  REQUIRE(result.code == 0);
  REQUIRE(contains(result.out, "\"path\":"));
  REQUIRE(contains(result.out,
                   "\"origin\": \"https://github.com/user/repo.git\""));
  auto doc = nlohmann::json::parse(result.out);
  REQUIRE(doc["remotes"]["origin"] == "https://github.com/user/repo.git");

  TempDir bare;
  write_git_config(bare.path, "");
  auto empty = run_app({bare.path.string(), "--format", "json"});
  REQUIRE(empty.code == 0);
  REQUIRE_FALSE(contains(empty.out, "\"remotes\""));
}

TEST_CASE("yaml output", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path, origin_config("https://github.com/user/repo.git"));

  auto result = run_app({tmp.path.string(), "-f", "yaml"});
  REQUIRE(result.code == 0);
  REQUIRE(contains(result.out, "path:"));
  REQUIRE(contains(result.out, "remotes:"));
  REQUIRE(contains(result.out, "origin: https://github.com/user/repo.git"));
}

TEST_CASE("repository with several remotes and none", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path, "[remote \"origin\"]\n"
                             "    url = https://github.com/user/repo.git\n"
                             "[remote \"upstream\"]\n"
                             "    url = https://github.com/upstream/repo.git\n");
  auto multi = run_app({tmp.path.string()});
  REQUIRE(multi.code == 0);
  REQUIRE(contains(multi.out, "origin: https://github.com/user/repo.git"));
  REQUIRE(contains(multi.out, "upstream: https://github.com/upstream/repo.git"));

  TempDir none;
  write_git_config(none.path, "");
  auto empty = run_app({none.path.string()});
  REQUIRE(empty.code == 0);
  REQUIRE(contains(empty.out, "path:"));
  REQUIRE_FALSE(contains(empty.out, "remotes:"));
}

TEST_CASE("non-recursive run ignores grandchildren", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path / "outer" / "inner",
                   origin_config("https://example.com/hidden.git"));
  auto result = run_app({tmp.path.string()});
  REQUIRE(result.code == 0);
  REQUIRE_FALSE(contains(result.out, "hidden.git"));

  auto tree = run_app({tmp.path.string(), "-t"});
  REQUIRE(contains(tree.out, "hidden.git"));
}

TEST_CASE("invalid search roots fail", "[app]") {
  auto missing = run_app({"/nonexistent/directory"});
  REQUIRE(missing.code != 0);
  REQUIRE(missing.out.empty());
  REQUIRE(contains(missing.err, "not a directory"));

  TempDir tmp;
  auto file = tmp.path / "file.txt";
  {
    std::ofstream f(file);
    f << "x";
  }
  auto not_dir = run_app({file.string()});
  REQUIRE(not_dir.code != 0);
  REQUIRE(contains(not_dir.err, "not a directory"));
}

TEST_CASE("settings file supplies defaults", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path / "nested" / "repo",
                   origin_config("https://example.com/nested.git"));
  auto settings = tmp.path / "settings.json";
  {
    std::ofstream f(settings);
    nlohmann::json j;
    j["scan"]["directory"] = tmp.path.string();
    j["scan"]["tree"] = true;
    j["output"]["format"] = "json";
    f << j.dump();
  }

  auto result = run_app({"-C", settings.string()});
  REQUIRE(result.code == 0);
  auto doc = nlohmann::json::parse(result.out);
  REQUIRE(doc["path"] == tmp.path.string());
  REQUIRE(doc["children"][0]["path"] == "nested");
  REQUIRE(doc["children"][0]["children"][0]["path"] == "repo");

  auto overridden = run_app({"-C", settings.string(), "-f", "plain"});
  REQUIRE(overridden.code == 0);
  REQUIRE(contains(overridden.out, "path: repo"));

  auto bad = run_app({"-C", (tmp.path / "missing.yaml").string()});
  REQUIRE(bad.code != 0);
  REQUIRE(bad.out.empty());
  REQUIRE(contains(bad.err, "missing.yaml"));
}

TEST_CASE("config path that is a directory is not a repository", "[app]") {
  TempDir tmp;
  fs::create_directories(tmp.path / "odd" / ".git" / "config");
  write_git_config(tmp.path / "good",
                   origin_config("https://example.com/good.git"));

  auto result = run_app({tmp.path.string()});
  REQUIRE(result.code == 0);
  REQUIRE(contains(result.out, "path: good"));
  REQUIRE_FALSE(contains(result.out, "odd"));
}

TEST_CASE("unreadable config aborts without output", "[app]") {
  TempDir tmp;
  write_git_config(tmp.path / "good",
                   origin_config("https://example.com/good.git"));
  auto locked = write_git_config(tmp.path / "locked",
                                 origin_config("https://example.com/x.git"));
  fs::permissions(locked, fs::perms::none);
  if (std::ifstream(locked)) {
    fs::permissions(locked, fs::perms::owner_all);
    SKIP("file permissions are not enforced for this user");
  }

  auto result = run_app({tmp.path.string()});
  fs::permissions(locked, fs::perms::owner_all);
  REQUIRE(result.code != 0);
  REQUIRE(result.out.empty());
  REQUIRE(contains(result.err, locked.string()));
}

TEST_CASE("parse errors and help", "[app]") {
  auto help = run_app({"--help"});
  REQUIRE(help.code == 0);
  REQUIRE(help.out.empty());

  auto bad = run_app({"--format", "xml"});
  REQUIRE(bad.code != 0);
  REQUIRE(bad.out.empty());
}
