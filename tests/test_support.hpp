#ifndef REMOTESCAN_TEST_SUPPORT_HPP
#define REMOTESCAN_TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace rscan::test {

/// Unique directory under the system temp dir, removed on destruction.
struct TempDir {
  std::filesystem::path path;

  explicit TempDir(const std::string &prefix = "remotescan") {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() /
           (prefix + "_" + std::to_string(stamp) + "_" +
            std::to_string(counter++));
    std::filesystem::create_directories(path);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;
};

/// Create `<dir>/.git/config` with the given content.
inline std::filesystem::path write_git_config(const std::filesystem::path &dir,
                                              const std::string &content) {
  std::filesystem::create_directories(dir / ".git");
  auto config_path = dir / ".git" / "config";
  std::ofstream cfg(config_path, std::ios::binary);
  cfg << content;
  return config_path;
}

inline std::string origin_config(const std::string &url) {
  return "[remote \"origin\"]\n    url = " + url + "\n";
}

} // namespace rscan::test

#endif // REMOTESCAN_TEST_SUPPORT_HPP
