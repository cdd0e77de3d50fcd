#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kDefaultLoggerName = "remotescan";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

/**
 * Build the sink list shared by the default logger and every category.
 *
 * @param file Optional log file path.
 * @param rotate_files Number of rotated files to keep; zero disables rotation.
 * @return Sinks in the order messages should be dispatched.
 */
std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files > 0) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file, kMaxLogFileSize, rotate_files));
  } else {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
  }
  return sinks;
}
} // namespace

namespace rscan {

/**
 * Initialize the global spdlog logger.
 *
 * Re-initialising swaps the sinks of the default logger and of every category
 * logger created so far, so loggers cached by callers keep working.
 *
 * @param level Logging verbosity level for all loggers.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Maximum number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto sinks = make_sinks(file, rotate_files);
  auto logger = spdlog::get(kDefaultLoggerName);
  if (!logger) {
    logger = std::make_shared<spdlog::logger>(kDefaultLoggerName,
                                              sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
  } else {
    logger->flush();
    logger->sinks() = sinks;
    if (spdlog::default_logger() != logger) {
      spdlog::set_default_logger(logger);
    }
  }
  g_logger = logger;
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &registered) {
    if (registered == logger) {
      return;
    }
    registered->flush();
    registered->sinks() = sinks;
    registered->set_level(level);
  });
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::warn);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kDefaultLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto default_logger = spdlog::default_logger();
  if (!default_logger || default_logger.get() != g_logger.lock().get()) {
    lock.unlock();
    init_logger(spdlog::level::warn);
    lock.lock();
    default_logger = spdlog::default_logger();
  }
  const auto &sinks = default_logger->sinks();
  auto new_logger =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  spdlog::initialize_logger(new_logger);
  new_logger->set_level(default_logger->level());
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

} // namespace rscan
