#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "movecred";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::mutex g_thread_pool_mutex;

/**
 * Return the shared async thread pool, creating it when missing.
 *
 * spdlog::shutdown() releases the pool, so it is recreated on demand rather
 * than once per process.
 */
std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  std::lock_guard<std::mutex> lock(g_thread_pool_mutex);
  auto pool = spdlog::thread_pool();
  if (!pool) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
    pool = spdlog::thread_pool();
  }
  return pool;
}
} // namespace

namespace movecred {

/**
 * Initialize the shared async logger.
 *
 * Repeated calls keep the existing sinks and only update level and pattern.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file.empty()) {
      if (rotate_files > 0) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, kMaxLogFileSize, rotate_files));
      } else {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
      }
    }
    logger = std::make_shared<spdlog::async_logger>(
        kRootLoggerName, sinks.begin(), sinks.end(), logging_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  // Category loggers created before this call follow the new level too.
  spdlog::set_level(level);
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
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto root = g_logger.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::warn);
    lock.lock();
    root = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), logging_pool(),
      spdlog::async_overflow_policy::block);
  new_logger->set_level(root ? root->level() : spdlog::level::warn);
  spdlog::register_logger(new_logger);
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

} // namespace movecred
