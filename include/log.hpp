/**
 * @file log.hpp
 * @brief Logging utilities for movecred.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef MOVECRED_LOG_HPP
#define MOVECRED_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace movecred {

/**
 * Initialize the global logger with a stderr sink and an optional file sink.
 *
 * Console output goes to stderr so standard output stays reserved for the
 * prompt and confirmation lines.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided. Zero writes a single non-rotating file.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Arbitrary category name used as the logger identifier.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Creates one at warn level on demand when the logging subsystem has not
 * been explicitly initialized.
 */
void ensure_default_logger();

} // namespace movecred

#endif // MOVECRED_LOG_HPP
