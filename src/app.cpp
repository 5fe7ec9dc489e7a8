#include "app.hpp"
#include "log.hpp"
#include "login.hpp"
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace movecred {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

int App::run(int argc, char **argv) {
  return run(argc, argv, std::cin, std::cout, HomeEnvironment::from_process());
}

/**
 * Execute the main application flow.
 *
 * Every failure is logged once through the `app` category logger and mapped
 * to an exit code; nothing is retried.
 */
int App::run(int argc, char **argv, std::istream &in, std::ostream &out,
             const HomeEnvironment &env) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  configure_logging();

  try {
    switch (options_.command) {
    case Command::MoveyLogin:
      handle_login(options_.test_path, env, in, out);
      break;
    }
  } catch (const CredentialError &e) {
    app_log()->error("{}", e.what());
    return kExitFailure;
  } catch (const std::logic_error &e) {
    app_log()->critical("{}", e.what());
    return kExitContractViolation;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return kExitFailure;
  }
  return 0;
}

void App::configure_logging() const {
  spdlog::level::level_enum lvl = spdlog::level::warn;
  try {
    lvl = spdlog::level::from_str(options_.log_level);
  } catch (const spdlog::spdlog_ex &) {
    // keep default
  }
  init_logger(lvl, "", options_.log_file,
              static_cast<std::size_t>(options_.log_rotate));
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : options_.log_categories) {
    auto level = spdlog::level::from_str(level_str);
    if (level == spdlog::level::off && level_str != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
  app_log()->debug("Running command with log level {}", options_.log_level);
}

} // namespace movecred
