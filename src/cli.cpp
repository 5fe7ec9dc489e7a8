#include "cli.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace movecred {

namespace {
std::string log_category_help_text() {
  static const std::array<std::string_view, 4> categories = {
      "app", "credential", "logging", "login"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "credential=debug).";
  return oss.str();
}
} // namespace

/**
 * Parse the command line for the `move` executable.
 *
 * Global logging options precede the subcommand; `movey-login` (alias
 * `login`) accepts the hidden `--test-path` option used by the test suite to
 * sandbox the move home below TEST_MOVE_HOME.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Move package manager credential commands", "move"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "move " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->default_val("warn")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "critical", "off"}))
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  CLI::App *login = app.add_subcommand(
      "movey-login", "Save the Movey API token to the credential file");
  login->alias("login");
  std::string test_path;
  // An empty group hides the option from --help.
  CLI::Option *test_path_option =
      login->add_option("--test-path", test_path,
                        "Sandbox suffix appended to TEST_MOVE_HOME")
          ->type_name("SUFFIX")
          ->group("");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (login->parsed()) {
    options.command = Command::MoveyLogin;
    if (test_path_option->count() > 0U) {
      options.test_path = test_path;
    }
  }
  if (options.verbose && options.log_level == "warn") {
    options.log_level = "debug";
  }
  return options;
}

} // namespace movecred
