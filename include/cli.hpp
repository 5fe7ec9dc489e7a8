/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for movecred.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the `move` executable.
 */

#ifndef MOVECRED_CLI_HPP
#define MOVECRED_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace movecred {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command {
  MoveyLogin, ///< Prompt for a Movey API token and store it
};

/**
 * Parsed command line options supplied via the CLI.
 */
struct CliOptions {
  Command command{Command::MoveyLogin}; ///< Selected subcommand
  bool verbose = false;                 ///< Shortcut for --log-level debug
  std::string log_level = "warn";       ///< Logging verbosity level
  std::string log_file;                 ///< Optional path to a log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI

  // Testing utilities
  std::optional<std::string>
      test_path; ///< Sandbox suffix below TEST_MOVE_HOME (hidden flag)
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing fails or `--help`/`--version` request an
 *         early exit. CLI11 has already printed the message in that case.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace movecred

#endif // MOVECRED_CLI_HPP
