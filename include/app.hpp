/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for movecred.
 *
 * Declares the App class, which parses the command line, configures logging
 * and dispatches to the selected subcommand.
 */

#ifndef MOVECRED_APP_HPP
#define MOVECRED_APP_HPP

#include "cli.hpp"
#include "credential_store.hpp"
#include <iosfwd>

namespace movecred {

/// Exit code for runtime failures (I/O, parse, permissions, bad arguments).
inline constexpr int kExitFailure = 1;
/// Exit code for caller contract violations such as a missing TEST_MOVE_HOME.
inline constexpr int kExitContractViolation = 2;

/**
 * Main application entry point responsible for CLI parsing, logger setup and
 * command dispatch.
 */
class App {
public:
  /**
   * Run the application against the process streams and environment.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Process exit code.
   */
  int run(int argc, char **argv);

  /**
   * Run the application with explicit streams and environment.
   *
   * @param argc Number of CLI arguments.
   * @param argv Raw CLI arguments.
   * @param in Stream the login token is read from.
   * @param out Stream receiving the prompt and confirmation.
   * @param env Environment snapshot used for home resolution.
   * @return Zero on success, kExitFailure or kExitContractViolation on
   *         error, or the CLI11 exit code for help/version/parse errors.
   */
  int run(int argc, char **argv, std::istream &in, std::ostream &out,
          const HomeEnvironment &env);

  /// Parsed command line options of the last run.
  const CliOptions &options() const { return options_; }

private:
  void configure_logging() const;

  CliOptions options_;
};

} // namespace movecred

#endif // MOVECRED_APP_HPP
