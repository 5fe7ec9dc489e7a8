/**
 * @file credential_store.hpp
 * @brief Movey credential file helpers.
 *
 * Declares home directory resolution and the read-modify-write cycle that
 * stores the registry API token in `<move home>/credential.toml`.
 */

#ifndef MOVECRED_CREDENTIAL_STORE_HPP
#define MOVECRED_CREDENTIAL_STORE_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace movecred {

/**
 * Error raised by the credential store and the token prompt.
 *
 * The message is the user-facing diagnostic; the kind identifies the step
 * that failed.
 */
class CredentialError : public std::runtime_error {
public:
  /// Step of the login flow that produced the error.
  enum class Kind {
    Input,       ///< Reading the token from the input stream
    Directory,   ///< Creating the move home
    Open,        ///< Creating the missing credential file
    Read,        ///< Reading the credential file
    Parse,       ///< Parsing the credential file as TOML
    Format,      ///< Document is valid TOML but has an unusable layout
    Write,       ///< Writing the updated document back
    Permissions, ///< Restricting the file mode
  };

  CredentialError(Kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

/**
 * Environment variables that drive home directory resolution.
 *
 * Captured once at the CLI boundary so the store never reads the process
 * environment itself. Empty variables are stored as `std::nullopt`.
 */
struct HomeEnvironment {
  std::optional<std::string> test_move_home; ///< TEST_MOVE_HOME
  std::optional<std::string> move_home;      ///< MOVE_HOME
  std::optional<std::string> home;           ///< HOME

  /**
   * Snapshot the relevant variables from the running process.
   *
   * @return Populated environment snapshot.
   */
  static HomeEnvironment from_process();
};

/// Sandboxed home used by the test suite.
struct TestMode {
  std::string test_path; ///< Suffix appended to TEST_MOVE_HOME (may be empty)
};

/**
 * Resolve the directory that holds the credential file and create it.
 *
 * With a test mode the base is TEST_MOVE_HOME followed by the test path;
 * otherwise MOVE_HOME, falling back to `$HOME/.move`.
 *
 * @param env Environment snapshot.
 * @param test_mode Optional sandbox override.
 * @return The created (or already existing) directory.
 * @throws std::logic_error When a required variable is missing.
 * @throws CredentialError When the directory cannot be created.
 */
std::filesystem::path resolve_home(const HomeEnvironment &env,
                                   const std::optional<TestMode> &test_mode);

/**
 * Path of the credential file inside a move home.
 *
 * @param home Resolved move home.
 * @return `home / credential.toml`.
 */
std::filesystem::path credential_path(const std::filesystem::path &home);

/**
 * Store @p token under `[registry]` in the credential file of @p home.
 *
 * Creates the file when missing, preserves every other key, rewrites the
 * file in full and chmod's it to rw------- on POSIX systems.
 *
 * Concurrent invocations against the same file are last-writer-wins: there
 * is no lock and no atomic rename, so a writer may discard an update that
 * landed after it read the file.
 *
 * @param token Non-empty API token.
 * @param home Resolved move home (must exist).
 * @throws CredentialError On any I/O, parse or permission failure.
 */
void save_credential(const std::string &token,
                     const std::filesystem::path &home);

} // namespace movecred

#endif // MOVECRED_CREDENTIAL_STORE_HPP
