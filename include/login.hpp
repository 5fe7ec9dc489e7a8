/**
 * @file login.hpp
 * @brief Movey login command.
 *
 * Declares the top-level flow that prompts for an API token and stores it in
 * the user's credential file.
 */

#ifndef MOVECRED_LOGIN_HPP
#define MOVECRED_LOGIN_HPP

#include "credential_store.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace movecred {

/**
 * Prompt for a token and save it to the resolved credential file.
 *
 * Prints the prompt, reads a non-empty token from @p in, resolves the move
 * home from @p env (sandboxed when @p test_path is set), stores the token
 * and prints a confirmation. Nothing is printed after a failure.
 *
 * @param test_path Optional suffix enabling test mode.
 * @param env Environment snapshot used for home resolution.
 * @param in Token input stream.
 * @param out Prompt and confirmation output stream.
 * @throws CredentialError On input, I/O, parse or permission failures.
 * @throws std::logic_error When a required environment variable is missing.
 */
void handle_login(const std::optional<std::string> &test_path,
                  const HomeEnvironment &env, std::istream &in,
                  std::ostream &out);

} // namespace movecred

#endif // MOVECRED_LOGIN_HPP
