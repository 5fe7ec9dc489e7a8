/**
 * @file token_prompt.hpp
 * @brief Interactive API token prompt.
 */

#ifndef MOVECRED_TOKEN_PROMPT_HPP
#define MOVECRED_TOKEN_PROMPT_HPP

#include <iosfwd>
#include <string>

namespace movecred {

/**
 * Build the prompt line that points the user at the registry token page.
 *
 * @param url Registry base URL.
 * @return Prompt text without a trailing newline.
 */
std::string token_prompt_message(const std::string &url);

/**
 * Ask for an API token and read it from @p in.
 *
 * Prints the prompt once, then reads lines until a non-empty one arrives,
 * printing a retry message for every blank line. A trailing `\r` is
 * stripped so CRLF input behaves like LF input.
 *
 * @param in Stream the token is read from.
 * @param out Stream the prompt and retry messages are written to.
 * @param url Registry base URL shown in the prompt.
 * @return The token with line terminators removed.
 * @throws CredentialError When the stream fails or ends before a token is
 *         read.
 */
std::string prompt_token(std::istream &in, std::ostream &out,
                         const std::string &url);

} // namespace movecred

#endif // MOVECRED_TOKEN_PROMPT_HPP
