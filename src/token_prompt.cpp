#include "token_prompt.hpp"
#include "credential_store.hpp"

#include <cerrno>
#include <istream>
#include <ostream>
#include <string>
#include <system_error>

namespace movecred {

std::string token_prompt_message(const std::string &url) {
  return "Please paste the API Token found on " + url +
         "/settings/tokens below";
}

std::string prompt_token(std::istream &in, std::ostream &out,
                         const std::string &url) {
  out << token_prompt_message(url) << std::endl;
  std::string line;
  while (true) {
    errno = 0;
    if (!std::getline(in, line)) {
      if (in.bad()) {
        int err = errno != 0 ? errno : EIO;
        throw CredentialError(
            CredentialError::Kind::Input,
            "Error reading file: " +
                std::error_code(err, std::generic_category()).message());
      }
      // getline only fails without extracting anything at end of input.
      throw CredentialError(CredentialError::Kind::Input,
                            "Error reading file: unexpected end of input");
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      return line;
    }
    out << "Invalid API Token. Try again!" << std::endl;
  }
}

} // namespace movecred
