/**
 * @file movey_constants.hpp
 * @brief Registry constants shared by the login flow and its tests.
 */

#ifndef MOVECRED_MOVEY_CONSTANTS_HPP
#define MOVECRED_MOVEY_CONSTANTS_HPP

namespace movecred {

#ifdef NDEBUG
inline constexpr const char *kMoveyUrl = "https://movey.net";
#else
inline constexpr const char *kMoveyUrl =
    "https://movey-app-staging.herokuapp.com";
#endif

/// File name of the credential document inside the move home.
inline constexpr const char *kCredentialFileName = "credential.toml";

/// Default move home below the user's home directory.
inline constexpr const char *kDefaultMoveHomeSuffix = "/.move";

} // namespace movecred

#endif // MOVECRED_MOVEY_CONSTANTS_HPP
