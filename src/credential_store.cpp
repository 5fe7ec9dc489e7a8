/**
 * @file credential_store.cpp
 * @brief Credential file read-modify-write implementation.
 */

#include "credential_store.hpp"
#include "log.hpp"
#include "movey_constants.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <ios>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>
#include <toml++/toml.h>

#ifndef _WIN32
#include <sys/stat.h>
#include <sys/types.h>
#endif

namespace movecred {

namespace {
std::shared_ptr<spdlog::logger> credential_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("credential");
  }();
  return logger;
}

/**
 * Read an environment variable, mapping unset and empty values to nullopt.
 *
 * @param name Environment variable name.
 * @return Variable value when set and non-empty.
 */
std::optional<std::string> get_env_var(const char *name) {
#ifdef _WIN32
  char *buf = nullptr;
  size_t sz = 0;
  if (_dupenv_s(&buf, &sz, name) == 0 && buf) {
    std::string value(buf);
    std::free(buf);
    if (!value.empty()) {
      return value;
    }
  }
  return std::nullopt;
#else
  const char *env = std::getenv(name);
  if (env == nullptr || *env == '\0') {
    return std::nullopt;
  }
  return std::string(env);
#endif
}

std::string errno_message(int err) {
  return std::error_code(err, std::generic_category()).message();
}

std::string read_document(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    throw CredentialError(CredentialError::Kind::Read,
                          "Error reading input: " + errno_message(EISDIR));
  }
  errno = 0;
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    int err = errno != 0 ? errno : EIO;
    throw CredentialError(CredentialError::Kind::Read,
                          "Error reading input: " + errno_message(err));
  }
  // istream::read turns a streambuf failure into badbit and, with badbit in
  // the exception mask, rethrows it instead of ending the read early.
  std::string contents;
  try {
    in.exceptions(std::ios::badbit);
    char chunk[4096];
    while (in) {
      in.read(chunk, sizeof(chunk));
      contents.append(chunk, static_cast<std::size_t>(in.gcount()));
    }
  } catch (const std::ios_base::failure &e) {
    int err = errno;
    throw CredentialError(CredentialError::Kind::Read,
                          "Error reading input: " +
                              (err != 0 ? errno_message(err)
                                        : e.code().message()));
  }
  return contents;
}

toml::table parse_document(const std::string &contents,
                           const std::filesystem::path &path) {
  try {
    return toml::parse(contents, path.string());
  } catch (const toml::parse_error &e) {
    std::ostringstream oss;
    oss << "could not parse input as TOML: " << e.description() << " (line "
        << e.source().begin.line << ", column " << e.source().begin.column
        << ")";
    throw CredentialError(CredentialError::Kind::Parse, oss.str());
  }
}

void merge_token(toml::table &document, const std::string &token) {
  toml::node *registry = document.get("registry");
  if (registry == nullptr) {
    document.insert_or_assign("registry", toml::table{{"token", token}});
    return;
  }
  toml::table *registry_table = registry->as_table();
  if (registry_table == nullptr) {
    throw CredentialError(CredentialError::Kind::Format,
                          "credential file entry 'registry' is not a table");
  }
  registry_table->insert_or_assign("token", token);
}

void write_document(const std::filesystem::path &path,
                    const toml::table &document) {
  std::ostringstream rendered;
  rendered << document << '\n';
  errno = 0;
  std::ofstream out(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!out) {
    int err = errno != 0 ? errno : EIO;
    throw CredentialError(CredentialError::Kind::Write,
                          "Error writing file: " + errno_message(err));
  }
  out << rendered.str();
  out.close();
  if (!out) {
    int err = errno != 0 ? errno : EIO;
    throw CredentialError(CredentialError::Kind::Write,
                          "Error writing file: " + errno_message(err));
  }
}

void restrict_permissions(const std::filesystem::path &path) {
#ifndef _WIN32
  if (::chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
    throw CredentialError(CredentialError::Kind::Permissions,
                          "Error setting permissions on " + path.string() +
                              ": " + errno_message(errno));
  }
#else
  (void)path;
#endif
}
} // namespace

HomeEnvironment HomeEnvironment::from_process() {
  HomeEnvironment env;
  env.test_move_home = get_env_var("TEST_MOVE_HOME");
  env.move_home = get_env_var("MOVE_HOME");
  env.home = get_env_var("HOME");
  return env;
}

std::filesystem::path resolve_home(const HomeEnvironment &env,
                                   const std::optional<TestMode> &test_mode) {
  std::string move_home;
  if (test_mode) {
    if (!env.test_move_home) {
      throw std::logic_error("env var 'TEST_MOVE_HOME' must be set");
    }
    move_home = *env.test_move_home;
    if (!test_mode->test_path.empty()) {
      move_home += test_mode->test_path;
    }
  } else if (env.move_home) {
    move_home = *env.move_home;
  } else {
    if (!env.home) {
      throw std::logic_error("env var 'HOME' must be set");
    }
    move_home = *env.home + kDefaultMoveHomeSuffix;
  }

  std::filesystem::path path(move_home);
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw CredentialError(CredentialError::Kind::Directory,
                          "Error creating directory " + move_home + ": " +
                              ec.message());
  }
  credential_log()->debug("Resolved move home '{}'", move_home);
  return path;
}

std::filesystem::path credential_path(const std::filesystem::path &home) {
  return home / kCredentialFileName;
}

/**
 * Merge the token into the credential document and persist it.
 *
 * Each step raises its own CredentialError kind so callers can tell a read
 * failure from a parse or write failure.
 */
void save_credential(const std::string &token,
                     const std::filesystem::path &home) {
  const std::filesystem::path path = credential_path(home);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      throw CredentialError(CredentialError::Kind::Open,
                            "Error opening file " + path.string() + ": " +
                                ec.message());
    }
    errno = 0;
    std::ofstream create(path, std::ios::out | std::ios::app);
    if (!create) {
      int err = errno != 0 ? errno : EIO;
      throw CredentialError(CredentialError::Kind::Open,
                            "Error creating file " + path.string() + ": " +
                                errno_message(err));
    }
    credential_log()->debug("Created empty credential file '{}'",
                            path.string());
  }

  std::string contents = read_document(path);
  toml::table document = parse_document(contents, path);
  merge_token(document, token);
  write_document(path, document);
  restrict_permissions(path);
  credential_log()->info("Stored registry token in '{}'", path.string());
}

} // namespace movecred
