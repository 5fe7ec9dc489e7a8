#include "credential_store.hpp"
#include "movey_constants.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using movecred::HomeEnvironment;
using movecred::resolve_home;
using movecred::TestMode;
using namespace movecred::test;

TEST_CASE("test mode appends the test path to TEST_MOVE_HOME", "[home]") {
  auto base = scratch_dir("home_test_mode");
  HomeEnvironment env;
  env.test_move_home = base.string();
  env.move_home = (base / "ignored").string();

  auto home = resolve_home(env, TestMode{"/nested/sandbox"});

  REQUIRE(home == fs::path(base.string() + "/nested/sandbox"));
  REQUIRE(fs::is_directory(home));
  REQUIRE_FALSE(fs::exists(base / "ignored"));
  clean_up(base);
}

TEST_CASE("test mode with an empty path uses TEST_MOVE_HOME", "[home]") {
  auto base = scratch_dir("home_test_mode_empty");
  HomeEnvironment env;
  env.test_move_home = base.string();

  auto home = resolve_home(env, TestMode{""});

  REQUIRE(home == base);
  REQUIRE(fs::is_directory(base));
  clean_up(base);
}

TEST_CASE("test mode without TEST_MOVE_HOME is a contract violation",
          "[home]") {
  HomeEnvironment env;
  env.move_home = "/unused";
  env.home = "/unused";
  REQUIRE_THROWS_AS(resolve_home(env, TestMode{"/x"}), std::logic_error);
}

TEST_CASE("MOVE_HOME is used outside test mode", "[home]") {
  auto base = scratch_dir("home_move_home");
  HomeEnvironment env;
  env.test_move_home = (base / "test").string();
  env.move_home = (base / "a" / "b").string();
  env.home = (base / "user").string();

  auto home = resolve_home(env, std::nullopt);

  REQUIRE(home == base / "a" / "b");
  REQUIRE(fs::is_directory(home));
  REQUIRE_FALSE(fs::exists(base / "test"));
  REQUIRE_FALSE(fs::exists(base / "user"));
  clean_up(base);
}

TEST_CASE("HOME/.move is the default move home", "[home]") {
  auto base = scratch_dir("home_default");
  HomeEnvironment env;
  env.home = base.string();

  auto home = resolve_home(env, std::nullopt);

  REQUIRE(home == fs::path(base.string() + movecred::kDefaultMoveHomeSuffix));
  REQUIRE(fs::is_directory(base / ".move"));
  clean_up(base);
}

TEST_CASE("missing HOME without MOVE_HOME is a contract violation",
          "[home]") {
  HomeEnvironment env;
  REQUIRE_THROWS_AS(resolve_home(env, std::nullopt), std::logic_error);
}

TEST_CASE("directory creation failures are reported", "[home]") {
  auto base = scratch_dir("home_blocked");
  write_file(base / "blocker", "not a directory");
  HomeEnvironment env;
  env.move_home = (base / "blocker" / "home").string();

  try {
    resolve_home(env, std::nullopt);
    FAIL("expected a directory error");
  } catch (const movecred::CredentialError &e) {
    REQUIRE(e.kind() == movecred::CredentialError::Kind::Directory);
  }
  clean_up(base);
}

TEST_CASE("environment snapshot treats empty variables as unset", "[home]") {
  ScopedEnv test_home("TEST_MOVE_HOME", "/tmp/movecred-test-home");
  ScopedEnv move_home("MOVE_HOME", "");
  ScopedEnv home("HOME", "/home/someone");

  HomeEnvironment env = HomeEnvironment::from_process();

  REQUIRE(env.test_move_home == std::optional<std::string>(
                                    "/tmp/movecred-test-home"));
  REQUIRE_FALSE(env.move_home.has_value());
  REQUIRE(env.home == std::optional<std::string>("/home/someone"));
}

TEST_CASE("scoped environment overrides restore prior values", "[home]") {
  unset_env("MOVECRED_SCOPED_UNSET");
  set_env("MOVECRED_SCOPED_SET", "before");
  {
    ScopedEnv set("MOVECRED_SCOPED_SET", "during");
    ScopedEnv unset("MOVECRED_SCOPED_UNSET", "during");
    REQUIRE(std::string(std::getenv("MOVECRED_SCOPED_SET")) == "during");
    REQUIRE(std::string(std::getenv("MOVECRED_SCOPED_UNSET")) == "during");
  }
  REQUIRE(std::string(std::getenv("MOVECRED_SCOPED_SET")) == "before");
  REQUIRE(std::getenv("MOVECRED_SCOPED_UNSET") == nullptr);
  unset_env("MOVECRED_SCOPED_SET");
}

TEST_CASE("environment snapshot leaves HOME as it found it", "[home]") {
  const char *before = std::getenv("HOME");
  std::optional<std::string> prior;
  if (before != nullptr) {
    prior = std::string(before);
  }
  {
    ScopedEnv home("HOME", "/home/someone-else");
    REQUIRE(HomeEnvironment::from_process().home ==
            std::optional<std::string>("/home/someone-else"));
  }
  const char *after = std::getenv("HOME");
  if (prior) {
    REQUIRE(after != nullptr);
    REQUIRE(std::string(after) == *prior);
  } else {
    REQUIRE(after == nullptr);
  }
}
