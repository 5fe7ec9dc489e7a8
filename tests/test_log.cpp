#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

TEST_CASE("test log", "[log]") {
  const char *path = "movecred_test.log";
  std::remove(path);
  // Start from an empty registry so the file sink is attached.
  spdlog::shutdown();
  movecred::init_logger(spdlog::level::info, "", path, 0);
  spdlog::debug("debug message");
  spdlog::info("info message");
  movecred::category_logger("credential")->info("category message");
  movecred::category_logger("login")->debug("quiet category message");
  spdlog::shutdown();
  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  REQUIRE(content.find("[movecred.credential]") != std::string::npos);
  REQUIRE(content.find("quiet category message") == std::string::npos);
  f.close();
  std::remove(path);
}

TEST_CASE("log category overrides", "[log]") {
  const char *path = "movecred_categories.log";
  std::remove(path);
  // Start from an empty registry so the file sink is attached.
  spdlog::shutdown();
  movecred::init_logger(spdlog::level::warn, "", path, 0);
  movecred::configure_log_categories(
      {{"credential", spdlog::level::debug}});
  movecred::category_logger("credential")->debug("credential detail");
  movecred::category_logger("login")->info("login detail");
  spdlog::shutdown();
  std::ifstream f(path);
  REQUIRE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
  REQUIRE(content.find("credential detail") != std::string::npos);
  REQUIRE(content.find("login detail") == std::string::npos);
  f.close();
  std::remove(path);
}
