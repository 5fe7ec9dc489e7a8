#include "login.hpp"
#include "log.hpp"
#include "movey_constants.hpp"
#include "token_prompt.hpp"

#include <memory>
#include <ostream>

#include <spdlog/spdlog.h>

namespace movecred {

namespace {
std::shared_ptr<spdlog::logger> login_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("login");
  }();
  return logger;
}
} // namespace

void handle_login(const std::optional<std::string> &test_path,
                  const HomeEnvironment &env, std::istream &in,
                  std::ostream &out) {
  std::string token = prompt_token(in, out, kMoveyUrl);
  std::optional<TestMode> test_mode;
  if (test_path) {
    test_mode = TestMode{*test_path};
    login_log()->debug("Test mode enabled with path '{}'", *test_path);
  }
  auto home = resolve_home(env, test_mode);
  save_credential(token, home);
  out << "Token for Movey saved." << std::endl;
}

} // namespace movecred
