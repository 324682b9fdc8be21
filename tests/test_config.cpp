#include "hotkey/config.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using hotkey::ConfigResult;
using hotkey::Key;
using hotkey::Modifier;

hotkey::ConfigLoadOutcome parse(const char *text) {
  std::istringstream in{text};
  return hotkey::parse_config(in);
}

void test_defaults() {
  hotkey::Config config;
  CHECK(!config.general.verbose);
  CHECK(config.general.poll_interval == std::chrono::milliseconds{100});
  CHECK(config.bindings.empty());
  CHECK(hotkey::validate_config(config));

  auto out = parse("");
  CHECK(out.result == ConfigResult::Ok);
  CHECK(out.config.bindings.empty());
}

void test_full_file() {
  auto out = parse("# hotkey-listen\n"
                   "general:\n"
                   "  verbose: yes\n"
                   "  poll_interval: 250   # ms\n"
                   "  unknown_key: 42\n"
                   "\n"
                   "bindings:\n"
                   "  - Ctrl+Shift+KeyS\n"
                   "  - Alt+KeyF1 # comment\n");
  CHECK(out.result == ConfigResult::Ok);
  CHECK(out.error.empty());
  CHECK(out.config.general.verbose);
  CHECK(out.config.general.poll_interval == std::chrono::milliseconds{250});
  CHECK(out.config.bindings.size() == 2);
  CHECK(out.config.bindings[0].key == Key::S);
  CHECK(out.config.bindings[0].to_string() == "S+Ctrl+Shift");
  CHECK(out.config.bindings[1].key == Key::F1);
  CHECK(out.config.bindings[1].modifiers.front() == Modifier::Alt);
}

void test_invalid_binding() {
  auto out = parse("bindings:\n"
                   "  - Ctrl+KeyA+KeyB\n");
  CHECK(out.result == ConfigResult::InvalidValue);
  CHECK(out.error.find("line 2") != std::string::npos);

  out = parse("bindings:\n"
              "  Ctrl+KeyA\n");
  CHECK(out.result == ConfigResult::ParseError);
}

void test_duplicate_bindings_rejected() {
  auto out = parse("bindings:\n"
                   "  - Ctrl+Shift+KeyS\n"
                   "  - Shift+Ctrl+S\n");
  CHECK(out.result == ConfigResult::InvalidValue);
}

void test_poll_interval_validation() {
  CHECK(hotkey::parse_interval_ms("15") == std::chrono::milliseconds{15});
  CHECK(!hotkey::parse_interval_ms("0"));
  CHECK(!hotkey::parse_interval_ms("-5"));
  CHECK(!hotkey::parse_interval_ms("10ms"));

  auto out = parse("general:\n"
                   "  poll_interval: abc\n");
  CHECK(out.result == ConfigResult::InvalidValue);

  out = parse("general:\n"
              "  poll_interval: 60000\n");
  CHECK(out.result == ConfigResult::InvalidValue);
}

void test_load_from_file() {
  auto missing = hotkey::load_config_checked("/nonexistent/hotkey.yaml");
  CHECK(missing.result == ConfigResult::FileNotFound);
  CHECK(!missing.error.empty());

  auto empty = hotkey::load_config_checked("");
  CHECK(empty.result == ConfigResult::FileNotFound);

  const auto path = std::filesystem::temp_directory_path() /
                    ("hotkey_test_config_" + std::to_string(getpid()) +
                     ".yaml");
  {
    std::ofstream file{path};
    file << "bindings:\n  - Super+KeyReturn\n";
  }

  auto out = hotkey::load_config_checked(path);
  CHECK(out.result == ConfigResult::Ok);
  CHECK(out.used_path == path);
  CHECK(out.config.config_path == path);
  CHECK(out.config.bindings.size() == 1);
  CHECK(out.config.bindings[0].key == Key::Return);

  // Best-effort: битый файл даёт дефолты
  {
    std::ofstream file{path};
    file << "bindings:\n  - Nope\n";
  }
  hotkey::Config fallback = hotkey::load_config(path.string());
  CHECK(fallback.bindings.empty());

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

} // namespace

#undef CHECK

int main() {
  test_defaults();
  test_full_file();
  test_invalid_binding();
  test_duplicate_bindings_rejected();
  test_poll_interval_validation();
  test_load_from_file();

  std::cout << "OK\n";
  return 0;
}
