/**
 * @file main.cpp
 * @brief Точка входа hotkey-listen
 *
 * Регистрирует горячие клавиши на X11 и печатает нажатия/отпускания.
 *
 * Запуск: hotkey-listen Ctrl+Shift+KeyS Alt+KeyF1
 */

#include "hotkey/config.hpp"
#include "hotkey/hotkey.hpp"
#include "hotkey/x11_backend.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <signal.h>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

volatile sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  if (sig == SIGINT || sig == SIGTERM) {
    g_running = 0;
  }
}

std::mutex g_out_mu;

void print_version() {
  std::cout << "hotkey-listen 1.0.0 (C++20)\n"
            << "Global hotkeys for X11\n";
}

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options] [COMBINATION...]\n"
            << "\n"
            << "Options:\n"
            << "  -c, --config PATH  Config file\n"
            << "  -h, --help         Show this help\n"
            << "  -v, --version      Show version\n"
            << "\n"
            << "COMBINATION: modifiers and one key joined with '+',\n"
            << "e.g. Ctrl+Shift+KeyS, Alt+KeyF1, Super+Space.\n"
            << "Command line combinations replace configured bindings.\n"
            << "\n"
            << "Config: ~/.config/hotkey/config.yaml or /etc/hotkey/config.yaml\n";
}

/// Читает канал, пока не придёт сигнал остановки или канал не закроется
void print_events(hotkey::EventReceiver events, const std::string &name,
                  std::string_view what,
                  std::chrono::milliseconds poll_interval) {
  while (g_running) {
    const auto status = events.receive_for(poll_interval);
    if (status == hotkey::ReceiveStatus::Closed) {
      return;
    }
    if (status == hotkey::ReceiveStatus::Event) {
      std::lock_guard<std::mutex> lock(g_out_mu);
      std::cout << "hotkey: " << name << " is " << what << std::endl;
    }
  }
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path{hotkey::kConfigPath};
  std::vector<std::string> combinations;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "[hotkey] Error: " << arg << " requires a path\n";
        return 2;
      }
      config_path = argv[++i];
      continue;
    }
    combinations.emplace_back(arg);
  }

  // Установка обработчиков сигналов
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  hotkey::Config config = hotkey::load_config(config_path);

  if (!combinations.empty()) {
    config.bindings.clear();
    for (const auto &text : combinations) {
      auto combination = hotkey::parse_combination(text);
      if (!combination) {
        std::cerr << "[hotkey] Error: invalid hotkey '" << text << "'\n";
        return 2;
      }
      config.bindings.push_back(std::move(*combination));
    }
  }

  if (config.bindings.empty()) {
    std::cerr << "[hotkey] Error: no hotkeys configured\n";
    print_usage(argv[0]);
    return 2;
  }

  hotkey::X11Backend backend;
  if (!backend.open()) {
    return 1;
  }

  std::vector<std::unique_ptr<hotkey::Hotkey>> hotkeys;
  for (const auto &combination : config.bindings) {
    auto hk = std::make_unique<hotkey::Hotkey>(backend, combination);
    hotkey::HotkeyStatus st = hk->register_hotkey();
    if (!st.ok()) {
      std::cerr << "[hotkey] " << hotkey::to_string(st.result) << ": "
                << st.error << "\n";
      continue;
    }
    std::cout << "hotkey: " << *hk << " is registered" << std::endl;
    hotkeys.push_back(std::move(hk));
  }

  if (hotkeys.empty()) {
    return 1;
  }

  if (config.general.verbose) {
    std::cerr << "[hotkey] Listening on " << hotkeys.size()
              << " hotkey(s), poll interval "
              << config.general.poll_interval.count() << " ms\n";
  }

  {
    std::vector<std::jthread> listeners;
    for (const auto &hk : hotkeys) {
      listeners.emplace_back(print_events, hk->keydown_events(),
                             hk->to_string(), "down",
                             config.general.poll_interval);
      listeners.emplace_back(print_events, hk->keyup_events(), hk->to_string(),
                             "up", config.general.poll_interval);
    }

    while (g_running) {
      std::this_thread::sleep_for(config.general.poll_interval);
    }
    // Слушатели выходят по g_running в пределах poll_interval
  }

  int rc = 0;
  for (const auto &hk : hotkeys) {
    hotkey::HotkeyStatus st = hk->unregister_hotkey();
    if (!st.ok()) {
      std::cerr << "[hotkey] " << hotkey::to_string(st.result) << ": "
                << st.error << "\n";
      rc = 1;
      continue;
    }
    std::cout << "hotkey: " << *hk << " is unregistered" << std::endl;
  }

  if (config.general.verbose) {
    std::cerr << "[hotkey] Shutdown complete\n";
  }
  return rc;
}
