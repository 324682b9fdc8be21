/**
 * @file x11_backend.hpp
 * @brief Backend горячих клавиш на X11 (XGrabKey на корневом окне)
 *
 * Собственный поток событий, поэтому регистрацию можно вызывать из любого
 * потока: отдельный главный цикл приложению не нужен.
 */

#pragma once

#include <X11/Xlib.h>

#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include "hotkey/backend.hpp"

namespace hotkey {

/**
 * @brief Реализация Backend через Xlib
 *
 * Захватывает комбинацию вместе с вариантами NumLock/CapsLock, чтобы
 * включённые индикаторы не мешали срабатыванию. Автоповтор XKB переводится
 * в detectable-режим, иначе удержание клавиши даёт поток отпусканий.
 *
 * Callback'и выполняются в потоке событий под мьютексом backend'а.
 */
class X11Backend final : public Backend {
public:
  X11Backend() = default;
  ~X11Backend() override;

  // Запрет копирования (X11 ресурсы)
  X11Backend(const X11Backend &) = delete;
  X11Backend &operator=(const X11Backend &) = delete;

  /**
   * @brief Открывает соединение с X сервером ($DISPLAY) и запускает поток
   * @return true если соединение установлено
   */
  bool open();

  /**
   * @brief Останавливает поток, снимает все захваты, закрывает соединение
   */
  void close();

  [[nodiscard]] bool is_open() const noexcept { return display_ != nullptr; }

  [[nodiscard]] RegisterOutcome register_hotkey(const Combination &combination,
                                                KeyCallback on_keydown,
                                                KeyCallback on_keyup) override;

  [[nodiscard]] HotkeyStatus unregister_hotkey(BackendToken token) override;

private:
  struct Registration {
    Combination combination;
    KeyCode keycode = 0;
    unsigned int mask = 0;
    KeyCallback on_keydown;
    KeyCallback on_keyup;
    bool pressed = false;
  };

  void event_loop(std::stop_token st);
  void dispatch(const XEvent &event);

  /// Захват/снятие всех вариантов с Lock-модификаторами (под mu_)
  bool grab(KeyCode keycode, unsigned int mask);
  void ungrab(KeyCode keycode, unsigned int mask);

  std::mutex mu_;
  Display *display_ = nullptr;
  Window root_ = 0;
  std::unordered_map<BackendToken, Registration> registrations_;
  BackendToken next_token_ = 1;

  std::jthread loop_;
};

} // namespace hotkey
