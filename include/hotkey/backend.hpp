/**
 * @file backend.hpp
 * @brief Интерфейс платформенной регистрации горячих клавиш
 */

#pragma once

#include <cstdint>
#include <functional>

#include "hotkey/keymap.hpp"
#include "hotkey/types.hpp"

namespace hotkey {

/// Непрозрачный токен регистрации, выдаётся backend'ом
using BackendToken = std::uint64_t;

/// Вызывается из потока backend'а; должен вернуться сразу
using KeyCallback = std::function<void()>;

struct RegisterOutcome {
  HotkeyStatus status;
  BackendToken token = 0;
};

/**
 * @brief Платформенный backend
 *
 * Контракт:
 * - после возврата из unregister_hotkey(token) callback'и этого токена не
 *   выполняются и не будут вызваны;
 * - callback'и не должны вызывать методы backend'а;
 * - при отказе register_hotkey ничего не оставляет зарегистрированным.
 *
 * На некоторых платформах регистрация допустима только из определённого
 * потока с запущенным циклом событий. Это обязанность вызывающего кода.
 */
class Backend {
public:
  virtual ~Backend() = default;

  [[nodiscard]] virtual RegisterOutcome
  register_hotkey(const Combination &combination, KeyCallback on_keydown,
                  KeyCallback on_keyup) = 0;

  [[nodiscard]] virtual HotkeyStatus unregister_hotkey(BackendToken token) = 0;
};

} // namespace hotkey
