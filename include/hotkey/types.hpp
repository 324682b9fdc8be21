/**
 * @file types.hpp
 * @brief Базовые типы: событие, модификаторы, клавиши, результаты операций
 *
 * Значения Modifier совпадают с X11 масками модификаторов, значения Key —
 * с X11 keysym. Заголовок не тянет X11, константы заданы литералами.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace hotkey {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/hotkey/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/hotkey/config.yaml";

// ===========================================================================
// Событие
// ===========================================================================

/// Одно срабатывание (нажатие или отпускание). Без полезной нагрузки.
struct Event {
  constexpr bool operator==(const Event &) const noexcept = default;
};

// ===========================================================================
// Модификаторы и клавиши
// ===========================================================================

/// Модификатор (ShiftMask, ControlMask, Mod1Mask, Mod4Mask)
enum class Modifier : std::uint32_t {
  Shift = 1U << 0,
  Ctrl = 1U << 2,
  Alt = 1U << 3,
  Super = 1U << 6,
};

/// Клавиша (X11 keysym)
enum class Key : std::uint32_t {
  Space = 0x0020,
  Num0 = 0x0030,
  Num1 = 0x0031,
  Num2 = 0x0032,
  Num3 = 0x0033,
  Num4 = 0x0034,
  Num5 = 0x0035,
  Num6 = 0x0036,
  Num7 = 0x0037,
  Num8 = 0x0038,
  Num9 = 0x0039,
  A = 0x0061,
  B = 0x0062,
  C = 0x0063,
  D = 0x0064,
  E = 0x0065,
  F = 0x0066,
  G = 0x0067,
  H = 0x0068,
  I = 0x0069,
  J = 0x006a,
  K = 0x006b,
  L = 0x006c,
  M = 0x006d,
  N = 0x006e,
  O = 0x006f,
  P = 0x0070,
  Q = 0x0071,
  R = 0x0072,
  S = 0x0073,
  T = 0x0074,
  U = 0x0075,
  V = 0x0076,
  W = 0x0077,
  X = 0x0078,
  Y = 0x0079,
  Z = 0x007a,

  Return = 0xff0d,
  Escape = 0xff1b,
  Delete = 0xffff,
  Tab = 0xff09,

  Left = 0xff51,
  Right = 0xff53,
  Up = 0xff52,
  Down = 0xff54,

  F1 = 0xffbe,
  F2 = 0xffbf,
  F3 = 0xffc0,
  F4 = 0xffc1,
  F5 = 0xffc2,
  F6 = 0xffc3,
  F7 = 0xffc4,
  F8 = 0xffc5,
  F9 = 0xffc6,
  F10 = 0xffc7,
  F11 = 0xffc8,
  F12 = 0xffc9,
  F13 = 0xffca,
  F14 = 0xffcb,
  F15 = 0xffcc,
  F16 = 0xffcd,
  F17 = 0xffce,
  F18 = 0xffcf,
  F19 = 0xffd0,
  F20 = 0xffd1,
};

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Результат регистрации/снятия горячей клавиши
enum class HotkeyResult { Ok, RegistrationFailed, UnregistrationFailed };

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Результат ожидания события с таймаутом
enum class ReceiveStatus { Event, Closed, Timeout };

/// Результат операции с сообщением об ошибке
struct HotkeyStatus {
  HotkeyResult result = HotkeyResult::Ok;
  std::string error;

  [[nodiscard]] bool ok() const noexcept { return result == HotkeyResult::Ok; }

  [[nodiscard]] static HotkeyStatus success() { return {}; }

  [[nodiscard]] static HotkeyStatus failure(HotkeyResult result,
                                            std::string error) {
    return HotkeyStatus{result, std::move(error)};
  }
};

/// Имя результата для логов
[[nodiscard]] constexpr std::string_view
to_string(HotkeyResult result) noexcept {
  switch (result) {
  case HotkeyResult::Ok:
    return "Ok";
  case HotkeyResult::RegistrationFailed:
    return "RegistrationFailed";
  case HotkeyResult::UnregistrationFailed:
    return "UnregistrationFailed";
  }
  return "Unknown";
}

} // namespace hotkey
