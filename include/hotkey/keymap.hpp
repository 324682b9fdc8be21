/**
 * @file keymap.hpp
 * @brief Имена клавиш и модификаторов, разбор комбинаций
 *
 * Таблица имён — constexpr массив, фиксируется на этапе компиляции и
 * доступна только для чтения.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hotkey/types.hpp"

namespace hotkey {

// ===========================================================================
// Комбинация клавиш
// ===========================================================================

/// Модификаторы + одна клавиша.
///
/// Порядок модификаторов сохраняется для отображения, но не влияет на
/// сравнение (сравниваются битовая маска и клавиша).
struct Combination {
  std::vector<Modifier> modifiers;
  Key key = Key::Space;

  [[nodiscard]] std::uint32_t mask() const noexcept;

  /// "S+Ctrl+Shift": клавиша, затем модификаторы в исходном порядке
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const Combination &a, const Combination &b) noexcept {
    return a.key == b.key && a.mask() == b.mask();
  }
};

std::ostream &operator<<(std::ostream &os, const Combination &combination);

// ===========================================================================
// Таблица имён клавиш
// ===========================================================================

struct KeyNameMapping {
  std::string_view name;
  Key key;
};

// clang-format off
inline constexpr std::array kKeyNames = std::to_array<KeyNameMapping>({
    {"KeySpace", Key::Space},
    {"Key1", Key::Num1}, {"Key2", Key::Num2}, {"Key3", Key::Num3},
    {"Key4", Key::Num4}, {"Key5", Key::Num5}, {"Key6", Key::Num6},
    {"Key7", Key::Num7}, {"Key8", Key::Num8}, {"Key9", Key::Num9},
    {"Key0", Key::Num0},
    {"KeyA", Key::A}, {"KeyB", Key::B}, {"KeyC", Key::C}, {"KeyD", Key::D},
    {"KeyE", Key::E}, {"KeyF", Key::F}, {"KeyG", Key::G}, {"KeyH", Key::H},
    {"KeyI", Key::I}, {"KeyJ", Key::J}, {"KeyK", Key::K}, {"KeyL", Key::L},
    {"KeyM", Key::M}, {"KeyN", Key::N}, {"KeyO", Key::O}, {"KeyP", Key::P},
    {"KeyQ", Key::Q}, {"KeyR", Key::R}, {"KeyS", Key::S}, {"KeyT", Key::T},
    {"KeyU", Key::U}, {"KeyV", Key::V}, {"KeyW", Key::W}, {"KeyX", Key::X},
    {"KeyY", Key::Y}, {"KeyZ", Key::Z},

    {"KeyReturn", Key::Return}, {"KeyEscape", Key::Escape},
    {"KeyDelete", Key::Delete}, {"KeyTab", Key::Tab},

    {"KeyLeft", Key::Left}, {"KeyRight", Key::Right},
    {"KeyUp", Key::Up}, {"KeyDown", Key::Down},

    {"KeyF1", Key::F1},   {"KeyF2", Key::F2},   {"KeyF3", Key::F3},
    {"KeyF4", Key::F4},   {"KeyF5", Key::F5},   {"KeyF6", Key::F6},
    {"KeyF7", Key::F7},   {"KeyF8", Key::F8},   {"KeyF9", Key::F9},
    {"KeyF10", Key::F10}, {"KeyF11", Key::F11}, {"KeyF12", Key::F12},
    {"KeyF13", Key::F13}, {"KeyF14", Key::F14}, {"KeyF15", Key::F15},
    {"KeyF16", Key::F16}, {"KeyF17", Key::F17}, {"KeyF18", Key::F18},
    {"KeyF19", Key::F19}, {"KeyF20", Key::F20},
});
// clang-format on

/// Префикс имён в таблице
inline constexpr std::string_view kKeyNamePrefix = "Key";

/// Вся таблица имён (только чтение)
[[nodiscard]] constexpr std::span<const KeyNameMapping> key_names() noexcept {
  return kKeyNames;
}

/// Поиск клавиши по имени из таблицы ("KeyS") или короткому имени ("S")
[[nodiscard]] constexpr std::optional<Key>
key_from_name(std::string_view name) noexcept {
  for (const auto &mapping : kKeyNames) {
    if (mapping.name == name ||
        mapping.name.substr(kKeyNamePrefix.size()) == name) {
      return mapping.key;
    }
  }
  return std::nullopt;
}

/// Короткое имя клавиши ("S", "F1", "Space"), пустое для неизвестной
[[nodiscard]] constexpr std::string_view key_name(Key key) noexcept {
  for (const auto &mapping : kKeyNames) {
    if (mapping.key == key) {
      return mapping.name.substr(kKeyNamePrefix.size());
    }
  }
  return {};
}

// ===========================================================================
// Модификаторы
// ===========================================================================

[[nodiscard]] constexpr std::string_view modifier_name(Modifier mod) noexcept {
  switch (mod) {
  case Modifier::Shift:
    return "Shift";
  case Modifier::Ctrl:
    return "Ctrl";
  case Modifier::Alt:
    return "Alt";
  case Modifier::Super:
    return "Super";
  }
  return {};
}

/// Регистр не учитывается; принимает синонимы Control, Win, Cmd, Meta
[[nodiscard]] std::optional<Modifier>
modifier_from_name(std::string_view name) noexcept;

/// Битовая маска набора модификаторов
[[nodiscard]] std::uint32_t
modifier_mask(std::span<const Modifier> mods) noexcept;

/**
 * @brief Разбирает строку вида "Ctrl+Shift+KeyS"
 *
 * Ровно одна клавиша, остальные токены — модификаторы. Пробелы вокруг
 * токенов допускаются. Клавиша может стоять в любой позиции.
 *
 * @return Комбинация или std::nullopt при ошибке
 */
[[nodiscard]] std::optional<Combination>
parse_combination(std::string_view text);

} // namespace hotkey
