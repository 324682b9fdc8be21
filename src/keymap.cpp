/**
 * @file keymap.cpp
 * @brief Реализация разбора имён клавиш и комбинаций
 */

#include "hotkey/keymap.hpp"

#include <algorithm>
#include <cctype>

namespace hotkey {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

bool equals_ci(std::string_view a, std::string_view b) {
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char x, char y) {
                      return std::tolower(static_cast<unsigned char>(x)) ==
                             std::tolower(static_cast<unsigned char>(y));
                    });
}

struct ModifierAlias {
  std::string_view name;
  Modifier mod;
};

constexpr std::array kModifierAliases = std::to_array<ModifierAlias>({
    {"ctrl", Modifier::Ctrl},
    {"control", Modifier::Ctrl},
    {"shift", Modifier::Shift},
    {"alt", Modifier::Alt},
    {"option", Modifier::Alt},
    {"super", Modifier::Super},
    {"win", Modifier::Super},
    {"cmd", Modifier::Super},
    {"meta", Modifier::Super},
});

} // namespace

std::uint32_t Combination::mask() const noexcept {
  return modifier_mask(modifiers);
}

std::string Combination::to_string() const {
  std::string s{key_name(key)};
  if (s.empty()) {
    s = std::to_string(static_cast<std::uint32_t>(key));
  }
  for (Modifier mod : modifiers) {
    s += '+';
    s += modifier_name(mod);
  }
  return s;
}

std::ostream &operator<<(std::ostream &os, const Combination &combination) {
  return os << combination.to_string();
}

std::optional<Modifier> modifier_from_name(std::string_view name) noexcept {
  name = trim(name);
  for (const auto &alias : kModifierAliases) {
    if (equals_ci(alias.name, name)) {
      return alias.mod;
    }
  }
  return std::nullopt;
}

std::uint32_t modifier_mask(std::span<const Modifier> mods) noexcept {
  std::uint32_t mask = 0;
  for (Modifier mod : mods) {
    mask |= static_cast<std::uint32_t>(mod);
  }
  return mask;
}

std::optional<Combination> parse_combination(std::string_view text) {
  Combination combination;
  bool have_key = false;

  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  while (true) {
    const auto plus = text.find('+');
    const std::string_view token = trim(text.substr(0, plus));
    if (token.empty()) {
      return std::nullopt;
    }

    if (auto mod = modifier_from_name(token)) {
      combination.modifiers.push_back(*mod);
    } else if (auto key = key_from_name(token)) {
      if (have_key) {
        // Только одна клавиша на комбинацию
        return std::nullopt;
      }
      combination.key = *key;
      have_key = true;
    } else {
      return std::nullopt;
    }

    if (plus == std::string_view::npos) {
      break;
    }
    text.remove_prefix(plus + 1);
  }

  if (!have_key) {
    return std::nullopt;
  }
  return combination;
}

} // namespace hotkey
