/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "hotkey/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

namespace hotkey {

namespace {

/// Верхняя граница poll_interval: дольше ждать SIGINT неудобно
constexpr std::chrono::milliseconds kMaxPollInterval{10000};

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

/// Отрезает комментарий в конце строки
std::string_view strip_comment(std::string_view sv) {
  auto hash = sv.find('#');
  if (hash != std::string_view::npos) {
    sv = sv.substr(0, hash);
  }
  return trim(sv);
}

/// Парсит целое число из строки
std::optional<int> parse_int(std::string_view sv) {
  sv = trim(sv);
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Получает путь к user config (~/.config/hotkey/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

} // namespace

std::optional<std::chrono::milliseconds>
parse_interval_ms(std::string_view value) {
  auto ms = parse_int(value);
  if (ms && *ms > 0) {
    return std::chrono::milliseconds{*ms};
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  if (config.general.poll_interval.count() <= 0 ||
      config.general.poll_interval > kMaxPollInterval) {
    return false;
  }

  // Одинаковые комбинации не зарегистрировать дважды
  for (std::size_t i = 0; i < config.bindings.size(); ++i) {
    for (std::size_t j = i + 1; j < config.bindings.size(); ++j) {
      if (config.bindings[i] == config.bindings[j]) {
        return false;
      }
    }
  }

  return true;
}

ConfigLoadOutcome parse_config(std::istream &in) {
  ConfigLoadOutcome out;

  std::string line;
  std::string current_section;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string_view sv = strip_comment(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty()) {
      continue;
    }

    // Определение секции
    if (sv == "general:") {
      current_section = "general";
      continue;
    }
    if (sv == "bindings:") {
      current_section = "bindings";
      continue;
    }

    if (current_section == "bindings") {
      if (!sv.starts_with("-")) {
        out.result = ConfigResult::ParseError;
        out.error = "line " + std::to_string(line_no) +
                    ": expected '- <combination>' in bindings";
        return out;
      }
      std::string_view value = trim(sv.substr(1));
      auto combination = parse_combination(value);
      if (!combination) {
        out.result = ConfigResult::InvalidValue;
        out.error = "line " + std::to_string(line_no) +
                    ": invalid hotkey '" + std::string{value} + "'";
        return out;
      }
      out.config.bindings.push_back(std::move(*combination));
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = trim(sv.substr(colon_pos + 1));

    if (current_section == "general") {
      if (key == "verbose") {
        if (auto val = parse_bool(value)) {
          out.config.general.verbose = *val;
        }
      } else if (key == "poll_interval") {
        if (auto val = parse_interval_ms(value)) {
          out.config.general.poll_interval = *val;
        } else {
          out.result = ConfigResult::InvalidValue;
          out.error = "line " + std::to_string(line_no) +
                      ": invalid poll_interval '" + std::string{value} + "'";
          return out;
        }
      }
    }
  }

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "invalid configuration values";
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  if (path.empty()) {
    ConfigLoadOutcome out;
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{path};
  if (!file.is_open()) {
    ConfigLoadOutcome out;
    out.used_path = std::move(path);
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  ConfigLoadOutcome out = parse_config(file);
  out.used_path = std::move(path);

  if (out.result != ConfigResult::Ok) {
    out.error = out.used_path.string() + ": " + out.error;
    out.config = Config{};
    return out;
  }

  out.config.config_path = out.used_path;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[hotkey] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый — используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[hotkey] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace hotkey
