/**
 * @file config.hpp
 * @brief Конфигурация hotkey-listen
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hotkey/keymap.hpp"
#include "hotkey/types.hpp"

namespace hotkey {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

struct GeneralConfig {
  /// Подробный лог в stderr
  bool verbose = false;

  /// Таймаут receive_for() в потоках слушателя (проверка сигнала остановки)
  std::chrono::milliseconds poll_interval{100};
};

/// Полная конфигурация приложения
struct Config {
  GeneralConfig general;

  /// Комбинации для регистрации (в порядке из файла)
  std::vector<Combination> bindings;

  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение.
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Разбирает конфигурацию из потока
 *
 * @return ConfigLoadOutcome; used_path не заполняется
 */
[[nodiscard]] ConfigLoadOutcome parse_config(std::istream &in);

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию (best-effort)
 *
 * Для дефолтного пути сначала пробует ~/.config/hotkey/config.yaml.
 * При ошибках чтения/валидации возвращает дефолты с предупреждением.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Парсит интервал в миллисекундах
 * @return Значение или std::nullopt (не число или <= 0)
 */
[[nodiscard]] std::optional<std::chrono::milliseconds>
parse_interval_ms(std::string_view value);

/**
 * @brief Валидирует конфигурацию
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

} // namespace hotkey
