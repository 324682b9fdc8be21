/**
 * @file hotkey.hpp
 * @brief Горячая клавиша: регистрация, каналы нажатий и отпусканий
 *
 * Пример:
 *
 *   hotkey::Hotkey hk{backend, {Modifier::Ctrl, Modifier::Shift}, Key::S};
 *   if (!hk.register_hotkey().ok()) return;
 *   auto down = hk.keydown_events();
 *   down.receive();                 // ждём нажатия
 *   hk.keyup_events().receive();    // ждём отпускания
 *   static_cast<void>(hk.unregister_hotkey());
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "hotkey/backend.hpp"
#include "hotkey/event_channel.hpp"
#include "hotkey/keymap.hpp"
#include "hotkey/types.hpp"

namespace hotkey {

/**
 * @brief Комбинация модификаторов и клавиши с двумя каналами событий
 *
 * Состояния: Unregistered, Registered.
 *
 * - register_hotkey() на зарегистрированной клавише перерегистрирует её:
 *   старый токен освобождается, новый получается, каналы НЕ меняются
 *   (handle'ы потребителя и непрочитанные события остаются).
 * - unregister_hotkey() освобождает токен, закрывает оба канала и создаёт
 *   новые. Старые handle'ы дочитывают буфер и видят закрытие; за новыми
 *   надо снова обратиться к keydown_events()/keyup_events().
 * - Деструктор — страховка: если клавиша ещё зарегистрирована, токен
 *   освобождается (ошибка только логируется), затем оба канала
 *   закрываются. Основной путь — явный unregister_hotkey().
 *   Если backend не отпустил привязку, её callback'и после разрушения
 *   объекта ничего не делают.
 *
 * Методы вызываются из одного потока приложения. Backend должен пережить
 * объект.
 */
class Hotkey {
public:
  Hotkey(Backend &backend, std::vector<Modifier> modifiers, Key key);
  Hotkey(Backend &backend, Combination combination);

  ~Hotkey();

  Hotkey(const Hotkey &) = delete;
  Hotkey &operator=(const Hotkey &) = delete;
  Hotkey(Hotkey &&) = delete;
  Hotkey &operator=(Hotkey &&) = delete;

  /**
   * @brief Регистрирует (или перерегистрирует) комбинацию
   *
   * При перерегистрации старый токен освобождается до получения нового.
   * Если не удалось освободить старый, клавиша остаётся
   * зарегистрированной. Если не удалось получить новый, клавиша
   * оказывается НЕзарегистрированной (is_registered() == false), каналы
   * сохраняются.
   *
   * @return Ok или RegistrationFailed с описанием от backend'а
   */
  [[nodiscard]] HotkeyStatus register_hotkey();

  /**
   * @brief Снимает регистрацию и заменяет каналы новыми
   * @return Ok или UnregistrationFailed (состояние не меняется)
   */
  [[nodiscard]] HotkeyStatus unregister_hotkey();

  /// Текущий канал нажатий
  [[nodiscard]] EventReceiver keydown_events() const { return keydown_out_; }

  /// Текущий канал отпусканий
  [[nodiscard]] EventReceiver keyup_events() const { return keyup_out_; }

  [[nodiscard]] bool is_registered() const noexcept {
    return token_.has_value();
  }

  [[nodiscard]] const Combination &combination() const noexcept {
    return combination_;
  }

  [[nodiscard]] std::string to_string() const {
    return combination_.to_string();
  }

private:
  /// Входы каналов. Callback'и backend'а держат только weak_ptr.
  struct Senders {
    std::mutex mu;
    EventSender keydown;
    EventSender keyup;
  };

  [[nodiscard]] RegisterOutcome bind();
  void reset_channels();

  static void deliver(const std::weak_ptr<Senders> &weak, bool keydown);

  Backend &backend_;
  Combination combination_;
  std::optional<BackendToken> token_;

  std::shared_ptr<Senders> senders_;
  EventReceiver keydown_out_;
  EventReceiver keyup_out_;
};

std::ostream &operator<<(std::ostream &os, const Hotkey &hk);

} // namespace hotkey
