/**
 * @file event_channel.hpp
 * @brief Неблокирующий канал событий с неограниченной ёмкостью
 *
 * Один производитель, один потребитель. Очередью владеет отдельный
 * рабочий поток канала; стороны общаются с ним только сообщениями
 * (Send, Close, Receive). send() никогда не ждёт потребителя, поэтому
 * его можно вызывать из callback'а платформы, который обязан вернуться
 * сразу.
 *
 * Закрытие не теряет события: всё, что принято до close(), будет
 * доставлено, и только затем потребитель увидит закрытие.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <utility>

#include "hotkey/types.hpp"

namespace hotkey {

namespace detail {
class ChannelCore;
} // namespace detail

/**
 * @brief Сторона производителя
 *
 * Только перемещение. Деструктор закрывает канал. После close() handle
 * забывает канал, поэтому повторное закрытие канала невозможно.
 */
class EventSender {
public:
  EventSender() = default;
  explicit EventSender(std::shared_ptr<detail::ChannelCore> core) noexcept;
  ~EventSender();

  EventSender(const EventSender &) = delete;
  EventSender &operator=(const EventSender &) = delete;
  EventSender(EventSender &&other) noexcept = default;
  EventSender &operator=(EventSender &&other) noexcept;

  /**
   * @brief Ставит событие в очередь и сразу возвращает управление
   * @throws std::logic_error если канал уже закрыт этим handle
   */
  void send(Event event = {});

  /// Закрывает канал. На уже закрытом handle ничего не делает.
  void close() noexcept;

  [[nodiscard]] bool is_open() const noexcept { return core_ != nullptr; }

private:
  std::shared_ptr<detail::ChannelCore> core_;
};

/**
 * @brief Сторона потребителя
 *
 * Копируемый handle: копии ссылаются на один канал и сравниваются равными.
 * Читать должен один поток.
 */
class EventReceiver {
public:
  EventReceiver() = default;
  explicit EventReceiver(std::shared_ptr<detail::ChannelCore> core) noexcept
      : core_{std::move(core)} {}

  /**
   * @brief Ждёт следующее событие
   * @return событие или std::nullopt если канал закрыт и очередь пуста
   */
  [[nodiscard]] std::optional<Event> receive();

  /**
   * @brief receive() с таймаутом
   *
   * Ожидание, прерванное таймаутом, остаётся за handle и продолжается
   * следующим вызовом: событие не теряется.
   */
  [[nodiscard]] ReceiveStatus receive_for(std::chrono::milliseconds timeout);

  [[nodiscard]] bool valid() const noexcept { return core_ != nullptr; }

  friend bool operator==(const EventReceiver &,
                         const EventReceiver &) noexcept = default;

private:
  std::shared_ptr<detail::ChannelCore> core_;
};

struct EventChannel {
  EventSender sender;
  EventReceiver receiver;
};

/// Создаёт канал и запускает его рабочий поток
[[nodiscard]] EventChannel make_event_channel();

} // namespace hotkey
