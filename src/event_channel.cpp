/**
 * @file event_channel.cpp
 * @brief Рабочий поток канала и протокол сообщений Send/Close/Receive
 */

#include "hotkey/event_channel.hpp"
#include "hotkey/mailbox.hpp"

#include <deque>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace hotkey {

namespace detail {

struct ChannelMessage {
  enum class Kind { Send, Close, Receive };

  Kind kind = Kind::Send;
  Event event{};

  // Только для Receive: ответ потребителю (событие или закрытие)
  std::promise<std::optional<Event>> reply;

  static ChannelMessage send(Event e) {
    ChannelMessage msg;
    msg.kind = Kind::Send;
    msg.event = e;
    return msg;
  }

  static ChannelMessage close() {
    ChannelMessage msg;
    msg.kind = Kind::Close;
    return msg;
  }

  static ChannelMessage receive(std::promise<std::optional<Event>> reply) {
    ChannelMessage msg;
    msg.kind = Kind::Receive;
    msg.reply = std::move(reply);
    return msg;
  }
};

class ChannelCore {
public:
  ChannelCore() : worker_{[this](std::stop_token st) { run(st); }} {}

  ChannelCore(const ChannelCore &) = delete;
  ChannelCore &operator=(const ChannelCore &) = delete;

  [[nodiscard]] bool post(ChannelMessage msg) {
    return inbox_.push(std::move(msg));
  }

  /**
   * @brief Гарантирует, что у потребителя есть незавершённый запрос
   * @return false если канал уже закрыт и worker больше не отвечает
   */
  [[nodiscard]] bool begin_receive() {
    if (pending_receive_.valid()) {
      return true;
    }
    std::promise<std::optional<Event>> reply;
    auto future = reply.get_future();
    if (!post(ChannelMessage::receive(std::move(reply)))) {
      return false;
    }
    pending_receive_ = std::move(future);
    return true;
  }

  std::future<std::optional<Event>> &pending_receive() noexcept {
    return pending_receive_;
  }

private:
  void run(std::stop_token st);

  Mailbox<ChannelMessage> inbox_;

  // Трогает только поток потребителя
  std::future<std::optional<Event>> pending_receive_;

  // Последним: останавливается и join'ится до разрушения inbox_
  std::jthread worker_;
};

void ChannelCore::run(std::stop_token st) {
  std::deque<Event> queue;
  std::optional<std::promise<std::optional<Event>>> waiting;
  bool closed = false;

  while (auto msg = inbox_.pop_wait(st)) {
    switch (msg->kind) {
    case ChannelMessage::Kind::Send:
      if (waiting) {
        // Потребитель уже ждёт: отдаём напрямую
        waiting->set_value(msg->event);
        waiting.reset();
      } else {
        queue.push_back(msg->event);
      }
      break;

    case ChannelMessage::Kind::Close:
      closed = true;
      break;

    case ChannelMessage::Kind::Receive:
      if (!queue.empty()) {
        msg->reply.set_value(queue.front());
        queue.pop_front();
      } else if (closed) {
        msg->reply.set_value(std::nullopt);
      } else {
        waiting = std::move(msg->reply);
      }
      break;
    }

    if (closed && queue.empty()) {
      if (waiting) {
        waiting->set_value(std::nullopt);
        waiting.reset();
      }
      break;
    }
  }

  // Дальше никто не ответит: отклоняем новые запросы и закрываем те, что
  // успели попасть в ящик.
  for (ChannelMessage &rest : inbox_.close()) {
    if (rest.kind == ChannelMessage::Kind::Receive) {
      rest.reply.set_value(std::nullopt);
    }
  }
}

} // namespace detail

// ===========================================================================
// EventSender
// ===========================================================================

EventSender::EventSender(std::shared_ptr<detail::ChannelCore> core) noexcept
    : core_{std::move(core)} {}

EventSender::~EventSender() { close(); }

EventSender &EventSender::operator=(EventSender &&other) noexcept {
  if (this != &other) {
    close();
    core_ = std::move(other.core_);
  }
  return *this;
}

void EventSender::send(Event event) {
  if (!core_) {
    throw std::logic_error("hotkey: send on closed event channel");
  }
  if (!core_->post(detail::ChannelMessage::send(event))) {
    throw std::logic_error("hotkey: event channel worker has stopped");
  }
}

void EventSender::close() noexcept {
  if (!core_) {
    return;
  }
  // Worker закрывает ящик только после Close, поэтому отказа здесь нет
  static_cast<void>(core_->post(detail::ChannelMessage::close()));
  core_.reset();
}

// ===========================================================================
// EventReceiver
// ===========================================================================

std::optional<Event> EventReceiver::receive() {
  if (!core_ || !core_->begin_receive()) {
    return std::nullopt;
  }
  return core_->pending_receive().get();
}

ReceiveStatus EventReceiver::receive_for(std::chrono::milliseconds timeout) {
  if (!core_ || !core_->begin_receive()) {
    return ReceiveStatus::Closed;
  }

  auto &pending = core_->pending_receive();
  if (pending.wait_for(timeout) != std::future_status::ready) {
    return ReceiveStatus::Timeout;
  }
  return pending.get().has_value() ? ReceiveStatus::Event
                                   : ReceiveStatus::Closed;
}

// ===========================================================================

EventChannel make_event_channel() {
  auto core = std::make_shared<detail::ChannelCore>();
  return EventChannel{EventSender{core}, EventReceiver{core}};
}

} // namespace hotkey
