/**
 * @file mailbox.hpp
 * @brief Неограниченный почтовый ящик для обмена сообщениями между потоками
 *
 * Один читатель (worker канала), любое число писателей. push() никогда
 * не ждёт получателя. close() отклоняет новые сообщения и отдаёт
 * вызывающему те, что так и не были прочитаны.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace hotkey {

template <class T> class Mailbox {
public:
  Mailbox() = default;

  Mailbox(const Mailbox &) = delete;
  Mailbox &operator=(const Mailbox &) = delete;

  /// @return false если ящик закрыт (сообщение уничтожается)
  [[nodiscard]] bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      q_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  /// Ждёт сообщение. std::nullopt при запросе остановки или если ящик
  /// закрыт и пуст.
  [[nodiscard]] std::optional<T> pop_wait(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mu_);

    cv_.wait(lock, st, [this] { return !q_.empty() || closed_; });

    if (q_.empty()) {
      return std::nullopt;
    }

    T value = std::move(q_.front());
    q_.pop_front();
    return value;
  }

  /// Закрывает ящик и забирает непрочитанные сообщения. Повторный
  /// вызов возвращает пустую очередь.
  [[nodiscard]] std::deque<T> close() {
    std::deque<T> rest;
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
      rest.swap(q_);
    }
    cv_.notify_all();
    return rest;
  }

private:
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace hotkey
