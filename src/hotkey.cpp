/**
 * @file hotkey.cpp
 * @brief Машина состояний регистрации горячей клавиши
 */

#include "hotkey/hotkey.hpp"

#include <iostream>
#include <utility>

namespace hotkey {

Hotkey::Hotkey(Backend &backend, std::vector<Modifier> modifiers, Key key)
    : Hotkey(backend, Combination{std::move(modifiers), key}) {}

Hotkey::Hotkey(Backend &backend, Combination combination)
    : backend_{backend}, combination_{std::move(combination)},
      senders_{std::make_shared<Senders>()} {
  // Каналы создаются сразу, чтобы слушать можно было до регистрации
  reset_channels();
}

Hotkey::~Hotkey() {
  if (token_) {
    HotkeyStatus st = backend_.unregister_hotkey(*token_);
    if (!st.ok()) {
      std::cerr << "[hotkey] Warning: cleanup of " << to_string()
                << " failed: " << st.error << "\n";
    }
    token_.reset();
  }

  std::lock_guard<std::mutex> lock(senders_->mu);
  senders_->keydown.close();
  senders_->keyup.close();
}

HotkeyStatus Hotkey::register_hotkey() {
  if (token_) {
    // Перерегистрация: сначала отпускаем старую, иначе backend увидит
    // конфликт с самим собой. Каналы остаются прежними.
    HotkeyStatus st = backend_.unregister_hotkey(*token_);
    if (!st.ok()) {
      return HotkeyStatus::failure(HotkeyResult::RegistrationFailed,
                                   "cannot release previous registration of " +
                                       to_string() + ": " + st.error);
    }
    token_.reset();
  }

  RegisterOutcome out = bind();
  if (!out.status.ok()) {
    return HotkeyStatus::failure(HotkeyResult::RegistrationFailed,
                                 std::move(out.status.error));
  }

  token_ = out.token;
  return HotkeyStatus::success();
}

HotkeyStatus Hotkey::unregister_hotkey() {
  if (!token_) {
    return HotkeyStatus::failure(HotkeyResult::UnregistrationFailed,
                                 "hotkey " + to_string() +
                                     " is not registered");
  }

  HotkeyStatus st = backend_.unregister_hotkey(*token_);
  if (!st.ok()) {
    return HotkeyStatus::failure(HotkeyResult::UnregistrationFailed,
                                 std::move(st.error));
  }
  token_.reset();

  // Callback'и больше не вызываются: можно менять каналы
  reset_channels();
  return HotkeyStatus::success();
}

RegisterOutcome Hotkey::bind() {
  std::weak_ptr<Senders> weak = senders_;
  return backend_.register_hotkey(
      combination_, [weak] { deliver(weak, true); },
      [weak] { deliver(weak, false); });
}

void Hotkey::deliver(const std::weak_ptr<Senders> &weak, bool keydown) {
  std::shared_ptr<Senders> senders = weak.lock();
  if (!senders) {
    // Объект разрушен, а backend не отпустил привязку
    return;
  }

  std::lock_guard<std::mutex> lock(senders->mu);
  EventSender &in = keydown ? senders->keydown : senders->keyup;
  if (in.is_open()) {
    in.send();
  }
}

void Hotkey::reset_channels() {
  EventChannel down = make_event_channel();
  EventChannel up = make_event_channel();

  {
    // Перемещающее присваивание закрывает прежний sender
    std::lock_guard<std::mutex> lock(senders_->mu);
    senders_->keydown = std::move(down.sender);
    senders_->keyup = std::move(up.sender);
  }
  keydown_out_ = std::move(down.receiver);
  keyup_out_ = std::move(up.receiver);
}

std::ostream &operator<<(std::ostream &os, const Hotkey &hk) {
  return os << hk.to_string();
}

} // namespace hotkey
