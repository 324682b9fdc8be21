#include "hotkey/hotkey.hpp"

#include "fake_backend.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using hotkey::Combination;
using hotkey::Hotkey;
using hotkey::HotkeyResult;
using hotkey::Key;
using hotkey::Modifier;
using hotkey::ReceiveStatus;
using hotkey::testing::FakeBackend;

constexpr std::chrono::milliseconds kShort{20};
constexpr std::chrono::milliseconds kLong{2000};

const Combination kCtrlShiftS{{Modifier::Ctrl, Modifier::Shift}, Key::S};

void test_press_release_scenario() {
  FakeBackend backend;
  {
    Hotkey hk{backend, {Modifier::Ctrl, Modifier::Shift}, Key::S};
    CHECK(!hk.is_registered());
    CHECK(hk.register_hotkey().ok());
    CHECK(hk.is_registered());

    auto down = hk.keydown_events();
    auto up = hk.keyup_events();

    // Callback приходит из "чужого" потока, как у настоящего backend'а
    std::thread os_thread([&] { CHECK(backend.press(kCtrlShiftS)); });
    os_thread.join();
    CHECK(down.receive_for(kLong) == ReceiveStatus::Event);
    CHECK(up.receive_for(kShort) == ReceiveStatus::Timeout);

    os_thread = std::thread([&] { CHECK(backend.release(kCtrlShiftS)); });
    os_thread.join();
    CHECK(up.receive_for(kLong) == ReceiveStatus::Event);

    CHECK(hk.unregister_hotkey().ok());
    CHECK(!hk.is_registered());
  }
  CHECK(backend.register_calls == 1);
  CHECK(backend.unregister_calls == 1);
  CHECK(backend.active() == 0);
}

void test_same_combination_twice_fails() {
  FakeBackend backend;
  Hotkey first{backend, {Modifier::Ctrl, Modifier::Shift}, Key::S};
  Hotkey second{backend, {Modifier::Shift, Modifier::Ctrl}, Key::S};

  CHECK(first.register_hotkey().ok());

  hotkey::HotkeyStatus st = second.register_hotkey();
  CHECK(!st.ok());
  CHECK(st.result == HotkeyResult::RegistrationFailed);
  CHECK(!st.error.empty());
  CHECK(!second.is_registered());
  CHECK(first.is_registered());
}

void test_reregister_keeps_channels_and_events() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Ctrl, Modifier::Shift}, Key::S};
  CHECK(hk.register_hotkey().ok());
  const auto first_token = backend.last_token;

  auto down = hk.keydown_events();
  CHECK(backend.press(kCtrlShiftS));
  CHECK(backend.release(kCtrlShiftS));
  CHECK(backend.press(kCtrlShiftS));

  CHECK(hk.register_hotkey().ok());
  CHECK(hk.is_registered());
  CHECK(backend.register_calls == 2);
  CHECK(backend.unregister_calls == 1);
  CHECK(backend.last_token != first_token);
  CHECK(backend.active() == 1);

  // Handle остался прежним, непрочитанные события на месте
  CHECK(hk.keydown_events() == down);
  CHECK(down.receive_for(kLong) == ReceiveStatus::Event);
  CHECK(down.receive_for(kLong) == ReceiveStatus::Event);
  CHECK(down.receive_for(kShort) == ReceiveStatus::Timeout);

  // Новый токен шлёт в тот же канал
  CHECK(backend.press(kCtrlShiftS));
  CHECK(down.receive_for(kLong) == ReceiveStatus::Event);
}

void test_unregister_replaces_channels() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Alt}, Key::F1};
  const Combination alt_f1{{Modifier::Alt}, Key::F1};
  CHECK(hk.register_hotkey().ok());

  auto old_down = hk.keydown_events();
  auto old_up = hk.keyup_events();
  CHECK(backend.press(alt_f1));

  CHECK(hk.unregister_hotkey().ok());

  auto new_down = hk.keydown_events();
  auto new_up = hk.keyup_events();
  CHECK(!(new_down == old_down));
  CHECK(!(new_up == old_up));

  // Старый канал: буфер, затем закрытие
  CHECK(old_down.receive().has_value());
  CHECK(!old_down.receive().has_value());
  CHECK(!old_up.receive().has_value());

  // Новый канал открыт и пуст
  CHECK(new_down.receive_for(kShort) == ReceiveStatus::Timeout);

  CHECK(hk.register_hotkey().ok());
  CHECK(backend.press(alt_f1));
  CHECK(new_down.receive_for(kLong) == ReceiveStatus::Event);
}

void test_destructor_releases_registration_once() {
  FakeBackend backend;
  hotkey::EventReceiver down;
  hotkey::EventReceiver up;
  {
    auto hk = std::make_unique<Hotkey>(
        backend, std::vector<Modifier>{Modifier::Ctrl}, Key::Q);
    CHECK(hk->register_hotkey().ok());
    down = hk->keydown_events();
    up = hk->keyup_events();
    CHECK(backend.press(Combination{{Modifier::Ctrl}, Key::Q}));
  }
  CHECK(backend.unregister_calls == 1);
  CHECK(backend.active() == 0);

  CHECK(down.receive().has_value());
  CHECK(!down.receive().has_value());
  CHECK(!up.receive().has_value());
}

void test_destructor_after_unregister_is_noop() {
  FakeBackend backend;
  {
    Hotkey hk{backend, {Modifier::Super}, Key::Space};
    CHECK(hk.register_hotkey().ok());
    CHECK(hk.unregister_hotkey().ok());
  }
  CHECK(backend.register_calls == 1);
  CHECK(backend.unregister_calls == 1);
}

void test_destructor_swallows_backend_failure() {
  FakeBackend backend;
  const Combination combo{{Modifier::Ctrl}, Key::Escape};
  hotkey::EventReceiver down;
  hotkey::EventReceiver up;
  {
    Hotkey hk{backend, combo};
    CHECK(hk.register_hotkey().ok());
    down = hk.keydown_events();
    up = hk.keyup_events();
    backend.fail_unregister = true;
  }
  CHECK(backend.unregister_calls == 1);

  // Привязка осталась в backend'е: её callback'и должны быть пустыми
  CHECK(backend.active() == 1);
  CHECK(backend.press(combo));
  CHECK(backend.release(combo));
  CHECK(backend.press(combo));

  CHECK(down.receive_for(kLong) == ReceiveStatus::Closed);
  CHECK(up.receive_for(kLong) == ReceiveStatus::Closed);
}

void test_presses_racing_failed_destruction() {
  FakeBackend backend;
  const Combination combo{{Modifier::Alt}, Key::Tab};
  auto hk = std::make_unique<Hotkey>(backend, combo);
  CHECK(hk->register_hotkey().ok());
  backend.fail_unregister = true;

  std::thread presser([&] {
    for (int i = 0; i < 2000; ++i) {
      backend.press(combo);
      backend.release(combo);
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds{1});
  hk.reset();
  presser.join();

  CHECK(backend.unregister_calls == 1);
  CHECK(backend.press(combo));
}

void test_unregister_when_not_registered() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Ctrl}, Key::A};
  auto down = hk.keydown_events();

  hotkey::HotkeyStatus st = hk.unregister_hotkey();
  CHECK(st.result == HotkeyResult::UnregistrationFailed);
  CHECK(backend.unregister_calls == 0);
  CHECK(hk.keydown_events() == down);
}

void test_registration_failure_leaves_unregistered() {
  FakeBackend backend;
  backend.fail_register = true;

  Hotkey hk{backend, {Modifier::Ctrl}, Key::B};
  hotkey::HotkeyStatus st = hk.register_hotkey();
  CHECK(st.result == HotkeyResult::RegistrationFailed);
  CHECK(st.error == "registration refused");
  CHECK(!hk.is_registered());
  CHECK(backend.active() == 0);
}

void test_unregister_failure_keeps_state() {
  FakeBackend backend;
  {
    Hotkey hk{backend, {Modifier::Ctrl}, Key::C};
    CHECK(hk.register_hotkey().ok());
    auto down = hk.keydown_events();

    backend.fail_unregister = true;
    hotkey::HotkeyStatus st = hk.unregister_hotkey();
    CHECK(st.result == HotkeyResult::UnregistrationFailed);
    CHECK(hk.is_registered());
    CHECK(hk.keydown_events() == down);

    backend.fail_unregister = false;
  }
  // Деструктор повторил освобождение
  CHECK(backend.unregister_calls == 2);
  CHECK(backend.active() == 0);
}

void test_reregister_release_failure_keeps_old_token() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Ctrl}, Key::D};
  CHECK(hk.register_hotkey().ok());

  backend.fail_unregister = true;
  hotkey::HotkeyStatus st = hk.register_hotkey();
  CHECK(st.result == HotkeyResult::RegistrationFailed);
  CHECK(hk.is_registered());
  CHECK(backend.register_calls == 1);
  backend.fail_unregister = false;
}

void test_reregister_failure_ends_unregistered_with_channels() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Ctrl}, Key::E};
  CHECK(hk.register_hotkey().ok());
  auto down = hk.keydown_events();

  backend.fail_register = true;
  hotkey::HotkeyStatus st = hk.register_hotkey();
  CHECK(st.result == HotkeyResult::RegistrationFailed);
  CHECK(!hk.is_registered());
  CHECK(backend.active() == 0);
  CHECK(hk.keydown_events() == down);
}

void test_listen_before_register() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Ctrl, Modifier::Alt}, Key::Delete};
  const Combination combo{{Modifier::Alt, Modifier::Ctrl}, Key::Delete};

  auto down = hk.keydown_events();
  ReceiveStatus status = ReceiveStatus::Timeout;
  std::thread consumer([&] { status = down.receive_for(kLong); });

  std::this_thread::sleep_for(kShort);
  CHECK(hk.register_hotkey().ok());
  CHECK(backend.press(combo));
  consumer.join();
  CHECK(status == ReceiveStatus::Event);
}

void test_display() {
  FakeBackend backend;
  Hotkey hk{backend, {Modifier::Ctrl, Modifier::Shift}, Key::S};
  CHECK(hk.to_string() == "S+Ctrl+Shift");

  Hotkey reversed{backend, {Modifier::Shift, Modifier::Ctrl}, Key::F12};
  std::ostringstream os;
  os << reversed;
  CHECK(os.str() == "F12+Shift+Ctrl");

  Hotkey bare{backend, {}, Key::Num1};
  CHECK(bare.to_string() == "1");
}

} // namespace

#undef CHECK

int main() {
  test_press_release_scenario();
  test_same_combination_twice_fails();
  test_reregister_keeps_channels_and_events();
  test_unregister_replaces_channels();
  test_destructor_releases_registration_once();
  test_destructor_after_unregister_is_noop();
  test_destructor_swallows_backend_failure();
  test_presses_racing_failed_destruction();
  test_unregister_when_not_registered();
  test_registration_failure_leaves_unregistered();
  test_unregister_failure_keeps_state();
  test_reregister_release_failure_keeps_old_token();
  test_reregister_failure_ends_unregistered_with_channels();
  test_listen_before_register();
  test_display();

  std::cout << "OK\n";
  return 0;
}
