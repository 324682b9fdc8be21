/**
 * @file x11_backend.cpp
 * @brief Реализация X11 backend'а горячих клавиш
 */

#include "hotkey/x11_backend.hpp"

#include <X11/XKBlib.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <poll.h>
#include <string>

namespace hotkey {

namespace {

/// Таймаут poll: заодно дочитываем события, которые XSync увёл в очередь Xlib
constexpr std::chrono::milliseconds kPollInterval{100};

/// Модификаторы, которые учитываются при сопоставлении
constexpr unsigned int kRelevantMask =
    ShiftMask | ControlMask | Mod1Mask | Mod4Mask;

/// CapsLock и NumLock (Mod2) не должны мешать срабатыванию
constexpr std::array<unsigned int, 4> kLockVariants = {
    0U, LockMask, Mod2Mask, LockMask | Mod2Mask};

std::once_flag g_xinit_once;

// Обработчик ошибок X глобален для процесса; устанавливается только на
// время захвата под мьютексом backend'а.
std::atomic<bool> g_grab_failed{false};

int on_grab_error(Display * /*display*/, XErrorEvent *ev) {
  if (ev->error_code == BadAccess) {
    g_grab_failed = true;
  }
  return 0;
}

} // namespace

X11Backend::~X11Backend() { close(); }

bool X11Backend::open() {
  if (display_) {
    return true;
  }

  std::call_once(g_xinit_once, [] {
    if (!XInitThreads()) {
      std::cerr << "[hotkey] Warning: XInitThreads failed\n";
    }
  });

  Display *display = XOpenDisplay(nullptr);
  if (!display) {
    const char *name = std::getenv("DISPLAY");
    std::cerr << "[hotkey] Error: cannot open X display "
              << (name ? name : "(DISPLAY not set)") << "\n";
    return false;
  }

  Bool supported = False;
  if (!XkbSetDetectableAutoRepeat(display, True, &supported) || !supported) {
    std::cerr << "[hotkey] Warning: detectable auto-repeat is not supported, "
                 "held keys will produce repeated key-up events\n";
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    display_ = display;
    root_ = DefaultRootWindow(display_);
  }

  loop_ = std::jthread([this](std::stop_token st) { event_loop(st); });
  return true;
}

void X11Backend::close() {
  if (loop_.joinable()) {
    loop_.request_stop();
    loop_.join();
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (!display_) {
    return;
  }

  for (const auto &[token, reg] : registrations_) {
    ungrab(reg.keycode, reg.mask);
  }
  registrations_.clear();

  XCloseDisplay(display_);
  display_ = nullptr;
  root_ = 0;
}

RegisterOutcome X11Backend::register_hotkey(const Combination &combination,
                                            KeyCallback on_keydown,
                                            KeyCallback on_keyup) {
  RegisterOutcome out;
  std::lock_guard<std::mutex> lock(mu_);

  if (!display_) {
    out.status = HotkeyStatus::failure(HotkeyResult::RegistrationFailed,
                                       "X display is not open");
    return out;
  }

  const KeyCode keycode =
      XKeysymToKeycode(display_, static_cast<KeySym>(combination.key));
  if (keycode == 0) {
    out.status = HotkeyStatus::failure(
        HotkeyResult::RegistrationFailed,
        "no keycode for " + combination.to_string() + " in current keymap");
    return out;
  }

  const unsigned int mask = combination.mask();

  // Повторный XGrabKey тем же клиентом ошибки не даёт, проверяем сами
  for (const auto &[token, reg] : registrations_) {
    if (reg.keycode == keycode && reg.mask == mask) {
      out.status = HotkeyStatus::failure(
          HotkeyResult::RegistrationFailed,
          "hotkey " + combination.to_string() + " is already registered");
      return out;
    }
  }

  if (!grab(keycode, mask)) {
    out.status = HotkeyStatus::failure(
        HotkeyResult::RegistrationFailed,
        "hotkey " + combination.to_string() +
            " is already grabbed by another application");
    return out;
  }

  Registration reg;
  reg.combination = combination;
  reg.keycode = keycode;
  reg.mask = mask;
  reg.on_keydown = std::move(on_keydown);
  reg.on_keyup = std::move(on_keyup);

  out.token = next_token_++;
  registrations_.emplace(out.token, std::move(reg));
  return out;
}

HotkeyStatus X11Backend::unregister_hotkey(BackendToken token) {
  std::lock_guard<std::mutex> lock(mu_);

  auto it = registrations_.find(token);
  if (it == registrations_.end()) {
    return HotkeyStatus::failure(HotkeyResult::UnregistrationFailed,
                                 "unknown registration token " +
                                     std::to_string(token));
  }

  if (display_) {
    ungrab(it->second.keycode, it->second.mask);
    XFlush(display_);
  }
  registrations_.erase(it);
  return HotkeyStatus::success();
}

bool X11Backend::grab(KeyCode keycode, unsigned int mask) {
  XSync(display_, False);
  g_grab_failed = false;
  XErrorHandler previous = XSetErrorHandler(on_grab_error);

  for (unsigned int variant : kLockVariants) {
    XGrabKey(display_, keycode, mask | variant, root_, True, GrabModeAsync,
             GrabModeAsync);
  }
  XSync(display_, False);

  const bool failed = g_grab_failed.exchange(false);
  if (failed) {
    // Часть вариантов могла захватиться: снимаем всё
    ungrab(keycode, mask);
    XSync(display_, False);
  }

  XSetErrorHandler(previous);
  return !failed;
}

void X11Backend::ungrab(KeyCode keycode, unsigned int mask) {
  for (unsigned int variant : kLockVariants) {
    XUngrabKey(display_, keycode, mask | variant, root_);
  }
}

void X11Backend::event_loop(std::stop_token st) {
  pollfd pfd{};
  {
    std::lock_guard<std::mutex> lock(mu_);
    pfd.fd = ConnectionNumber(display_);
  }
  pfd.events = POLLIN;

  while (!st.stop_requested()) {
    const int ret = poll(&pfd, 1, static_cast<int>(kPollInterval.count()));
    if (ret < 0 && errno != EINTR) {
      std::cerr << "[hotkey] X11 event loop: poll failed, errno=" << errno
                << "\n";
      break;
    }
    if (pfd.revents & (POLLHUP | POLLERR)) {
      std::cerr << "[hotkey] X11 connection closed\n";
      break;
    }

    std::lock_guard<std::mutex> lock(mu_);
    while (XPending(display_) > 0) {
      XEvent event;
      XNextEvent(display_, &event);
      dispatch(event);
    }
  }
}

void X11Backend::dispatch(const XEvent &event) {
  if (event.type != KeyPress && event.type != KeyRelease) {
    return;
  }

  const XKeyEvent &key = event.xkey;
  const bool is_down = (event.type == KeyPress);
  const unsigned int state = key.state & kRelevantMask;

  for (auto &[token, reg] : registrations_) {
    if (reg.keycode != key.keycode) {
      continue;
    }

    KeyCallback *callback = nullptr;
    if (is_down && !reg.pressed && reg.mask == state) {
      reg.pressed = true;
      callback = &reg.on_keydown;
    } else if (!is_down && reg.pressed) {
      // Модификаторы к моменту отпускания могли уже отпустить
      reg.pressed = false;
      callback = &reg.on_keyup;
    }

    if (callback && *callback) {
      try {
        (*callback)();
      } catch (const std::exception &e) {
        std::cerr << "[hotkey] Error in callback of " << reg.combination
                  << ": " << e.what() << "\n";
      }
    }
  }
}

} // namespace hotkey
