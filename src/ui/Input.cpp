#include "ui/Input.hpp"
#include <cerrno>
#include <optional>
#include <poll.h>
#include <string>
#include <unistd.h>

namespace rtop::ui {

using app::Action;
using app::ActionKind;
using app::InputMode;

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 10) to = 10;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

namespace {

enum class Key { None, Char, Up, Down, Left, Right, PageUp, PageDown, Esc, Enter, Tab, Backspace };

struct KeyEvent { Key key{Key::None}; char ch{}; };

// Consumes one key starting at bytes[k].
KeyEvent next_key(std::string_view bytes, size_t& k) {
  unsigned char c = static_cast<unsigned char>(bytes[k++]);
  if (c == 0x1B) {
    if (k >= bytes.size() || (bytes[k] != '[' && bytes[k] != 'O')) return {Key::Esc, 0};
    ++k;
    if (k >= bytes.size()) return {};
    char b = bytes[k++];
    switch (b) {
      case 'A': return {Key::Up, 0};
      case 'B': return {Key::Down, 0};
      case 'C': return {Key::Right, 0};
      case 'D': return {Key::Left, 0};
      case '5':
      case '6':
        if (k < bytes.size() && bytes[k] == '~') {
          ++k;
          return {b == '5' ? Key::PageUp : Key::PageDown, 0};
        }
        return {};
      default:
        // Skip the rest of an unrecognised CSI sequence
        while (k < bytes.size() && (bytes[k] < '@' || bytes[k] > '~')) ++k;
        if (k < bytes.size()) ++k;
        return {};
    }
  }
  if (c == '\r' || c == '\n') return {Key::Enter, 0};
  if (c == '\t') return {Key::Tab, 0};
  if (c == 0x7F || c == 0x08) return {Key::Backspace, 0};
  if (c >= 0x20 && c < 0x7F) return {Key::Char, static_cast<char>(c)};
  return {};
}

std::optional<Action> map_normal(const KeyEvent& e) {
  switch (e.key) {
    case Key::Up: return Action{ActionKind::MoveUp};
    case Key::Down: return Action{ActionKind::MoveDown};
    case Key::PageUp: return Action{ActionKind::PageUp};
    case Key::PageDown: return Action{ActionKind::PageDown};
    case Key::Esc: return Action{ActionKind::Quit};
    case Key::Char: break;
    default: return std::nullopt;
  }
  switch (e.ch) {
    case 'q': return Action{ActionKind::Quit};
    case 'k': case 'K': return Action{ActionKind::RequestKill};
    case 'S': case '/': return Action{ActionKind::StartSearch};
    case 's': return Action{ActionKind::CycleSort};
    case 'T': return Action{ActionKind::ToggleTree};
    case 'i': return Action{ActionKind::CycleInterface};
    case 't': return Action{ActionKind::CycleTheme};
    case 'w': return Action{ActionKind::SaveTheme};
    case 'c': return Action{ActionKind::TogglePause};
    default: return std::nullopt;
  }
}

std::optional<Action> map_search(const KeyEvent& e) {
  switch (e.key) {
    case Key::Esc: return Action{ActionKind::Cancel};
    case Key::Enter: return Action{ActionKind::Confirm};
    case Key::Backspace: return Action{ActionKind::Backspace};
    case Key::Char: return Action{ActionKind::InsertChar, e.ch};
    default: return std::nullopt;
  }
}

std::optional<Action> map_confirm(const KeyEvent& e) {
  switch (e.key) {
    case Key::Left: case Key::Right: case Key::Tab: return Action{ActionKind::ToggleChoice};
    case Key::Enter: return Action{ActionKind::Confirm};
    case Key::Esc: return Action{ActionKind::Cancel};
    case Key::Char:
      if (e.ch == 'q') return Action{ActionKind::Quit};
      return std::nullopt;
    default: return std::nullopt;
  }
}

} // namespace

std::vector<Action> decode_keys(std::string_view bytes, InputMode mode, size_t* consumed) {
  std::vector<Action> out;
  size_t k = 0;
  while (k < bytes.size()) {
    KeyEvent e = next_key(bytes, k);
    if (e.key == Key::None) continue;
    std::optional<Action> a;
    switch (mode) {
      case InputMode::Normal: a = map_normal(e); break;
      case InputMode::Search: a = map_search(e); break;
      case InputMode::ConfirmKill: a = map_confirm(e); break;
    }
    if (a) out.push_back(*a);
    // A mode-changing key ends the batch; the rest is decoded under the new map next tick.
    if (a && (a->kind == ActionKind::StartSearch || a->kind == ActionKind::RequestKill ||
              a->kind == ActionKind::Confirm || a->kind == ActionKind::Cancel ||
              a->kind == ActionKind::Quit))
      break;
  }
  if (consumed) *consumed = k;
  return out;
}

bool TerminalInput::wait(int timeout_ms) {
  if (!pending_.empty()) return true;
  if (timeout_ms <= 0) {
    struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN);
  }
  return has_input_available(timeout_ms);
}

std::vector<Action> TerminalInput::read_actions(InputMode mode) {
  char buf[64];
  for (;;) {
    ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n > 0) { pending_.append(buf, static_cast<size_t>(n)); continue; }
    if (n < 0 && errno == EINTR) continue;
    break; // EAGAIN or EOF
  }
  size_t used = 0;
  auto actions = decode_keys(pending_, mode, &used);
  pending_.erase(0, used);
  return actions;
}

} // namespace rtop::ui
