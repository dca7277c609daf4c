#include "ui/Terminal.hpp"
#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace rtop::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  while (len > 0) {
    ssize_t n = ::write(fd, buf, len);
    if (n <= 0) return; // nothing useful to do about a dead terminal
    buf += n; len -= static_cast<size_t>(n);
  }
}

void restore_terminal_minimal() {
  // Async-signal-safe: leave alt screen first, then show cursor and reset SGR
  static const char alt_off[] = "\x1B[?1049l";
  static const char show_cur[] = "\x1B[?25h";
  static const char reset[] = "\x1B[0m";
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, sizeof(alt_off) - 1);
  best_effort_write(STDOUT_FILENO, show_cur, sizeof(show_cur) - 1);
  best_effort_write(STDOUT_FILENO, reset, sizeof(reset) - 1);
}

// Only flag the loop; the guards restore the terminal on the normal exit path.
void on_stop_signal(int) { g_stop.store(true); }

void on_atexit_restore() {
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) tcdrain(STDOUT_FILENO);
}

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  std::atexit(on_atexit_restore);
}

bool tty_stdout() { return ::isatty(STDOUT_FILENO) == 1; }

bool truecolor_capable() {
  const char* ct = std::getenv("COLORTERM");
  if (!ct) return false;
  std::string s = ct;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s.find("truecolor") != std::string::npos || s.find("24bit") != std::string::npos;
}

bool use_unicode() {
  for (const char* var : {"LC_ALL", "LC_CTYPE", "LANG"}) {
    const char* lc = std::getenv(var);
    if (!lc || !*lc) continue;
    std::string s = lc;
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s.find("utf") != std::string::npos;
  }
  return false;
}

int term_cols() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
  if (const char* c = std::getenv("COLUMNS"); c && *c) {
    int v = std::atoi(c);
    if (v > 0) return std::max(20, v);
  }
  return 80;
}

int term_rows() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0) return ws.ws_row;
  if (const char* env = std::getenv("LINES")) { int r = std::atoi(env); if (r > 0) return r; }
  return 40;
}

std::string sgr(const char* code) {
  if (!tty_stdout()) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset() {
  if (!tty_stdout()) return {};
  return "\x1B[0m";
}

std::string sgr_palette_idx(int idx) {
  if (!tty_stdout()) return {};
  if (idx < 0) idx = 0;
  if (idx <= 7) return "\x1B[" + std::to_string(30 + idx) + "m";
  if (idx <= 15) return "\x1B[" + std::to_string(90 + (idx - 8)) + "m";
  return "\x1B[38;5;" + std::to_string(idx) + "m";
}

std::string sgr_truecolor(int r, int g, int b) {
  if (!tty_stdout()) return {};
  r = std::clamp(r, 0, 255); g = std::clamp(g, 0, 255); b = std::clamp(b, 0, 255);
  return "\x1B[38;2;" + std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b) + "m";
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) != 1) return;
  if (tcgetattr(STDIN_FILENO, &old_) != 0) return;
  termios neo = old_;
  neo.c_lflag &= ~(ICANON | ECHO);
  neo.c_cc[VMIN] = 0;
  neo.c_cc[VTIME] = 0;
  tcsetattr(STDIN_FILENO, TCSANOW, &neo);
  old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
  fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
  active_ = true;
}

RawTermGuard::~RawTermGuard() {
  if (!active_) return;
  tcsetattr(STDIN_FILENO, TCSANOW, &old_);
  fcntl(STDIN_FILENO, F_SETFL, old_flags_);
}

CursorGuard::CursorGuard() {
  if (!tty_stdout()) return;
  best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
  active_ = true;
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (!enable || !tty_stdout()) return;
  best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
  active_ = true;
  g_alt_in_use.store(true);
}

AltScreenGuard::~AltScreenGuard() {
  if (!active_) return;
  best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
  g_alt_in_use.store(false);
}

} // namespace rtop::ui
