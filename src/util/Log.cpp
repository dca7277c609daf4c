#include "util/Log.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <unordered_set>

namespace rtop::util {

namespace {

std::mutex g_mu;
std::unordered_set<std::string> g_seen;
std::string g_fallback; // guarded by g_mu

bool quiet() {
  const char* q = std::getenv("RTOP_QUIET");
  return q && (q[0] == '1' || q[0] == 't' || q[0] == 'T' || q[0] == 'y' || q[0] == 'Y');
}

void vwrite(const char* fmt, va_list ap) {
  if (quiet()) return;
  FILE* out = stderr;
  FILE* file = nullptr;
  const char* path = std::getenv("RTOP_LOG_FILE");
  if (!path || !*path) path = g_fallback.empty() ? nullptr : g_fallback.c_str();
  if (path) {
    file = std::fopen(path, "a");
    if (file) out = file;
  }
  std::fputs("rtop: ", out);
  std::vfprintf(out, fmt, ap);
  std::fputc('\n', out);
  if (file) std::fclose(file);
}

} // namespace

void log_msg(const char* fmt, ...) {
  std::lock_guard<std::mutex> lk(g_mu);
  va_list ap; va_start(ap, fmt);
  vwrite(fmt, ap);
  va_end(ap);
}

bool log_once(const std::string& key, const char* fmt, ...) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (!g_seen.insert(key).second) return false;
  va_list ap; va_start(ap, fmt);
  vwrite(fmt, ap);
  va_end(ap);
  return true;
}

void set_fallback_log_file(std::string path) {
  if (!path.empty()) {
    std::error_code ec;
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  }
  std::lock_guard<std::mutex> lk(g_mu);
  g_fallback = std::move(path);
}

std::string default_log_file_path() {
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return std::string(xdg) + "/rtop/rtop.log";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.local/state/rtop/rtop.log";
  return {};
}

void reset_log_once() {
  std::lock_guard<std::mutex> lk(g_mu);
  g_seen.clear();
}

} // namespace rtop::util
