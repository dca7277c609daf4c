#pragma once
#include <string>

namespace rtop::util {

// Diagnostics go to stderr prefixed with "rtop: ", or to RTOP_LOG_FILE when set.
// RTOP_QUIET=1 silences them. The TUI owns stdout, so keep these rare.
void log_msg(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Like log_msg, but a given key is emitted at most once per process.
// Returns true if the message was written.
bool log_once(const std::string& key, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// While the TUI owns the terminal, send diagnostics to `path` instead of
// stderr. RTOP_LOG_FILE still wins. An empty path restores stderr. The parent
// directory is created on demand.
void set_fallback_log_file(std::string path);

// $XDG_STATE_HOME/rtop/rtop.log, else ~/.local/state/rtop/rtop.log, else "".
std::string default_log_file_path();

// Forget previously seen keys (tests).
void reset_log_once();

} // namespace rtop::util
