#include "app/ProcessKiller.hpp"
#include "util/Log.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>

namespace rtop::app {

TerminateResult SignalKiller::terminate(int32_t pid) {
  if (pid <= 0) return TerminateResult::NoSuchProcess; // never signal process groups
  if (::kill(pid, SIGTERM) == 0) return TerminateResult::Terminated;
  switch (errno) {
    case ESRCH: return TerminateResult::NoSuchProcess;
    case EPERM: return TerminateResult::PermissionDenied;
    default:
      rtop::util::log_msg("kill(%d, SIGTERM) failed: %s", pid, std::strerror(errno));
      return TerminateResult::PermissionDenied;
  }
}

} // namespace rtop::app
