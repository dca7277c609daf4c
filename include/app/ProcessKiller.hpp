#pragma once
#include <cstdint>
#include <string_view>

namespace rtop::app {

enum class TerminateResult { Terminated, NoSuchProcess, PermissionDenied };

[[nodiscard]] constexpr std::string_view to_string(TerminateResult r) {
  switch (r) {
    case TerminateResult::Terminated: return "Terminated";
    case TerminateResult::NoSuchProcess: return "NoSuchProcess";
    case TerminateResult::PermissionDenied: return "PermissionDenied";
  }
  return "?";
}

// Sends the termination signal. One call, one signal: callers never retry.
class IProcessKiller {
public:
  virtual ~IProcessKiller() = default;
  virtual TerminateResult terminate(int32_t pid) = 0;
};

// kill(pid, SIGTERM)
class SignalKiller : public IProcessKiller {
public:
  TerminateResult terminate(int32_t pid) override;
};

} // namespace rtop::app
