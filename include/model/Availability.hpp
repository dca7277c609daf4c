#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace rtop::model {

// Why a telemetry field has no value this tick.
enum class UnavailableReason {
  NotPresent,       // hardware, driver or file does not exist
  PermissionDenied, // source exists but needs privileges
  ReadFailed,       // read or parse error, or the provider threw
  Timeout,          // provider exceeded its per-tick budget
  NotSupported,     // platform lacks the interface
};

struct Unavailable {
  UnavailableReason reason{UnavailableReason::NotPresent};
  std::string detail;
};

// A field is either a reading or absent with a reason. Never a stand-in zero.
template <class T>
using Reading = std::expected<T, Unavailable>;

inline std::unexpected<Unavailable> unavailable(UnavailableReason r, std::string detail = {}) {
  return std::unexpected(Unavailable{r, std::move(detail)});
}

[[nodiscard]] constexpr std::string_view reason_label(UnavailableReason r) {
  switch (r) {
    case UnavailableReason::NotPresent: return "n/a";
    case UnavailableReason::PermissionDenied: return "No perm";
    case UnavailableReason::ReadFailed: return "read error";
    case UnavailableReason::Timeout: return "timeout";
    case UnavailableReason::NotSupported: return "unsupported";
  }
  return "n/a";
}

} // namespace rtop::model
