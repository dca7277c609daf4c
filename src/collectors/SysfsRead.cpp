#include "collectors/SysfsRead.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace rtop::collectors {

using rtop::model::Unavailable;
using rtop::model::UnavailableReason;

Unavailable unavailable_from_errno(int err, const std::string& path) {
  switch (err) {
    case EACCES:
    case EPERM:
      return {UnavailableReason::PermissionDenied, path};
    case ENOENT:
    case ENOTDIR:
    case ENODEV:
    case ENXIO:
      return {UnavailableReason::NotPresent, path};
    default:
      rtop::util::log_once("read:" + path, "cannot read %s: %s", path.c_str(), std::strerror(err));
      return {UnavailableReason::ReadFailed, path};
  }
}

rtop::model::Reading<std::string> read_text(const std::string& abs) {
  auto r = rtop::util::read_file_checked(abs);
  if (!r) return std::unexpected(unavailable_from_errno(r.error(), abs));
  return std::move(*r);
}

rtop::model::Reading<double> read_number(const std::string& abs) {
  auto txt = read_text(abs);
  if (!txt) return std::unexpected(txt.error());
  const char* s = txt->c_str();
  char* end = nullptr;
  double v = std::strtod(s, &end);
  if (end == s) return rtop::model::unavailable(UnavailableReason::ReadFailed, abs);
  return v;
}

} // namespace rtop::collectors
