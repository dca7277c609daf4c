#pragma once
#include <string>
#include "model/Availability.hpp"

namespace rtop::collectors {

// errno -> Unavailable. Permission and missing-file errors are expected and
// silent; anything else is logged once per path.
rtop::model::Unavailable unavailable_from_errno(int err, const std::string& path);

// Whole file, or why it could not be read.
rtop::model::Reading<std::string> read_text(const std::string& abs);

// Leading number of a sysfs attribute file.
rtop::model::Reading<double> read_number(const std::string& abs);

} // namespace rtop::collectors
