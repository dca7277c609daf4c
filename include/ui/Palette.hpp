#pragma once

#include "app/ThemeStore.hpp"
#include <string>

namespace rtop::ui {

// SGR prefixes for one theme. All empty when stdout is not a terminal.
struct Palette {
  std::string border;
  std::string title;
  std::string text;
  std::string muted;
  std::string ok;
  std::string warn;
  std::string crit;
  std::string select; // selected process row
  std::string reset;

  // ok up to 60%, warn up to 80%, crit above
  const std::string& for_pct(double pct) const {
    return pct <= 60.0 ? ok : (pct <= 80.0 ? warn : crit);
  }
};

[[nodiscard]] Palette palette_for(app::Theme theme);

} // namespace rtop::ui
