#include "ui/Palette.hpp"
#include "ui/Terminal.hpp"

namespace rtop::ui {

namespace {

struct Rgb { int r, g, b; };

// Truecolor values with a 256-color index fallback.
struct Swatch { Rgb rgb; int idx; };

struct ThemeDef {
  Swatch border, title, text, muted, ok, warn, crit, select_bg;
};

std::string fg(const Swatch& s, bool truecolor) {
  return truecolor ? sgr_truecolor(s.rgb.r, s.rgb.g, s.rgb.b) : sgr_palette_idx(s.idx);
}

std::string bg(const Swatch& s, bool truecolor) {
  if (!tty_stdout()) return {};
  if (truecolor)
    return "\x1B[48;2;" + std::to_string(s.rgb.r) + ";" + std::to_string(s.rgb.g) + ";" + std::to_string(s.rgb.b) + "m";
  return "\x1B[48;5;" + std::to_string(s.idx) + "m";
}

ThemeDef def_for(app::Theme t) {
  using app::Theme;
  switch (t) {
    case Theme::Dark:
      return {{{88, 88, 88}, 240}, {{200, 200, 200}, 251}, {{220, 220, 220}, 253}, {{128, 128, 128}, 244},
              {{110, 170, 110}, 71}, {{200, 170, 80}, 178}, {{200, 80, 80}, 167}, {{48, 48, 48}, 236}};
    case Theme::Nord:
      return {{{76, 86, 106}, 60}, {{136, 192, 208}, 110}, {{216, 222, 233}, 253}, {{97, 110, 136}, 60},
              {{163, 190, 140}, 108}, {{235, 203, 139}, 222}, {{191, 97, 106}, 131}, {{59, 66, 82}, 238}};
    case Theme::SolarizedDark:
      return {{{88, 110, 117}, 240}, {{38, 139, 210}, 32}, {{147, 161, 161}, 247}, {{101, 123, 131}, 241},
              {{133, 153, 0}, 100}, {{181, 137, 0}, 136}, {{220, 50, 47}, 160}, {{7, 54, 66}, 23}};
    case Theme::Gruvbox:
      return {{{102, 92, 84}, 241}, {{250, 189, 47}, 214}, {{235, 219, 178}, 223}, {{146, 131, 116}, 245},
              {{184, 187, 38}, 142}, {{254, 128, 25}, 208}, {{251, 73, 52}, 203}, {{60, 56, 54}, 237}};
    case Theme::Rtop:
      return {{{70, 90, 120}, 60}, {{255, 120, 60}, 209}, {{230, 230, 230}, 254}, {{120, 130, 150}, 103},
              {{80, 200, 160}, 79}, {{240, 200, 60}, 221}, {{240, 70, 90}, 204}, {{40, 50, 70}, 236}};
    case Theme::Default:
      break;
  }
  return {{{128, 128, 128}, 8}, {{0, 175, 215}, 6}, {{229, 229, 229}, 7}, {{128, 128, 128}, 8},
          {{0, 205, 0}, 2}, {{205, 205, 0}, 3}, {{205, 0, 0}, 1}, {{58, 58, 58}, 237}};
}

} // namespace

Palette palette_for(app::Theme theme) {
  const bool tc = truecolor_capable();
  const ThemeDef d = def_for(theme);
  Palette p;
  p.border = fg(d.border, tc);
  p.title = sgr("1") + fg(d.title, tc);
  p.text = fg(d.text, tc);
  p.muted = fg(d.muted, tc);
  p.ok = fg(d.ok, tc);
  p.warn = fg(d.warn, tc);
  p.crit = fg(d.crit, tc);
  p.select = bg(d.select_bg, tc) + sgr("1");
  p.reset = sgr_reset();
  return p;
}

} // namespace rtop::ui
