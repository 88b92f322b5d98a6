#include "palette.hpp"
#include "attributes.hpp"

static int normal_index(Attribute a) {
  int c = a & 0x0F;
  return c == 0 ? -1 : c - 1;
}

static int cube_index(Attribute a, int fallback) {
  int v = a & TBOX_COLOR_MASK;
  if (v > 215) v = fallback;
  return TBOX_256_CUBE_BASE + v;
}

static int gray_index(Attribute a, int fallback) {
  int v = a & TBOX_COLOR_MASK;
  if (v > 23) v = fallback;
  return TBOX_256_GRAY_BASE + v;
}

CellStyle resolve_style(OutputMode mode, Attribute fg, Attribute bg) {
  CellStyle s;
  switch (mode) {
    case OutputMode::Normal:
      s.fg = normal_index(fg);
      s.bg = normal_index(bg);
      break;
    case OutputMode::Color256:
      s.fg = fg & TBOX_COLOR_MASK;
      s.bg = bg & TBOX_COLOR_MASK;
      break;
    case OutputMode::Color216:
      s.fg = cube_index(fg, 7);
      s.bg = cube_index(bg, 0);
      break;
    case OutputMode::Grayscale:
      s.fg = gray_index(fg, 23);
      s.bg = gray_index(bg, 0);
      break;
  }
  s.bold = (fg & TBOX_BOLD) != 0;
  s.underline = (fg & TBOX_UNDERLINE) != 0;
  s.reverse = ((fg | bg) & TBOX_REVERSE) != 0;
  return s;
}
