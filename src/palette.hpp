#pragma once
/*
 * Palette
 *
 * Purpose: interpret a (fg, bg) attribute pair under an output mode.
 * Result: terminal color indices (-1 = terminal default) plus style flags,
 *         independent of any curses headers so it can be tested directly.
 */
#include "codec.hpp"
#include "types.hpp"

struct CellStyle {
  int fg = -1;
  int bg = -1;
  bool bold = false;
  bool underline = false;
  bool reverse = false;
};

inline bool operator==(const CellStyle& a, const CellStyle& b) {
  return a.fg == b.fg && a.bg == b.bg && a.bold == b.bold &&
         a.underline == b.underline && a.reverse == b.reverse;
}

/*
 * Normal:    low nibble 0 = default, 1..8 = black..white (index 0..7)
 * Color256:  low byte is the palette index
 * Color216:  low byte 0..215 -> 16 + v   (out of range: fg 7, bg 0)
 * Grayscale: low byte 0..23  -> 232 + v  (out of range: fg 23, bg 0)
 * Style bits: bold/underline from fg, reverse from either.
 */
CellStyle resolve_style(OutputMode mode, Attribute fg, Attribute bg);
