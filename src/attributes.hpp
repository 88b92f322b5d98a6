#pragma once
/*
 * Attributes
 *
 * Purpose: foreground/background attribute codes.
 * Note: the named colors and style bits are only meaningful in OutputMode::Normal.
 *       The helpers below build palette indices for the other output modes.
 */
#include "types.hpp"

constexpr Attribute TBOX_DEFAULT = 0x00;
constexpr Attribute TBOX_BLACK = 0x01;
constexpr Attribute TBOX_RED = 0x02;
constexpr Attribute TBOX_GREEN = 0x03;
constexpr Attribute TBOX_YELLOW = 0x04;
constexpr Attribute TBOX_BLUE = 0x05;
constexpr Attribute TBOX_MAGENTA = 0x06;
constexpr Attribute TBOX_CYAN = 0x07;
constexpr Attribute TBOX_WHITE = 0x08;

// lighter variation of one of the standard colors
constexpr Attribute TBOX_BOLD = 0x0100;
constexpr Attribute TBOX_UNDERLINE = 0x0200;
constexpr Attribute TBOX_REVERSE = 0x0400;

constexpr Attribute TBOX_STYLE_MASK = TBOX_BOLD | TBOX_UNDERLINE | TBOX_REVERSE;
constexpr Attribute TBOX_COLOR_MASK = 0x00FF;

/* Color256: 0..7 base, 8..15 bright, 16..231 cube, 232..255 grays */
constexpr Attribute TBOX_256_CUBE_BASE = 16;
constexpr Attribute TBOX_256_GRAY_BASE = 232;

// 6x6x6 cube component index for OutputMode::Color216; r/g/b in 0..5
constexpr Attribute rgb216(int r, int g, int b) {
  return static_cast<Attribute>(r * 36 + g * 6 + b);
}
// same cube position expressed as a Color256 palette index
constexpr Attribute rgb256(int r, int g, int b) {
  return static_cast<Attribute>(TBOX_256_CUBE_BASE + rgb216(r, g, b));
}
// level in 0..23; for OutputMode::Grayscale use the level directly
constexpr Attribute gray256(int level) {
  return static_cast<Attribute>(TBOX_256_GRAY_BASE + level);
}
