#pragma once
/*
 * Types
 *
 * Purpose: shared value types exchanged with the terminal driver (Cell/RawEvent/TermSize).
 * Principle: plain structs with the driver's memory layout; no behaviour here.
 */
#include <cstdint>

using Attribute = std::uint16_t;
using Key = std::uint16_t;
using Coord = int;

struct Cell {
  std::uint32_t ch = 0;
  Attribute fg = 0;
  Attribute bg = 0;
};

inline bool operator==(const Cell& a, const Cell& b) {
  return a.ch == b.ch && a.fg == b.fg && a.bg == b.bg;
}
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }

// One event record as reported by the driver. Only the fields of the
// reported type are meaningful; the rest may hold stale data.
struct RawEvent {
  std::uint8_t type = 0;
  std::uint8_t mod = 0;
  std::uint16_t key = 0;
  std::uint32_t ch = 0;
  std::int32_t w = 0;
  std::int32_t h = 0;
  std::int32_t x = 0;
  std::int32_t y = 0;
};

struct TermSize { int width; int height; };
