#pragma once
/*
 * CellBufferView
 *
 * Purpose: bounds-checked 2-D view over the driver's cell buffer, no copies.
 * Rule: width/height are re-read from the driver on every call (a resize can
 *       change them between calls); the cell count is an overflow-checked product.
 * Usage: borrowed per call from Session; never store the spans past a present/poll.
 */
#include <cstddef>
#include <span>
#include "types.hpp"

class ITermDriver;

// w*h as size_t; throws std::out_of_range for negative sizes, std::overflow_error on overflow
std::size_t checked_area(int w, int h);

/*
 * Copy a w*h block of `src` (row-major) to (x, y) of a dst_w*dst_h grid,
 * clipped to the grid. Empty or fully offscreen rectangles write nothing.
 * Throws std::invalid_argument when src holds fewer than w*h cells.
 */
void blit_clipped(std::span<Cell> dst, int dst_w, int dst_h,
                  int x, int y, int w, int h, std::span<const Cell> src);

class CellBufferView {
public:
  // nullptr: closed session, every access is empty or a no-op
  explicit CellBufferView(ITermDriver* driver) : driver_(driver) {}

  TermSize dimensions() const;
  std::span<const Cell> view() const;
  std::span<Cell> view_mut();
  // nullptr when (x, y) is outside the current buffer
  Cell* at(int x, int y);
  const Cell* at(int x, int y) const;
  void blit(int x, int y, int w, int h, std::span<const Cell> cells);

private:
  std::span<Cell> span_of(int w, int h) const;
  Cell* cell_at(int x, int y) const;
  ITermDriver* driver_;
};
