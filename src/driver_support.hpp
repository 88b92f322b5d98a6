#pragma once
/*
 * Driver support
 *
 * Purpose: pieces every ITermDriver implementation needs: the owned back
 *          buffer (CellGrid) and termbox-compatible mode selection rules.
 */
#include <vector>
#include "types.hpp"

class CellGrid {
public:
  int width() const { return width_; }
  int height() const { return height_; }
  Cell* data() { return cells_.empty() ? nullptr : cells_.data(); }
  const Cell* data() const { return cells_.empty() ? nullptr : cells_.data(); }

  // keeps the overlapping top-left region, new cells take the clear attributes
  void resize(int w, int h);
  void clear();
  void set_clear_attributes(Attribute fg, Attribute bg) { clear_fg_ = fg; clear_bg_ = bg; }
  Cell blank() const { return Cell{' ', clear_fg_, clear_bg_}; }
  // false when (x, y) is out of bounds
  bool set(int x, int y, const Cell& cell);
  const Cell* get(int x, int y) const;
  void blit(int x, int y, int w, int h, const Cell* cells);

private:
  int width_ = 0;
  int height_ = 0;
  Attribute clear_fg_ = 0;
  Attribute clear_bg_ = 0;
  std::vector<Cell> cells_;
};

/*
 * Input mode bookkeeping shared by the drivers:
 * neither ESC nor ALT selects ESC, both select ESC; the mouse flag is kept as given.
 */
int normalize_input_mode(int mode);
bool known_output_mode(int mode);
// cursor is shown only on a cell of the w*h screen; anything else hides it
bool cursor_visible(int x, int y, int w, int h);
