#include "driver_support.hpp"
#include "buffer_view.hpp"
#include "driver_codes.hpp"
#include <algorithm>

void CellGrid::resize(int w, int h) {
  w = std::max(0, w);
  h = std::max(0, h);
  if (w == width_ && h == height_) return;
  std::vector<Cell> next(checked_area(w, h), blank());
  int copy_w = std::min(w, width_);
  int copy_h = std::min(h, height_);
  for (int y = 0; y < copy_h; ++y) {
    std::copy_n(cells_.begin() + static_cast<size_t>(y) * width_, copy_w,
                next.begin() + static_cast<size_t>(y) * w);
  }
  cells_.swap(next);
  width_ = w;
  height_ = h;
}

void CellGrid::clear() {
  std::fill(cells_.begin(), cells_.end(), blank());
}

bool CellGrid::set(int x, int y, const Cell& cell) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return false;
  cells_[static_cast<size_t>(y) * width_ + x] = cell;
  return true;
}

const Cell* CellGrid::get(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return nullptr;
  return &cells_[static_cast<size_t>(y) * width_ + x];
}

void CellGrid::blit(int x, int y, int w, int h, const Cell* cells) {
  if (!cells || w < 1 || h < 1) return;
  std::span<const Cell> src(cells, checked_area(w, h));
  blit_clipped(std::span<Cell>(cells_), width_, height_, x, y, w, h, src);
}

int normalize_input_mode(int mode) {
  if ((mode & TBOX_INPUT_MODE_MASK) == 0) mode |= TBOX_INPUT_ESC;
  if ((mode & TBOX_INPUT_MODE_MASK) == TBOX_INPUT_MODE_MASK) mode &= ~TBOX_INPUT_ALT;
  return mode & (TBOX_INPUT_MODE_MASK | TBOX_INPUT_MOUSE);
}

bool known_output_mode(int mode) {
  return mode >= TBOX_OUTPUT_NORMAL && mode <= TBOX_OUTPUT_GRAYSCALE;
}

bool cursor_visible(int x, int y, int w, int h) {
  return x >= 0 && y >= 0 && x < w && y < h;
}
