#include "buffer_view.hpp"
#include "iterm_driver.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>

std::size_t checked_area(int w, int h) {
  if (w < 0 || h < 0) throw std::out_of_range(fmt::format("negative buffer size {}x{}", w, h));
  std::size_t uw = static_cast<std::size_t>(w);
  std::size_t uh = static_cast<std::size_t>(h);
  if (uw != 0 && uh > std::numeric_limits<std::size_t>::max() / uw) {
    throw std::overflow_error(fmt::format("buffer size {}x{} overflows", w, h));
  }
  return uw * uh;
}

static void require_source(int w, int h, std::size_t len) {
  if (w > 0 && h > 0 && len < checked_area(w, h)) {
    throw std::invalid_argument(fmt::format("blit of {}x{} needs {} cells, got {}",
                                            w, h, checked_area(w, h), len));
  }
}

void blit_clipped(std::span<Cell> dst, int dst_w, int dst_h,
                  int x, int y, int w, int h, std::span<const Cell> src) {
  require_source(w, h, src.size());
  if (dst.size() < checked_area(dst_w, dst_h)) {
    throw std::out_of_range(fmt::format("destination holds {} cells, {}x{} expected", dst.size(), dst_w, dst_h));
  }
  // 64-bit edges: x + w must not wrap for coordinates near INT_MAX
  long long lx = x, ly = y, lw = w, lh = h;
  if (w < 1 || h < 1 || lx + lw <= 0 || ly + lh <= 0 || lx >= dst_w || ly >= dst_h) return;

  long long min_x = std::max(0LL, -lx);
  long long min_y = std::max(0LL, -ly);
  long long max_x = std::min(lx + lw, static_cast<long long>(dst_w)) - lx;
  long long max_y = std::min(ly + lh, static_cast<long long>(dst_h)) - ly;
  for (long long cy = min_y; cy < max_y; ++cy) {
    std::size_t src_index = static_cast<std::size_t>(cy * lw + min_x);
    std::size_t dst_index = static_cast<std::size_t>((ly + cy) * dst_w + lx + min_x);
    for (long long cx = min_x; cx < max_x; ++cx) {
      dst[dst_index] = src[src_index];
      src_index++;
      dst_index++;
    }
  }
}

TermSize CellBufferView::dimensions() const {
  if (!driver_) return {0, 0};
  return {driver_->width(), driver_->height()};
}

std::span<Cell> CellBufferView::span_of(int w, int h) const {
  std::size_t len = checked_area(w, h);
  if (len == 0) return {};
  Cell* ptr = driver_->cell_buffer();
  if (!ptr) throw std::logic_error(fmt::format("driver reports {}x{} but has no cell buffer", w, h));
  return std::span<Cell>(ptr, len);
}

std::span<const Cell> CellBufferView::view() const {
  if (!driver_) return {};
  TermSize sz = dimensions();
  return span_of(sz.width, sz.height);
}

std::span<Cell> CellBufferView::view_mut() {
  if (!driver_) return {};
  TermSize sz = dimensions();
  return span_of(sz.width, sz.height);
}

Cell* CellBufferView::cell_at(int x, int y) const {
  if (!driver_) return nullptr;
  TermSize sz = dimensions();
  if (x < 0 || y < 0 || x >= sz.width || y >= sz.height) return nullptr;
  auto cells = span_of(sz.width, sz.height);
  return &cells[static_cast<std::size_t>(y) * sz.width + x];
}

Cell* CellBufferView::at(int x, int y) { return cell_at(x, y); }
const Cell* CellBufferView::at(int x, int y) const { return cell_at(x, y); }

void CellBufferView::blit(int x, int y, int w, int h, std::span<const Cell> cells) {
  require_source(w, h, cells.size());
  if (!driver_) return;
  TermSize sz = dimensions();
  if (w < 1 || h < 1) return;
  blit_clipped(span_of(sz.width, sz.height), sz.width, sz.height, x, y, w, h, cells);
}
