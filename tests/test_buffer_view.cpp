#include "buffer_view.hpp"
#include "headless_driver.hpp"
#include <cassert>
#include <climits>
#include <stdexcept>
#include <string>
#include <vector>

static std::vector<Cell> cells_of(const std::u32string& s) {
  std::vector<Cell> v;
  for (char32_t c : s) v.push_back(Cell{static_cast<std::uint32_t>(c), 0, 0});
  return v;
}

static std::vector<Cell> blank_grid(int w, int h) {
  return std::vector<Cell>(static_cast<size_t>(w * h), Cell{' ', 0, 0});
}

static std::u32string row(const std::vector<Cell>& g, int w, int y) {
  std::u32string out;
  for (int x = 0; x < w; ++x) out.push_back(static_cast<char32_t>(g[static_cast<size_t>(y * w + x)].ch));
  return out;
}

template <class E, class F>
static bool throws(F f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

static void clipping() {
  auto g = blank_grid(10, 5);
  auto src = cells_of(U"ABCDE");
  blit_clipped(g, 10, 5, -2, 0, 5, 1, src);
  assert(row(g, 10, 0) == U"CDE       ");
  assert(row(g, 10, 1) == U"          ");

  g = blank_grid(10, 5);
  blit_clipped(g, 10, 5, 8, 4, 5, 1, src);
  assert(row(g, 10, 4) == U"        AB");

  // 2x2 block hanging off the top-left corner
  g = blank_grid(4, 3);
  blit_clipped(g, 4, 3, -1, -1, 2, 2, cells_of(U"abcd"));
  assert(row(g, 4, 0) == U"d   ");
  assert(row(g, 4, 1) == U"    ");
}

static void offscreen_and_empty_are_noops() {
  const auto before = blank_grid(10, 5);
  auto src = cells_of(U"ABCDE");
  auto g = before;
  blit_clipped(g, 10, 5, -5, 0, 5, 1, src);   // right edge touches 0
  blit_clipped(g, 10, 5, 10, 0, 5, 1, src);   // starts at width
  blit_clipped(g, 10, 5, 0, 5, 5, 1, src);    // starts at height
  blit_clipped(g, 10, 5, 0, -1, 5, 1, src);   // bottom edge touches 0
  blit_clipped(g, 10, 5, 0, 0, 0, 1, {});
  blit_clipped(g, 10, 5, 0, 0, 5, 0, {});
  blit_clipped(g, 10, 5, INT_MAX, INT_MAX, 5, 1, src);
  blit_clipped(g, 10, 5, INT_MIN, 0, 5, 1, src);
  assert(g == before);
}

static void short_source_rejected() {
  auto g = blank_grid(10, 5);
  auto src = cells_of(U"ABC");
  assert(throws<std::invalid_argument>([&] { blit_clipped(g, 10, 5, 0, 0, 2, 2, src); }));
  // rejected even when the rectangle would be fully clipped
  assert(throws<std::invalid_argument>([&] { blit_clipped(g, 10, 5, 50, 50, 2, 2, src); }));
  assert(g == blank_grid(10, 5));
}

static void area_checks() {
  assert(checked_area(0, 0) == 0);
  assert(checked_area(80, 24) == 1920);
  assert(checked_area(INT_MAX, 1) == static_cast<size_t>(INT_MAX));
  assert(throws<std::out_of_range>([] { checked_area(-1, 3); }));
  assert(throws<std::out_of_range>([] { checked_area(3, -1); }));
  if (sizeof(size_t) == 4) {
    assert(throws<std::overflow_error>([] { checked_area(INT_MAX, INT_MAX); }));
  } else {
    assert(checked_area(INT_MAX, INT_MAX) == static_cast<size_t>(INT_MAX) * static_cast<size_t>(INT_MAX));
  }
}

static void view_over_driver() {
  HeadlessDriver d(10, 5);
  int rc = d.init();
  assert(rc == 0);
  CellBufferView v(&d);
  assert(v.dimensions().width == 10 && v.dimensions().height == 5);
  assert(v.view().size() == 50);
  assert(v.at(10, 0) == nullptr);
  assert(v.at(0, 5) == nullptr);
  assert(v.at(-1, 0) == nullptr);
  v.at(9, 4)->ch = 'z';
  assert(d.back_cell(9, 4)->ch == 'z');

  v.blit(-2, 0, 5, 1, cells_of(U"ABCDE"));
  assert(d.back_cell(0, 0)->ch == 'C');
  assert(d.back_cell(2, 0)->ch == 'E');
  assert(d.back_cell(3, 0)->ch == ' ');

  // dimensions are re-read after the terminal changes size
  d.resize(4, 2);
  assert(v.view().size() == 8);
  assert(v.at(9, 4) == nullptr);
  assert(v.at(3, 1) != nullptr);
  v.view_mut()[7].ch = 'q';
  assert(d.back_cell(3, 1)->ch == 'q');

  const CellBufferView& ro = v;
  assert(ro.at(3, 1)->ch == 'q');
  assert(ro.at(4, 1) == nullptr);
  assert(ro.at(0, -1) == nullptr);
}

static void closed_view() {
  CellBufferView v(nullptr);
  assert(v.dimensions().width == 0 && v.dimensions().height == 0);
  assert(v.view().empty());
  assert(v.view_mut().empty());
  assert(v.at(0, 0) == nullptr);
  v.blit(0, 0, 1, 1, cells_of(U"x"));
  assert(throws<std::invalid_argument>([&] { v.blit(0, 0, 2, 1, cells_of(U"x")); }));
}

int main() {
  clipping();
  offscreen_and_empty_are_noops();
  short_source_rejected();
  area_checks();
  view_over_driver();
  closed_view();
  return 0;
}
