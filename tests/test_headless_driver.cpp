#include "driver_codes.hpp"
#include "driver_support.hpp"
#include "headless_driver.hpp"
#include "keys.hpp"
#include <cassert>
#include <string>

static void grid_resize_keeps_overlap() {
  CellGrid g;
  g.resize(3, 2);
  assert(g.width() == 3 && g.height() == 2);
  bool stored = g.set(2, 1, Cell{'z', 1, 2});
  assert(stored);
  assert(!g.set(3, 0, Cell{'q', 0, 0}));
  g.set_clear_attributes(4, 5);
  g.resize(5, 3);
  assert(*g.get(2, 1) == (Cell{'z', 1, 2}));
  assert(*g.get(4, 2) == (Cell{' ', 4, 5}));
  g.resize(2, 2);
  assert(g.get(2, 1) == nullptr);
  g.resize(-4, 2);
  assert(g.width() == 0 && g.data() == nullptr);
}

static void mode_rules() {
  assert(normalize_input_mode(TBOX_INPUT_MOUSE) == (TBOX_INPUT_ESC | TBOX_INPUT_MOUSE));
  assert(normalize_input_mode(TBOX_INPUT_ESC | TBOX_INPUT_ALT) == TBOX_INPUT_ESC);
  assert(normalize_input_mode(TBOX_INPUT_ALT | 0x40) == TBOX_INPUT_ALT);
  assert(known_output_mode(TBOX_OUTPUT_GRAYSCALE));
  assert(!known_output_mode(TBOX_OUTPUT_CURRENT));
  assert(!known_output_mode(5));

  HeadlessDriver d(4, 4);
  int mode = d.select_output_mode(TBOX_OUTPUT_256);
  assert(mode == TBOX_OUTPUT_256);
  // unknown modes leave the current one in place
  mode = d.select_output_mode(9);
  assert(mode == TBOX_OUTPUT_256);
  assert(d.select_output_mode(TBOX_OUTPUT_CURRENT) == TBOX_OUTPUT_256);
  assert(d.select_input_mode(TBOX_INPUT_CURRENT) == TBOX_INPUT_ESC);
  assert(d.input_mode_writes() == 0);
}

static void cursor_visibility() {
  assert(cursor_visible(0, 0, 80, 24));
  assert(cursor_visible(79, 23, 80, 24));
  assert(!cursor_visible(TBOX_HIDE_CURSOR, TBOX_HIDE_CURSOR, 80, 24));
  // one hidden coordinate is enough
  assert(!cursor_visible(TBOX_HIDE_CURSOR, 5, 80, 24));
  assert(!cursor_visible(5, TBOX_HIDE_CURSOR, 80, 24));
  assert(!cursor_visible(80, 0, 80, 24));
  assert(!cursor_visible(0, 24, 80, 24));
  assert(!cursor_visible(100, 100, 80, 24));
  assert(!cursor_visible(0, 0, 0, 0));
}

static void present_and_queue() {
  HeadlessDriver d(4, 2);
  d.set_init_result(TBOX_EFAILED_TO_OPEN_TTY);
  int rc = d.init();
  assert(rc == TBOX_EFAILED_TO_OPEN_TTY);
  assert(!d.initialized());
  d.set_init_result(TBOX_INIT_OK);
  rc = d.init();
  assert(rc == TBOX_INIT_OK);
  assert(d.init_calls() == 2);

  d.change_cell(1, 0, 'o', 0, 0);
  d.change_cell(0, 0, 'n', 0, 0);
  assert(d.front_row(0) == U"    ");
  d.present();
  assert(d.front_row(0) == U"no  ");

  RawEvent ev;
  assert(d.peek_event(&ev, 10) == 0);
  d.push_key(TBOX_KEY_ENTER, 0, TBOX_MOD_ALT);
  d.push_resize(7, 7);
  assert(d.pending_events() == 2);
  assert(d.poll_event(&ev) == TBOX_EVENT_KEY);
  assert(ev.key == TBOX_KEY_ENTER && ev.mod == TBOX_MOD_ALT);
  assert(d.poll_event(&ev) == TBOX_EVENT_RESIZE);
  assert(ev.w == 7);
  // a resize request is not a real resize
  assert(d.width() == 4);
  assert(d.poll_event(&ev) == -1);

  d.resize(6, 1);
  assert(d.width() == 6 && d.height() == 1);
  assert(d.peek_event(&ev, 0) == TBOX_EVENT_RESIZE);
  assert(ev.w == 6 && ev.h == 1);
  d.present();
  assert(d.front_row(0) == U"no    ");
}

int main() {
  grid_resize_keeps_overlap();
  mode_rules();
  cursor_visibility();
  present_and_queue();
  return 0;
}
