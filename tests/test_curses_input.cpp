#define NCURSES_NOMACROS
#include "curses_input.hpp"
#include "driver_codes.hpp"
#include "keys.hpp"
#include <cassert>
#include <ncurses.h>

static RawEvent key(bool is_key_code, std::uint32_t wch) {
  RawEvent ev;
  bool mapped = translate_curses_key(is_key_code, wch, ev);
  assert(mapped);
  assert(ev.type == TBOX_EVENT_KEY);
  return ev;
}

static RawEvent mouse(std::uint64_t bstate) {
  RawEvent ev;
  bool mapped = translate_curses_mouse(bstate, 5, 6, ev);
  assert(mapped);
  assert(ev.type == TBOX_EVENT_MOUSE);
  assert(ev.x == 5 && ev.y == 6);
  return ev;
}

int main() {
  assert(key(true, KEY_F(1)).key == TBOX_KEY_F1);
  assert(key(true, KEY_F(12)).key == TBOX_KEY_F12);
  assert(key(true, KEY_UP).key == TBOX_KEY_ARROW_UP);
  assert(key(true, KEY_NPAGE).key == TBOX_KEY_PGDN);
  assert(key(true, KEY_DC).key == TBOX_KEY_DELETE);
  assert(key(true, KEY_BACKSPACE).key == TBOX_KEY_BACKSPACE2);
  assert(key(true, KEY_F(1)).ch == 0);

  RawEvent ev;
  assert(!translate_curses_key(true, KEY_F(13), ev));
  assert(!translate_curses_key(true, KEY_BTAB, ev));

  // control characters, space and DEL are keys without a character
  RawEvent ctrl = key(false, 0x01);
  assert(ctrl.key == TBOX_KEY_CTRL_A && ctrl.ch == 0);
  assert(key(false, 0x1B).key == TBOX_KEY_ESC);
  assert(key(false, ' ').key == TBOX_KEY_SPACE);
  assert(key(false, 0x7F).key == TBOX_KEY_BACKSPACE2);

  RawEvent a = key(false, 'a');
  assert(a.key == 0 && a.ch == 'a');
  assert(key(false, 0x00E9).ch == 0x00E9);
  assert(key(false, 0x1F600).ch == 0x1F600);

  assert(mouse(BUTTON1_PRESSED).key == TBOX_KEY_MOUSE_LEFT);
  assert(mouse(BUTTON1_CLICKED).key == TBOX_KEY_MOUSE_LEFT);
  assert(mouse(BUTTON2_PRESSED).key == TBOX_KEY_MOUSE_MIDDLE);
  assert(mouse(BUTTON3_PRESSED).key == TBOX_KEY_MOUSE_RIGHT);
  assert(mouse(BUTTON4_PRESSED).key == TBOX_KEY_MOUSE_WHEEL_UP);
  assert(mouse(BUTTON1_RELEASED).key == TBOX_KEY_MOUSE_RELEASE);
  assert(mouse(BUTTON1_PRESSED).mod == 0);
  assert(mouse(BUTTON1_PRESSED | REPORT_MOUSE_POSITION).mod == TBOX_MOD_MOTION);
#ifdef BUTTON5_PRESSED
  assert(mouse(BUTTON5_PRESSED).key == TBOX_KEY_MOUSE_WHEEL_DOWN);
  assert(curses_mouse_mask() & BUTTON5_PRESSED);
#endif
  assert(!translate_curses_mouse(0, 1, 1, ev));
  assert(curses_mouse_mask() & BUTTON1_PRESSED);
  // drags arrive with REPORT_MOUSE_POSITION and carry the motion modifier
  assert(curses_mouse_mask() & REPORT_MOUSE_POSITION);
  return 0;
}
