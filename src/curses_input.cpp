#define NCURSES_NOMACROS
#include "curses_input.hpp"
#include "driver_codes.hpp"
#include "keys.hpp"
#include <ncurses.h>

static bool special_key(std::uint32_t code, Key& key) {
  if (code >= static_cast<std::uint32_t>(KEY_F(1)) && code <= static_cast<std::uint32_t>(KEY_F(12))) {
    key = static_cast<Key>(TBOX_KEY_F1 - (code - KEY_F(1)));
    return true;
  }
  switch (code) {
    case KEY_IC: key = TBOX_KEY_INSERT; return true;
    case KEY_DC: key = TBOX_KEY_DELETE; return true;
    case KEY_HOME: key = TBOX_KEY_HOME; return true;
    case KEY_END: key = TBOX_KEY_END; return true;
    case KEY_PPAGE: key = TBOX_KEY_PGUP; return true;
    case KEY_NPAGE: key = TBOX_KEY_PGDN; return true;
    case KEY_UP: key = TBOX_KEY_ARROW_UP; return true;
    case KEY_DOWN: key = TBOX_KEY_ARROW_DOWN; return true;
    case KEY_LEFT: key = TBOX_KEY_ARROW_LEFT; return true;
    case KEY_RIGHT: key = TBOX_KEY_ARROW_RIGHT; return true;
    case KEY_BACKSPACE: key = TBOX_KEY_BACKSPACE2; return true;
    case KEY_ENTER: key = TBOX_KEY_ENTER; return true;
    default: return false;
  }
}

bool translate_curses_key(bool is_key_code, std::uint32_t wch, RawEvent& out) {
  out = RawEvent{};
  out.type = TBOX_EVENT_KEY;
  if (is_key_code) return special_key(wch, out.key);
  // control codes, space and DEL travel as keys, everything else as a character
  if (wch <= TBOX_KEY_SPACE || wch == TBOX_KEY_BACKSPACE2) {
    out.key = static_cast<Key>(wch);
    return true;
  }
  out.ch = wch;
  return true;
}

bool translate_curses_mouse(std::uint64_t bstate, int x, int y, RawEvent& out) {
  out = RawEvent{};
  out.type = TBOX_EVENT_MOUSE;
  out.x = x;
  out.y = y;
  if (bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED | BUTTON1_DOUBLE_CLICKED)) out.key = TBOX_KEY_MOUSE_LEFT;
  else if (bstate & (BUTTON2_PRESSED | BUTTON2_CLICKED)) out.key = TBOX_KEY_MOUSE_MIDDLE;
  else if (bstate & (BUTTON3_PRESSED | BUTTON3_CLICKED)) out.key = TBOX_KEY_MOUSE_RIGHT;
  else if (bstate & BUTTON4_PRESSED) out.key = TBOX_KEY_MOUSE_WHEEL_UP;
#ifdef BUTTON5_PRESSED
  else if (bstate & BUTTON5_PRESSED) out.key = TBOX_KEY_MOUSE_WHEEL_DOWN;
#endif
  else if (bstate & (BUTTON1_RELEASED | BUTTON2_RELEASED | BUTTON3_RELEASED)) out.key = TBOX_KEY_MOUSE_RELEASE;
  else return false;
  if (bstate & REPORT_MOUSE_POSITION) out.mod |= TBOX_MOD_MOTION;
  return true;
}

std::uint64_t curses_mouse_mask() {
  mmask_t mask = BUTTON1_PRESSED | BUTTON1_RELEASED | BUTTON1_CLICKED |
                 BUTTON2_PRESSED | BUTTON2_RELEASED |
                 BUTTON3_PRESSED | BUTTON3_RELEASED;
  mask |= BUTTON4_PRESSED | REPORT_MOUSE_POSITION;
#ifdef BUTTON5_PRESSED
  mask |= BUTTON5_PRESSED;
#endif
  return mask;
}
