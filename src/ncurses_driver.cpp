#define NCURSES_NOMACROS
#include "ncurses_driver.hpp"
#include "curses_input.hpp"
#include "driver_codes.hpp"
#include "event.hpp"
#include "keys.hpp"
#include "log.hpp"
#include "palette.hpp"
#include <chrono>
#include <climits>
#include <cstdlib>
#include <locale.h>
#include <ncurses.h>

NcursesDriver::NcursesDriver(int esc_delay_ms)
  : esc_delay_ms_(esc_delay_ms), input_mode_(TBOX_INPUT_ESC), output_mode_(TBOX_OUTPUT_NORMAL),
    cursor_x_(TBOX_HIDE_CURSOR), cursor_y_(TBOX_HIDE_CURSOR) {}

NcursesDriver::~NcursesDriver() { shutdown(); }

int NcursesDriver::init() {
  setlocale(LC_ALL, "");
  if (!tty_.open("/dev/tty")) {
    TBOX_LOG()->error("can not open /dev/tty");
    return TBOX_EFAILED_TO_OPEN_TTY;
  }
  screen_ = newterm(nullptr, tty_.get(), tty_.get());
  if (!screen_) {
    TBOX_LOG()->error("newterm failed for TERM={}", getenv("TERM") ? getenv("TERM") : "(unset)");
    tty_.reset();
    return TBOX_EUNSUPPORTED_TERMINAL;
  }
  set_term(screen_);
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(esc_delay_ms_);
  mouseinterval(0);
  curs_set(0);
  if (has_colors()) {
    start_color();
    if (use_default_colors() != OK) TBOX_LOG()->info("terminal has no default colors");
  }
  back_.resize(getmaxx(stdscr), getmaxy(stdscr));
  back_.clear();
  TBOX_LOG()->debug("ncurses up: {}x{}, {} colors", back_.width(), back_.height(), COLORS);
  return TBOX_INIT_OK;
}

void NcursesDriver::shutdown() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
  screen_ = nullptr;
  tty_.reset();
}

void NcursesDriver::clear() { back_.clear(); }

void NcursesDriver::draw_cell(int x, int y, const Cell& cell) {
  auto mode = decode_output_mode(output_mode_).value_or(OutputMode::Normal);
  CellStyle style = resolve_style(mode, cell.fg, cell.bg);
  attr_t attrs = A_NORMAL;
  if (style.bold) attrs |= A_BOLD;
  if (style.underline) attrs |= A_UNDERLINE;
  if (style.reverse) attrs |= A_REVERSE;
  int pair = 0;
  if (has_colors()) {
    pair = alloc_pair(style.fg, style.bg);
    if (pair < 0 || pair > SHRT_MAX) pair = 0;
  }
  wchar_t text[2] = {L' ', L'\0'};
  // U+0000 and invalid scalars paint as blanks
  auto ch = to_scalar_value(cell.ch);
  if (ch && *ch != 0) text[0] = static_cast<wchar_t>(*ch);
  cchar_t cc;
  setcchar(&cc, text, attrs, static_cast<short>(pair), nullptr);
  // ERR on the bottom-right cell is expected: the cursor can not advance past it
  (void)mvwadd_wch(stdscr, y, x, &cc);
}

void NcursesDriver::present() {
  if (!screen_) return;
  for (int y = 0; y < back_.height(); ++y) {
    for (int x = 0; x < back_.width(); ++x) draw_cell(x, y, *back_.get(x, y));
  }
  if (!cursor_visible(cursor_x_, cursor_y_, back_.width(), back_.height())) {
    curs_set(0);
  } else {
    curs_set(1);
    wmove(stdscr, cursor_y_, cursor_x_);
  }
  wrefresh(stdscr);
}

void NcursesDriver::change_cell(int x, int y, std::uint32_t ch, Attribute fg, Attribute bg) {
  back_.set(x, y, Cell{ch, fg, bg});
}

void NcursesDriver::put_cell(int x, int y, const Cell* cell) {
  if (cell) back_.set(x, y, *cell);
}

void NcursesDriver::blit(int x, int y, int w, int h, const Cell* cells) {
  back_.blit(x, y, w, h, cells);
}

void NcursesDriver::set_cursor(int x, int y) {
  cursor_x_ = x;
  cursor_y_ = y;
}

void NcursesDriver::set_clear_attributes(Attribute fg, Attribute bg) {
  back_.set_clear_attributes(fg, bg);
}

int NcursesDriver::select_input_mode(int mode) {
  if (mode == TBOX_INPUT_CURRENT) return input_mode_;
  int next = normalize_input_mode(mode);
  bool mouse_was = (input_mode_ & TBOX_INPUT_MOUSE) != 0;
  bool mouse_now = (next & TBOX_INPUT_MOUSE) != 0;
  if (screen_ && mouse_was != mouse_now) {
    mmask_t mask = mouse_now ? static_cast<mmask_t>(curses_mouse_mask()) : 0;
    if (mousemask(mask, nullptr) == 0 && mouse_now) {
      TBOX_LOG()->warn("terminal refused mouse reporting");
    }
  }
  input_mode_ = next;
  return input_mode_;
}

int NcursesDriver::select_output_mode(int mode) {
  if (mode != TBOX_OUTPUT_CURRENT && known_output_mode(mode)) output_mode_ = mode;
  return output_mode_;
}

void NcursesDriver::sync_size(RawEvent* event) {
  back_.resize(getmaxx(stdscr), getmaxy(stdscr));
  *event = RawEvent{};
  event->type = TBOX_EVENT_RESIZE;
  event->w = back_.width();
  event->h = back_.height();
  TBOX_LOG()->info("resize to {}x{}", event->w, event->h);
}

int NcursesDriver::read_event(RawEvent* event, int timeout_ms) {
  if (!screen_) return -1;
  using clock = std::chrono::steady_clock;
  const bool blocking = timeout_ms < 0;
  const auto deadline = clock::now() + std::chrono::milliseconds(blocking ? 0 : timeout_ms);
  for (;;) {
    int wait = -1;
    if (!blocking) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
      wait = left > 0 ? static_cast<int>(left) : 0;
    }
    wtimeout(stdscr, wait);
    wint_t wch = 0;
    int st = wget_wch(stdscr, &wch);
    if (st == ERR) {
      if (!blocking) return 0;
      TBOX_LOG()->error("wget_wch failed while blocking");
      return -1;
    }
    bool is_key_code = (st == KEY_CODE_YES);
    if (is_key_code && wch == KEY_RESIZE) {
      sync_size(event);
      return event->type;
    }
    if (is_key_code && wch == KEY_MOUSE) {
      MEVENT me;
      if (getmouse(&me) == OK && (input_mode_ & TBOX_INPUT_MOUSE) &&
          translate_curses_mouse(me.bstate, me.x, me.y, *event)) {
        return event->type;
      }
      if (!blocking && clock::now() >= deadline) return 0;
      continue;
    }
    if (!translate_curses_key(is_key_code, static_cast<std::uint32_t>(wch), *event)) {
      TBOX_LOG()->debug("unmapped curses key {:#x}", static_cast<unsigned>(wch));
      if (!blocking && clock::now() >= deadline) return 0;
      continue;
    }
    // ALT mode: ESC followed quickly by another key is that key with the alt modifier
    if ((input_mode_ & TBOX_INPUT_ALT) && !is_key_code && wch == TBOX_KEY_ESC) {
      wtimeout(stdscr, esc_delay_ms_);
      wint_t next = 0;
      int st2 = wget_wch(stdscr, &next);
      RawEvent alt_event;
      if (st2 != ERR && !(st2 == KEY_CODE_YES && (next == KEY_RESIZE || next == KEY_MOUSE)) &&
          translate_curses_key(st2 == KEY_CODE_YES, static_cast<std::uint32_t>(next), alt_event)) {
        alt_event.mod |= TBOX_MOD_ALT;
        *event = alt_event;
      } else if (st2 == KEY_CODE_YES) {
        ungetch(static_cast<int>(next));
      }
    }
    return event->type;
  }
}

int NcursesDriver::peek_event(RawEvent* event, int timeout_ms) {
  return read_event(event, timeout_ms < 0 ? 0 : timeout_ms);
}

int NcursesDriver::poll_event(RawEvent* event) {
  return read_event(event, -1);
}
