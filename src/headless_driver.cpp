#include "headless_driver.hpp"
#include "driver_codes.hpp"
#include "log.hpp"

HeadlessDriver::HeadlessDriver(int width, int height)
  : input_mode_(TBOX_INPUT_ESC), output_mode_(TBOX_OUTPUT_NORMAL),
    cursor_x_(TBOX_HIDE_CURSOR), cursor_y_(TBOX_HIDE_CURSOR) {
  back_.resize(width, height);
  front_.resize(width, height);
}

int HeadlessDriver::init() {
  init_calls_++;
  if (init_result_ != TBOX_INIT_OK) return init_result_;
  initialized_ = true;
  back_.clear();
  front_.clear();
  TBOX_LOG()->debug("headless driver up, {}x{}", back_.width(), back_.height());
  return TBOX_INIT_OK;
}

void HeadlessDriver::shutdown() {
  shutdown_calls_++;
  initialized_ = false;
}

void HeadlessDriver::clear() { back_.clear(); }

void HeadlessDriver::present() {
  present_calls_++;
  front_.resize(back_.width(), back_.height());
  front_.blit(0, 0, back_.width(), back_.height(), back_.data());
}

void HeadlessDriver::change_cell(int x, int y, std::uint32_t ch, Attribute fg, Attribute bg) {
  back_.set(x, y, Cell{ch, fg, bg});
}

void HeadlessDriver::put_cell(int x, int y, const Cell* cell) {
  if (cell) back_.set(x, y, *cell);
}

void HeadlessDriver::blit(int x, int y, int w, int h, const Cell* cells) {
  blit_calls_++;
  back_.blit(x, y, w, h, cells);
}

void HeadlessDriver::set_cursor(int x, int y) {
  cursor_x_ = x;
  cursor_y_ = y;
}

void HeadlessDriver::set_clear_attributes(Attribute fg, Attribute bg) {
  back_.set_clear_attributes(fg, bg);
  front_.set_clear_attributes(fg, bg);
}

int HeadlessDriver::select_input_mode(int mode) {
  if (mode == TBOX_INPUT_CURRENT) return input_mode_;
  input_mode_writes_++;
  input_mode_ = normalize_input_mode(mode);
  return input_mode_;
}

int HeadlessDriver::select_output_mode(int mode) {
  if (mode != TBOX_OUTPUT_CURRENT && known_output_mode(mode)) output_mode_ = mode;
  return output_mode_;
}

void HeadlessDriver::push_key(Key key, std::uint32_t ch, std::uint8_t mod) {
  RawEvent ev;
  ev.type = TBOX_EVENT_KEY;
  ev.key = key;
  ev.ch = ch;
  ev.mod = mod;
  events_.push_back(ev);
}

void HeadlessDriver::push_resize(int w, int h) {
  RawEvent ev;
  ev.type = TBOX_EVENT_RESIZE;
  ev.w = w;
  ev.h = h;
  events_.push_back(ev);
}

void HeadlessDriver::push_mouse(Key button, int x, int y) {
  RawEvent ev;
  ev.type = TBOX_EVENT_MOUSE;
  ev.key = button;
  ev.x = x;
  ev.y = y;
  events_.push_back(ev);
}

void HeadlessDriver::resize(int w, int h) {
  back_.resize(w, h);
  push_resize(back_.width(), back_.height());
}

int HeadlessDriver::next_event(RawEvent* event) {
  if (read_failure_) {
    int code = *read_failure_;
    read_failure_.reset();
    return code;
  }
  if (events_.empty()) return 0;
  *event = events_.front();
  events_.pop_front();
  return event->type == 0 ? 1 : event->type;
}

int HeadlessDriver::peek_event(RawEvent* event, int timeout_ms) {
  last_peek_timeout_ = timeout_ms;
  return next_event(event);
}

int HeadlessDriver::poll_event(RawEvent* event) {
  int r = next_event(event);
  if (r == 0) {
    TBOX_LOG()->warn("headless poll_event with an empty queue");
    return -1;
  }
  return r;
}

std::u32string HeadlessDriver::front_row(int y) const {
  std::u32string row;
  for (int x = 0; x < front_.width(); ++x) {
    if (const Cell* c = front_.get(x, y)) row.push_back(static_cast<char32_t>(c->ch));
  }
  return row;
}
