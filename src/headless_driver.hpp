#pragma once
/*
 * HeadlessDriver
 *
 * Purpose: in-memory ITermDriver for automated tests and tty-less runs.
 * Features: scripted init result, injected event queue, presented-frame
 *           snapshot, simulated terminal resize, call counters.
 * Note: nothing can arrive asynchronously, so poll_event on an empty queue
 *       fails (-1) instead of blocking forever.
 */
#include <deque>
#include <optional>
#include <string>
#include "driver_support.hpp"
#include "iterm_driver.hpp"

class HeadlessDriver : public ITermDriver {
public:
  HeadlessDriver(int width, int height);

  int init() override;
  void shutdown() override;
  int width() const override { return back_.width(); }
  int height() const override { return back_.height(); }
  void clear() override;
  void present() override;
  void change_cell(int x, int y, std::uint32_t ch, Attribute fg, Attribute bg) override;
  void put_cell(int x, int y, const Cell* cell) override;
  Cell* cell_buffer() override { return back_.data(); }
  void blit(int x, int y, int w, int h, const Cell* cells) override;
  void set_cursor(int x, int y) override;
  void set_clear_attributes(Attribute fg, Attribute bg) override;
  int select_input_mode(int mode) override;
  int select_output_mode(int mode) override;
  int peek_event(RawEvent* event, int timeout_ms) override;
  int poll_event(RawEvent* event) override;

  /* scripting */
  void set_init_result(int code) { init_result_ = code; }
  void fail_next_read(int code) { read_failure_ = code; }
  // raw record is queued as-is, including malformed ones
  void push_event(const RawEvent& ev) { events_.push_back(ev); }
  void push_key(Key key, std::uint32_t ch, std::uint8_t mod = 0);
  void push_resize(int w, int h);
  void push_mouse(Key button, int x, int y);
  // shrink/grow the screen the way SIGWINCH would, queueing a resize event
  void resize(int w, int h);

  /* inspection */
  bool initialized() const { return initialized_; }
  int init_calls() const { return init_calls_; }
  int shutdown_calls() const { return shutdown_calls_; }
  int present_calls() const { return present_calls_; }
  int blit_calls() const { return blit_calls_; }
  int input_mode_writes() const { return input_mode_writes_; }
  int raw_input_mode() const { return input_mode_; }
  int raw_output_mode() const { return output_mode_; }
  int cursor_x() const { return cursor_x_; }
  int cursor_y() const { return cursor_y_; }
  size_t pending_events() const { return events_.size(); }
  int last_peek_timeout() const { return last_peek_timeout_; }
  const Cell* back_cell(int x, int y) const { return back_.get(x, y); }
  const Cell* front_cell(int x, int y) const { return front_.get(x, y); }
  // code points of one presented row, trailing blanks kept
  std::u32string front_row(int y) const;

private:
  int next_event(RawEvent* event);

  CellGrid back_;
  CellGrid front_;
  std::deque<RawEvent> events_;
  int init_result_ = 0;
  std::optional<int> read_failure_;
  bool initialized_ = false;
  int init_calls_ = 0;
  int shutdown_calls_ = 0;
  int present_calls_ = 0;
  int blit_calls_ = 0;
  int input_mode_writes_ = 0;
  int input_mode_;
  int output_mode_;
  int cursor_x_;
  int cursor_y_;
  int last_peek_timeout_ = -1;
};
