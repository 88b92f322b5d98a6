#pragma once
/*
 * NcursesDriver
 *
 * Purpose: ITermDriver on top of ncurses (wide-character API) on /dev/tty.
 * Note: keeps its own Cell back buffer; present() paints it through curses,
 *       which does the diffing and escape sequences. curses.h stays out of
 *       this header (its function-like macros clash with member names).
 */
#include "driver_support.hpp"
#include "iterm_driver.hpp"
#include "tty_file.hpp"

struct screen;

class NcursesDriver : public ITermDriver {
public:
  explicit NcursesDriver(int esc_delay_ms);
  ~NcursesDriver() override;

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

private:
  // timeout_ms < 0 blocks
  int read_event(RawEvent* event, int timeout_ms);
  void sync_size(RawEvent* event);
  void draw_cell(int x, int y, const Cell& cell);

  TtyFile tty_;
  screen* screen_ = nullptr;
  CellGrid back_;
  int esc_delay_ms_;
  int input_mode_;
  int output_mode_;
  int cursor_x_;
  int cursor_y_;
};
