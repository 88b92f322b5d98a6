#pragma once
/*
 * ITermDriver
 *
 * Purpose: abstract terminal driver (device I/O, escape sequences, raw mode).
 * Goal: Session talks to the terminal only through this surface, so ncurses
 *       and headless implementations are interchangeable.
 * Contract: integer codes follow driver_codes.hpp. cell_buffer() points at
 *           width()*height() cells and is invalidated by a resize.
 */
#include "types.hpp"

class ITermDriver {
public:
  virtual ~ITermDriver() = default;
  virtual int init() = 0;
  virtual void shutdown() = 0;
  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual void clear() = 0;
  virtual void present() = 0;
  virtual void change_cell(int x, int y, std::uint32_t ch, Attribute fg, Attribute bg) = 0;
  virtual void put_cell(int x, int y, const Cell* cell) = 0;
  virtual Cell* cell_buffer() = 0;
  // clipped to the screen; cells holds at least w*h entries
  virtual void blit(int x, int y, int w, int h, const Cell* cells) = 0;
  virtual void set_cursor(int x, int y) = 0;
  virtual void set_clear_attributes(Attribute fg, Attribute bg) = 0;
  // mode 0 (CURRENT) queries; returns the mode in effect afterwards
  virtual int select_input_mode(int mode) = 0;
  virtual int select_output_mode(int mode) = 0;
  // <0 error, 0 timeout, >0 event type written to *event
  virtual int peek_event(RawEvent* event, int timeout_ms) = 0;
  virtual int poll_event(RawEvent* event) = 0;
};
