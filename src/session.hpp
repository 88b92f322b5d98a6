#pragma once
/*
 * Session
 *
 * Purpose: RAII owner of the terminal driver; at most one live Session per process.
 * Usage: auto s = Session::open(err); destruction (or close()) shuts the driver
 *        down and releases the process lock. close() is idempotent.
 * Note: single-threaded after open(); cell operations are no-ops once closed.
 */
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include "buffer_view.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "iterm_driver.hpp"
#include "process_lock.hpp"

class Session {
public:
  // driver chosen by Settings::load() (rc file + environment)
  static std::optional<Session> open(InitError& err);
  static std::optional<Session> open(std::unique_ptr<ITermDriver> driver, InitError& err);
  // code: the driver's raw init() result (kept for InitError::Unknown), 0 when refused as Locked
  static std::optional<Session> open(std::unique_ptr<ITermDriver> driver, InitError& err, int& code);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;
  Session(Session&& other) noexcept;
  Session& operator=(Session&& other) noexcept;
  ~Session();

  void close();
  // the driver object outlives close(); only the lock marks the session open
  bool is_open() const { return lock_.has_value(); }

  int width() const;
  int height() const;
  TermSize size() const;

  // live view; re-reads dimensions on every access
  CellBufferView cell_buffer() { return CellBufferView(is_open() ? driver_.get() : nullptr); }
  std::span<const Cell> cells() const;
  std::span<Cell> cells_mut();

  void blit(int x, int y, int w, int h, std::span<const Cell> cells);
  void change_cell(int x, int y, char32_t ch, Attribute fg, Attribute bg);
  void put_cell(int x, int y, const Cell& cell);
  // one cell per code point, left to right; malformed UTF-8 shows as U+FFFD
  void put_str(int x, int y, std::string_view utf8, Attribute fg, Attribute bg);
  void clear();
  void present();
  void set_clear_attributes(Attribute fg, Attribute bg);
  void set_cursor(int x, int y);
  void hide_cursor();

  std::optional<InputMode> input_mode() const;
  bool is_mouse_enabled() const;
  void set_input_mode(InputMode mode);
  void set_mouse_enabled(bool enabled);
  std::optional<OutputMode> output_mode() const;
  void set_output_mode(OutputMode mode);

  // blocks until the driver reports an event; throws EventError / DecodeError
  Event poll_event();
  // nullopt when nothing arrived within timeout_ms (or the session is closed)
  std::optional<Event> peek_event(int timeout_ms);

private:
  Session(std::unique_ptr<ITermDriver> driver, ProcessLock lock);
  bool in_bounds(int x, int y) const;
  int current_input_mode() const;

  std::unique_ptr<ITermDriver> driver_;
  std::optional<ProcessLock> lock_;
};
