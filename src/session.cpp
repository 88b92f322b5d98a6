#include "session.hpp"
#include "driver_codes.hpp"
#include "driver_factory.hpp"
#include "log.hpp"
#include "settings.hpp"
#include "utf8.hpp"
#include <cstdio>
#include <fmt/format.h>
#include <stdexcept>

std::optional<Session> Session::open(InitError& err) {
  Settings settings = Settings::load();
  std::string msg;
  // the terminal is not ours yet, stderr is still the user's console
  if (!configure_logging(settings, msg)) fmt::print(stderr, "tbox: {}\n", msg);
  for (const auto& m : settings.messages) TBOX_LOG()->warn("settings: {}", m);
  return open(make_driver(settings), err);
}

std::optional<Session> Session::open(std::unique_ptr<ITermDriver> driver, InitError& err) {
  int code = 0;
  return open(std::move(driver), err, code);
}

std::optional<Session> Session::open(std::unique_ptr<ITermDriver> driver, InitError& err, int& code) {
  if (!driver) throw std::invalid_argument("Session::open: null driver");
  code = TBOX_INIT_OK;
  auto lock = ProcessLock::acquire();
  if (!lock) {
    TBOX_LOG()->warn("open refused: another session is live");
    err = InitError::Locked;
    return std::nullopt;
  }
  code = driver->init();
  if (auto failure = init_error_from_code(code)) {
    // lock goes out of scope here, before the caller sees the error
    TBOX_LOG()->error("driver init failed: {} ({})", to_string(*failure), code);
    err = *failure;
    return std::nullopt;
  }
  TBOX_LOG()->info("session open, {}x{}", driver->width(), driver->height());
  return Session(std::move(driver), std::move(*lock));
}

Session::Session(std::unique_ptr<ITermDriver> driver, ProcessLock lock)
  : driver_(std::move(driver)), lock_(std::move(lock)) {}

Session::Session(Session&& other) noexcept
  : driver_(std::move(other.driver_)), lock_(std::move(other.lock_)) {
  other.lock_.reset();
}

Session& Session::operator=(Session&& other) noexcept {
  if (this != &other) {
    close();
    driver_ = std::move(other.driver_);
    lock_ = std::move(other.lock_);
    other.lock_.reset();
  }
  return *this;
}

Session::~Session() { close(); }

void Session::close() {
  if (!is_open()) return;
  driver_->shutdown();
  lock_.reset();
  TBOX_LOG()->info("session closed");
}

int Session::width() const { return is_open() ? driver_->width() : 0; }
int Session::height() const { return is_open() ? driver_->height() : 0; }
TermSize Session::size() const { return {width(), height()}; }

std::span<const Cell> Session::cells() const {
  return CellBufferView(is_open() ? driver_.get() : nullptr).view();
}

std::span<Cell> Session::cells_mut() { return cell_buffer().view_mut(); }

bool Session::in_bounds(int x, int y) const {
  return x >= 0 && y >= 0 && x < driver_->width() && y < driver_->height();
}

void Session::blit(int x, int y, int w, int h, std::span<const Cell> cells) {
  if (w > 0 && h > 0 && cells.size() < checked_area(w, h)) {
    throw std::invalid_argument(fmt::format("blit of {}x{} needs {} cells, got {}",
                                            w, h, checked_area(w, h), cells.size()));
  }
  if (!is_open() || w < 1 || h < 1) return;
  driver_->blit(x, y, w, h, cells.data());
}

void Session::change_cell(int x, int y, char32_t ch, Attribute fg, Attribute bg) {
  if (!is_open() || !in_bounds(x, y)) return;
  driver_->change_cell(x, y, static_cast<std::uint32_t>(ch), fg, bg);
}

void Session::put_cell(int x, int y, const Cell& cell) {
  if (!is_open() || !in_bounds(x, y)) return;
  driver_->put_cell(x, y, &cell);
}

void Session::put_str(int x, int y, std::string_view utf8, Attribute fg, Attribute bg) {
  if (!is_open()) return;
  const int w = width();
  for (char32_t ch : decode_utf8(utf8)) {
    if (x >= w) break;
    change_cell(x, y, ch, fg, bg);
    x++;
  }
}

void Session::clear() { if (is_open()) driver_->clear(); }
void Session::present() { if (is_open()) driver_->present(); }

void Session::set_clear_attributes(Attribute fg, Attribute bg) {
  if (is_open()) driver_->set_clear_attributes(fg, bg);
}

void Session::set_cursor(int x, int y) { if (is_open()) driver_->set_cursor(x, y); }
void Session::hide_cursor() { set_cursor(TBOX_HIDE_CURSOR, TBOX_HIDE_CURSOR); }

int Session::current_input_mode() const {
  return driver_->select_input_mode(TBOX_INPUT_CURRENT);
}

std::optional<InputMode> Session::input_mode() const {
  if (!is_open()) return std::nullopt;
  int raw = current_input_mode();
  auto mode = decode_input_mode(raw);
  if (!mode) {
    TBOX_LOG()->error("driver reports unknown input mode {}", raw);
    throw DecodeError(DecodeError::Kind::UnknownInputMode, raw);
  }
  return mode;
}

bool Session::is_mouse_enabled() const {
  if (!is_open()) return false;
  return (current_input_mode() & TBOX_INPUT_MOUSE) != 0;
}

void Session::set_input_mode(InputMode mode) {
  if (!is_open()) return;
  int flags = current_input_mode() & ~TBOX_INPUT_MODE_MASK;
  int applied = driver_->select_input_mode(encode_input_mode(mode) | flags);
  TBOX_LOG()->debug("input mode {} (raw {})", to_string(mode), applied);
}

void Session::set_mouse_enabled(bool enabled) {
  if (!is_open()) return;
  int prev = current_input_mode();
  int next = enabled ? (prev | TBOX_INPUT_MOUSE) : (prev & ~TBOX_INPUT_MOUSE);
  if (next == prev) return;
  int applied = driver_->select_input_mode(next);
  TBOX_LOG()->debug("mouse {} (raw {})", enabled ? "on" : "off", applied);
}

std::optional<OutputMode> Session::output_mode() const {
  if (!is_open()) return std::nullopt;
  int raw = driver_->select_output_mode(TBOX_OUTPUT_CURRENT);
  auto mode = decode_output_mode(raw);
  if (!mode) {
    TBOX_LOG()->error("driver reports unknown output mode {}", raw);
    throw DecodeError(DecodeError::Kind::UnknownOutputMode, raw);
  }
  return mode;
}

void Session::set_output_mode(OutputMode mode) {
  if (!is_open()) return;
  int applied = driver_->select_output_mode(encode_output_mode(mode));
  TBOX_LOG()->debug("output mode {} (raw {})", to_string(mode), applied);
}

Event Session::poll_event() {
  if (!is_open()) throw std::logic_error("poll_event on a closed session");
  RawEvent raw;
  int result = driver_->poll_event(&raw);
  if (result <= 0) {
    TBOX_LOG()->error("poll_event returned {}", result);
    throw EventError(fmt::format("poll_event returned {}", result), result);
  }
  return decode_event(raw);
}

std::optional<Event> Session::peek_event(int timeout_ms) {
  if (!is_open()) return std::nullopt;
  RawEvent raw;
  int result = driver_->peek_event(&raw, timeout_ms);
  if (result < 0) {
    TBOX_LOG()->error("peek_event returned {}", result);
    throw EventError(fmt::format("peek_event returned {}", result), result);
  }
  if (result == 0) return std::nullopt;
  return decode_event(raw);
}
