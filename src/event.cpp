#include "event.hpp"
#include "driver_codes.hpp"
#include "errors.hpp"
#include "log.hpp"

std::optional<char32_t> to_scalar_value(std::uint32_t raw) {
  if (raw > 0x10FFFF) return std::nullopt;
  if (raw >= 0xD800 && raw <= 0xDFFF) return std::nullopt;
  return static_cast<char32_t>(raw);
}

static KeyEvent decode_key(const RawEvent& raw) {
  KeyEvent ev;
  ev.key = raw.key;
  ev.ch = to_scalar_value(raw.ch);
  ev.alt = (raw.mod & TBOX_MOD_ALT) != 0;
  return ev;
}

static MouseEvent decode_mouse(const RawEvent& raw) {
  auto button = decode_mouse_button(raw.key);
  if (!button) {
    TBOX_LOG()->error("mouse event with unexpected key {:#06x} at {},{}", raw.key, raw.x, raw.y);
    throw DecodeError(DecodeError::Kind::UnknownMouseButton, raw.key);
  }
  return MouseEvent{*button, raw.x, raw.y};
}

Event decode_event(const RawEvent& raw) {
  switch (raw.type) {
    case TBOX_EVENT_KEY: return decode_key(raw);
    case TBOX_EVENT_RESIZE: return ResizeEvent{raw.w, raw.h};
    case TBOX_EVENT_MOUSE: return decode_mouse(raw);
    default:
      TBOX_LOG()->error("unrecognized event type {}", raw.type);
      throw DecodeError(DecodeError::Kind::UnknownEventKind, raw.type);
  }
}
