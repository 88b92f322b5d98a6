#include "driver_codes.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "keys.hpp"
#include <cassert>
#include <variant>

static RawEvent raw_of(std::uint8_t type) {
  RawEvent r;
  r.type = type;
  return r;
}

int main() {
  {
    RawEvent r = raw_of(TBOX_EVENT_KEY);
    r.key = 0;
    r.ch = 'a';
    Event ev = decode_event(r);
    auto k = std::get<KeyEvent>(ev);
    assert(k.key == 0);
    assert(k.ch == U'a');
    assert(!k.alt);
  }
  {
    RawEvent r = raw_of(TBOX_EVENT_KEY);
    r.key = TBOX_KEY_ARROW_UP;
    r.mod = TBOX_MOD_ALT;
    // fields of other kinds must be ignored
    r.w = -5;
    r.x = 12345;
    auto k = std::get<KeyEvent>(decode_event(r));
    assert(k.key == TBOX_KEY_ARROW_UP);
    // a raw 0 is U+0000, a valid scalar
    assert(k.ch == U'\0');
    assert(k.alt);
  }
  {
    RawEvent r = raw_of(TBOX_EVENT_KEY);
    r.ch = 0xD800;
    assert(!std::get<KeyEvent>(decode_event(r)).ch);
    r.ch = 0x110000;
    assert(!std::get<KeyEvent>(decode_event(r)).ch);
    r.ch = 0x10FFFF;
    assert(std::get<KeyEvent>(decode_event(r)).ch == U'\U0010FFFF');
    r.mod = TBOX_MOD_MOTION;
    assert(!std::get<KeyEvent>(decode_event(r)).alt);
  }
  {
    RawEvent r = raw_of(TBOX_EVENT_RESIZE);
    r.w = 120;
    r.h = 40;
    r.key = 0xBEEF;
    auto rs = std::get<ResizeEvent>(decode_event(r));
    assert(rs.w == 120 && rs.h == 40);
  }
  {
    RawEvent r = raw_of(TBOX_EVENT_MOUSE);
    r.key = TBOX_KEY_MOUSE_WHEEL_DOWN;
    r.x = 3;
    r.y = 7;
    auto m = std::get<MouseEvent>(decode_event(r));
    assert(m.button == MouseButton::WheelDown);
    assert(m.x == 3 && m.y == 7);
  }
  {
    RawEvent r = raw_of(TBOX_EVENT_MOUSE);
    r.key = TBOX_KEY_ARROW_UP;
    bool thrown = false;
    try {
      decode_event(r);
    } catch (const DecodeError& e) {
      thrown = true;
      assert(e.kind() == DecodeError::Kind::UnknownMouseButton);
      assert(e.raw() == TBOX_KEY_ARROW_UP);
    }
    assert(thrown);
  }
  for (std::uint8_t type : {std::uint8_t(0), std::uint8_t(4), std::uint8_t(255)}) {
    bool thrown = false;
    try {
      decode_event(raw_of(type));
    } catch (const DecodeError& e) {
      thrown = true;
      assert(e.kind() == DecodeError::Kind::UnknownEventKind);
      assert(e.raw() == type);
    }
    assert(thrown);
  }

  assert(to_scalar_value(0) == U'\0');
  assert(to_scalar_value(0x1B) == U'\x1B');
  assert(!to_scalar_value(0xDFFF));
  assert(to_scalar_value(0xE000) == U'\xE000');
  return 0;
}
