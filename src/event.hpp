#pragma once
/*
 * Event
 *
 * Purpose: typed input events and the decoder for driver RawEvent records.
 * Rule: decode_event dispatches on RawEvent::type only and reads just the fields
 *       of that type; unknown types and unknown mouse buttons throw DecodeError.
 */
#include <optional>
#include <variant>
#include "codec.hpp"
#include "types.hpp"

struct KeyEvent {
  Key key = 0;
  std::optional<char32_t> ch;
  bool alt = false;
};

struct ResizeEvent {
  Coord w = 0;
  Coord h = 0;
};

struct MouseEvent {
  MouseButton button = MouseButton::Left;
  Coord x = 0;
  Coord y = 0;
};

using Event = std::variant<KeyEvent, ResizeEvent, MouseEvent>;

// nullopt for surrogates and values above U+10FFFF; U+0000 is a valid scalar
std::optional<char32_t> to_scalar_value(std::uint32_t raw);

Event decode_event(const RawEvent& raw);
