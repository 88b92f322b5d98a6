#include "codec.hpp"
#include "driver_codes.hpp"
#include "keys.hpp"

int encode_input_mode(InputMode mode) {
  switch (mode) {
    case InputMode::Esc: return TBOX_INPUT_ESC;
    case InputMode::Alt: return TBOX_INPUT_ALT;
  }
  return TBOX_INPUT_ESC;
}

std::optional<InputMode> decode_input_mode(int raw) {
  switch (raw & TBOX_INPUT_MODE_MASK) {
    case TBOX_INPUT_ESC: return InputMode::Esc;
    case TBOX_INPUT_ALT: return InputMode::Alt;
    default: return std::nullopt;
  }
}

int encode_output_mode(OutputMode mode) {
  switch (mode) {
    case OutputMode::Normal: return TBOX_OUTPUT_NORMAL;
    case OutputMode::Color256: return TBOX_OUTPUT_256;
    case OutputMode::Color216: return TBOX_OUTPUT_216;
    case OutputMode::Grayscale: return TBOX_OUTPUT_GRAYSCALE;
  }
  return TBOX_OUTPUT_NORMAL;
}

std::optional<OutputMode> decode_output_mode(int raw) {
  switch (raw) {
    case TBOX_OUTPUT_NORMAL: return OutputMode::Normal;
    case TBOX_OUTPUT_256: return OutputMode::Color256;
    case TBOX_OUTPUT_216: return OutputMode::Color216;
    case TBOX_OUTPUT_GRAYSCALE: return OutputMode::Grayscale;
    default: return std::nullopt;
  }
}

Key encode_mouse_button(MouseButton button) {
  switch (button) {
    case MouseButton::Left: return TBOX_KEY_MOUSE_LEFT;
    case MouseButton::Right: return TBOX_KEY_MOUSE_RIGHT;
    case MouseButton::Middle: return TBOX_KEY_MOUSE_MIDDLE;
    case MouseButton::Release: return TBOX_KEY_MOUSE_RELEASE;
    case MouseButton::WheelUp: return TBOX_KEY_MOUSE_WHEEL_UP;
    case MouseButton::WheelDown: return TBOX_KEY_MOUSE_WHEEL_DOWN;
  }
  return TBOX_KEY_MOUSE_RELEASE;
}

std::optional<MouseButton> decode_mouse_button(Key raw) {
  switch (raw) {
    case TBOX_KEY_MOUSE_LEFT: return MouseButton::Left;
    case TBOX_KEY_MOUSE_RIGHT: return MouseButton::Right;
    case TBOX_KEY_MOUSE_MIDDLE: return MouseButton::Middle;
    case TBOX_KEY_MOUSE_RELEASE: return MouseButton::Release;
    case TBOX_KEY_MOUSE_WHEEL_UP: return MouseButton::WheelUp;
    case TBOX_KEY_MOUSE_WHEEL_DOWN: return MouseButton::WheelDown;
    default: return std::nullopt;
  }
}

std::string_view to_string(InputMode mode) {
  switch (mode) {
    case InputMode::Esc: return "esc";
    case InputMode::Alt: return "alt";
  }
  return "?";
}

std::string_view to_string(OutputMode mode) {
  switch (mode) {
    case OutputMode::Normal: return "normal";
    case OutputMode::Color256: return "256";
    case OutputMode::Color216: return "216";
    case OutputMode::Grayscale: return "grayscale";
  }
  return "?";
}

std::string_view to_string(MouseButton button) {
  switch (button) {
    case MouseButton::Left: return "left";
    case MouseButton::Right: return "right";
    case MouseButton::Middle: return "middle";
    case MouseButton::Release: return "release";
    case MouseButton::WheelUp: return "wheel-up";
    case MouseButton::WheelDown: return "wheel-down";
  }
  return "?";
}
