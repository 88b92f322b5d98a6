#pragma once
/*
 * Codec
 *
 * Purpose: translate between driver integer codes and the safe enums.
 * Rule: encode is total, decode is partial and returns std::nullopt outside the known set.
 */
#include <optional>
#include <string_view>
#include "types.hpp"

enum class InputMode { Esc, Alt };
enum class OutputMode { Normal, Color256, Color216, Grayscale };
enum class MouseButton { Left, Right, Middle, Release, WheelUp, WheelDown };

int encode_input_mode(InputMode mode);
// masks off orthogonal flags (mouse) before matching
std::optional<InputMode> decode_input_mode(int raw);

int encode_output_mode(OutputMode mode);
std::optional<OutputMode> decode_output_mode(int raw);

Key encode_mouse_button(MouseButton button);
std::optional<MouseButton> decode_mouse_button(Key raw);

std::string_view to_string(InputMode mode);
std::string_view to_string(OutputMode mode);
std::string_view to_string(MouseButton button);
