#pragma once
/*
 * Driver codes
 *
 * Purpose: fixed integer contract shared with every ITermDriver implementation.
 * Note: values are termbox compatible and must not change.
 */
#include <cstdint>

// init results
constexpr int TBOX_INIT_OK = 0;
constexpr int TBOX_EUNSUPPORTED_TERMINAL = -1;
constexpr int TBOX_EFAILED_TO_OPEN_TTY = -2;
constexpr int TBOX_EPIPE_TRAP_ERROR = -3;

// event types
constexpr std::uint8_t TBOX_EVENT_KEY = 1;
constexpr std::uint8_t TBOX_EVENT_RESIZE = 2;
constexpr std::uint8_t TBOX_EVENT_MOUSE = 3;

// modifiers
constexpr std::uint8_t TBOX_MOD_ALT = 0x01;
constexpr std::uint8_t TBOX_MOD_MOTION = 0x02;

// input modes; TBOX_INPUT_MOUSE is a flag OR-ed on top of ESC or ALT
constexpr int TBOX_INPUT_CURRENT = 0;
constexpr int TBOX_INPUT_ESC = 1;
constexpr int TBOX_INPUT_ALT = 2;
constexpr int TBOX_INPUT_MOUSE = 4;
// all bits used by input modes, excluding flags such as TBOX_INPUT_MOUSE
constexpr int TBOX_INPUT_MODE_MASK = TBOX_INPUT_ESC | TBOX_INPUT_ALT;

// output modes
constexpr int TBOX_OUTPUT_CURRENT = 0;
constexpr int TBOX_OUTPUT_NORMAL = 1;
constexpr int TBOX_OUTPUT_256 = 2;
constexpr int TBOX_OUTPUT_216 = 3;
constexpr int TBOX_OUTPUT_GRAYSCALE = 4;

constexpr int TBOX_HIDE_CURSOR = -1;
