#pragma once
/*
 * Keys
 *
 * Purpose: key codes reported in KeyEvent::key (and MouseEvent raw keys).
 * Note: several names alias the same control code (CTRL_H == BACKSPACE).
 *       Prefixed so they never clash with the KEY_* macros of curses.h.
 */
#include "types.hpp"

constexpr Key TBOX_KEY_F1 = 0xFFFF - 0;
constexpr Key TBOX_KEY_F2 = 0xFFFF - 1;
constexpr Key TBOX_KEY_F3 = 0xFFFF - 2;
constexpr Key TBOX_KEY_F4 = 0xFFFF - 3;
constexpr Key TBOX_KEY_F5 = 0xFFFF - 4;
constexpr Key TBOX_KEY_F6 = 0xFFFF - 5;
constexpr Key TBOX_KEY_F7 = 0xFFFF - 6;
constexpr Key TBOX_KEY_F8 = 0xFFFF - 7;
constexpr Key TBOX_KEY_F9 = 0xFFFF - 8;
constexpr Key TBOX_KEY_F10 = 0xFFFF - 9;
constexpr Key TBOX_KEY_F11 = 0xFFFF - 10;
constexpr Key TBOX_KEY_F12 = 0xFFFF - 11;
constexpr Key TBOX_KEY_INSERT = 0xFFFF - 12;
constexpr Key TBOX_KEY_DELETE = 0xFFFF - 13;
constexpr Key TBOX_KEY_HOME = 0xFFFF - 14;
constexpr Key TBOX_KEY_END = 0xFFFF - 15;
constexpr Key TBOX_KEY_PGUP = 0xFFFF - 16;
constexpr Key TBOX_KEY_PGDN = 0xFFFF - 17;
constexpr Key TBOX_KEY_ARROW_UP = 0xFFFF - 18;
constexpr Key TBOX_KEY_ARROW_DOWN = 0xFFFF - 19;
constexpr Key TBOX_KEY_ARROW_LEFT = 0xFFFF - 20;
constexpr Key TBOX_KEY_ARROW_RIGHT = 0xFFFF - 21;

/* only reported inside mouse events */
constexpr Key TBOX_KEY_MOUSE_LEFT = 0xFFFF - 22;
constexpr Key TBOX_KEY_MOUSE_RIGHT = 0xFFFF - 23;
constexpr Key TBOX_KEY_MOUSE_MIDDLE = 0xFFFF - 24;
constexpr Key TBOX_KEY_MOUSE_RELEASE = 0xFFFF - 25;
constexpr Key TBOX_KEY_MOUSE_WHEEL_UP = 0xFFFF - 26;
constexpr Key TBOX_KEY_MOUSE_WHEEL_DOWN = 0xFFFF - 27;

constexpr Key TBOX_KEY_CTRL_TILDE = 0x00;
constexpr Key TBOX_KEY_CTRL_2 = 0x00;
constexpr Key TBOX_KEY_CTRL_A = 0x01;
constexpr Key TBOX_KEY_CTRL_B = 0x02;
constexpr Key TBOX_KEY_CTRL_C = 0x03;
constexpr Key TBOX_KEY_CTRL_D = 0x04;
constexpr Key TBOX_KEY_CTRL_E = 0x05;
constexpr Key TBOX_KEY_CTRL_F = 0x06;
constexpr Key TBOX_KEY_CTRL_G = 0x07;
constexpr Key TBOX_KEY_BACKSPACE = 0x08;
constexpr Key TBOX_KEY_CTRL_H = 0x08;
constexpr Key TBOX_KEY_TAB = 0x09;
constexpr Key TBOX_KEY_CTRL_I = 0x09;
constexpr Key TBOX_KEY_CTRL_J = 0x0A;
constexpr Key TBOX_KEY_CTRL_K = 0x0B;
constexpr Key TBOX_KEY_CTRL_L = 0x0C;
constexpr Key TBOX_KEY_ENTER = 0x0D;
constexpr Key TBOX_KEY_CTRL_M = 0x0D;
constexpr Key TBOX_KEY_CTRL_N = 0x0E;
constexpr Key TBOX_KEY_CTRL_O = 0x0F;
constexpr Key TBOX_KEY_CTRL_P = 0x10;
constexpr Key TBOX_KEY_CTRL_Q = 0x11;
constexpr Key TBOX_KEY_CTRL_R = 0x12;
constexpr Key TBOX_KEY_CTRL_S = 0x13;
constexpr Key TBOX_KEY_CTRL_T = 0x14;
constexpr Key TBOX_KEY_CTRL_U = 0x15;
constexpr Key TBOX_KEY_CTRL_V = 0x16;
constexpr Key TBOX_KEY_CTRL_W = 0x17;
constexpr Key TBOX_KEY_CTRL_X = 0x18;
constexpr Key TBOX_KEY_CTRL_Y = 0x19;
constexpr Key TBOX_KEY_CTRL_Z = 0x1A;
constexpr Key TBOX_KEY_ESC = 0x1B;
constexpr Key TBOX_KEY_CTRL_LSQ_BRACKET = 0x1B;
constexpr Key TBOX_KEY_CTRL_3 = 0x1B;
constexpr Key TBOX_KEY_CTRL_4 = 0x1C;
constexpr Key TBOX_KEY_CTRL_BACKSLASH = 0x1C;
constexpr Key TBOX_KEY_CTRL_5 = 0x1D;
constexpr Key TBOX_KEY_CTRL_RSQ_BRACKET = 0x1D;
constexpr Key TBOX_KEY_CTRL_6 = 0x1E;
constexpr Key TBOX_KEY_CTRL_7 = 0x1F;
constexpr Key TBOX_KEY_CTRL_SLASH = 0x1F;
constexpr Key TBOX_KEY_CTRL_UNDERSCORE = 0x1F;
constexpr Key TBOX_KEY_SPACE = 0x20;
constexpr Key TBOX_KEY_BACKSPACE2 = 0x7F;
constexpr Key TBOX_KEY_CTRL_8 = 0x7F;
