#pragma once
/*
 * Curses input
 *
 * Purpose: map what wget_wch/getmouse report to driver RawEvent records.
 * Note: takes plain integers so callers (and tests) need no curses types here;
 *       KEY_RESIZE and KEY_MOUSE are the driver's business, not handled here.
 */
#include <cstdint>
#include "types.hpp"

// is_key_code: wget_wch returned KEY_CODE_YES. false for keys with no mapping.
bool translate_curses_key(bool is_key_code, std::uint32_t wch, RawEvent& out);
// bstate as reported in MEVENT; false for masks with no button mapping
bool translate_curses_mouse(std::uint64_t bstate, int x, int y, RawEvent& out);
// mousemask() bits the driver asks for when the mouse flag is on
std::uint64_t curses_mouse_mask();
