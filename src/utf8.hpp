#pragma once
#include <string>
#include <string_view>

// Malformed, overlong and surrogate sequences each become one U+FFFD.
std::u32string decode_utf8(std::string_view s);
