#pragma once

#include <string>
#include <string_view>

namespace diktat::utf8 {

// Decodes UTF-8 into code points. Malformed sequences become U+FFFD.
std::u32string decode(std::string_view in);

std::string encode(std::u32string_view in);
std::string encode(char32_t c);

// Case mapping covers ASCII and the Latin-1 letters (umlauts included).
// Everything else maps to itself.
char32_t toLower(char32_t c);
std::u32string toLower(std::u32string_view s);

bool isUpper(char32_t c);
bool isLower(char32_t c);
bool isSpace(char32_t c);
bool isAlnum(char32_t c);

// Anything that is neither a letter, a digit nor whitespace.
inline bool isPunct(char32_t c) { return !isAlnum(c) && !isSpace(c); }

} // namespace diktat::utf8
