// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_UTILS_STRING_HH
#define SCRUB_UTILS_STRING_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

namespace scrub {

using optional_string_t = std::optional< std::string >;

std::vector< std::string >
split(const std::string &s, const std::string &delims = " \t\r\n");

std::string trim(const std::string &s);

std::string to_lower(std::string s);

//
// Case-insensitive (ASCII) substring search, returns npos if not found:
//
size_t ifind(const std::string &haystack, const std::string &needle,
             size_t pos = 0);

inline bool icontains(const std::string &haystack, const std::string &needle)
{
    return ifind(haystack, needle) != std::string::npos;
}

//
// UTF-8 helpers, code points outside the Unicode range are replaced with
// U+FFFD:
//
void append_utf8(std::string &s, char32_t c);

std::u32string to_utf32(const std::string &s);
std::string to_utf8(const std::u32string &s);

size_t utf8_length(const std::string &s);

} // namespace scrub

#endif // SCRUB_UTILS_STRING_HH
