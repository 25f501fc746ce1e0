// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include <utils/string.hh>

namespace scrub {

std::vector< std::string >
split(const std::string &s, const std::string &delims)
{
    std::vector< std::string > xs;

    for (size_t first = 0, second; first < s.size(); first = second + 1) {
        second = s.find_first_of(delims, first);

        if (first != second)
            xs.emplace_back(s.substr(first, second - first));

        if (second == std::string::npos)
            break;
    }

    return xs;
}

std::string trim(const std::string &s)
{
    static const char *spaces = " \t\r\n\f\v";

    const auto first = s.find_first_not_of(spaces);

    if (first == std::string::npos)
        return { };

    const auto last = s.find_last_not_of(spaces);
    return s.substr(first, last - first + 1);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return char(std::tolower(c));
    });

    return s;
}

size_t ifind(const std::string &haystack, const std::string &needle,
             size_t pos)
{
    if (needle.empty())
        return pos <= haystack.size() ? pos : std::string::npos;

    auto iter = std::search(
        haystack.begin() + (std::min)(pos, haystack.size()), haystack.end(),
        needle.begin(), needle.end(),
        [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });

    return iter == haystack.end()
        ? std::string::npos : size_t(iter - haystack.begin());
}

void append_utf8(std::string &s, char32_t c)
{
    if (c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF))
        c = 0xFFFD;

    if (c < 0x80) {
        s += char(c);
    } else if (c < 0x800) {
        s += char(0xC0 | (c >> 6));
        s += char(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        s += char(0xE0 | (c >> 12));
        s += char(0x80 | ((c >> 6) & 0x3F));
        s += char(0x80 | (c & 0x3F));
    } else {
        s += char(0xF0 | (c >> 18));
        s += char(0x80 | ((c >> 12) & 0x3F));
        s += char(0x80 | ((c >> 6) & 0x3F));
        s += char(0x80 | (c & 0x3F));
    }
}

std::u32string to_utf32(const std::string &s)
{
    std::u32string result;
    result.reserve(s.size());

    for (size_t i = 0, n = s.size(); i < n;) {
        const unsigned char c = s[i];

        size_t len = 1;
        char32_t x = c;

        if (c >= 0xF0 && c < 0xF8) {
            len = 4; x = c & 0x07;
        } else if (c >= 0xE0) {
            len = 3; x = c & 0x0F;
        } else if (c >= 0xC0) {
            len = 2; x = c & 0x1F;
        }

        if (c >= 0xF8 || (c >= 0x80 && c < 0xC0)) {
            // stray continuation or invalid lead byte
            result += char32_t(0xFFFD);
            ++i;
            continue;
        }

        if (i + len > n) {
            result += char32_t(0xFFFD);
            break;
        }

        for (size_t j = 1; j < len; ++j)
            x = (x << 6) | (static_cast< unsigned char >(s[i + j]) & 0x3F);

        result += x;
        i += len;
    }

    return result;
}

std::string to_utf8(const std::u32string &s)
{
    std::string result;
    result.reserve(s.size());

    for (auto c : s)
        append_utf8(result, c);

    return result;
}

size_t utf8_length(const std::string &s)
{
    return std::count_if(s.begin(), s.end(), [](unsigned char c) {
        return (c & 0xC0) != 0x80;
    });
}

} // namespace scrub
