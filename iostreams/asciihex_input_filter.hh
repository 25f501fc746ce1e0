// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH
#define SCRUB_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH

#include <cctype>
#include <cstdio>
#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace scrub {
namespace iostreams {

//
// ASCIIHexDecode: pairs of hex digits, white-space ignored, `>' ends the
// data; a lone final digit is completed with a 0:
//
struct asciihex_input_filter_t : public boost::iostreams::input_filter
{
    template< typename Source >
    int get(Source &src)
    {
        if (eof_)
            return EOF;

        for (int hi = -1;;) {
            const int c = boost::iostreams::get(src);

            if (c == EOF || c == '>') {
                eof_ = true;
                return hi < 0 ? EOF : (hi << 4);
            }

            if (c == boost::iostreams::WOULD_BLOCK)
                return c;

            if (std::isspace(c))
                continue;

            if (!std::isxdigit(c)) {
                eof_ = true;
                return EOF;
            }

            const int x = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;

            if (hi < 0)
                hi = x;
            else
                return (hi << 4) | x;
        }
    }

    template< typename Source >
    void close(Source &)
    {
        eof_ = false;
    }

private:
    bool eof_ = false;
};

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_ASCIIHEX_INPUT_FILTER_HH
