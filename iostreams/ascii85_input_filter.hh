// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_ASCII85_INPUT_FILTER_HH
#define SCRUB_IOSTREAMS_ASCII85_INPUT_FILTER_HH

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace scrub {
namespace iostreams {

//
// ASCII85Decode: groups of five characters in `!'..`u' make four bytes, `z'
// stands for four zero bytes, `~>' ends the data:
//
struct ascii85_input_filter_t : public boost::iostreams::input_filter
{
    template< typename Source >
    int get(Source &src)
    {
        if (pos_ < len_)
            return buf_[pos_++];

        if (eof_)
            return EOF;

        pos_ = len_ = 0;

        int n = 0;
        std::uint32_t tuple = 0;

        for (; n < 5;) {
            const int c = boost::iostreams::get(src);

            if (c == boost::iostreams::WOULD_BLOCK)
                return c;

            if (c == EOF || c == '~') {
                eof_ = true;
                break;
            }

            if (std::isspace(c))
                continue;

            if (c == 'z' && n == 0) {
                len_ = 4;
                std::fill(buf_, buf_ + 4, 0);
                return buf_[pos_++];
            }

            if (c < '!' || c > 'u') {
                eof_ = true;
                break;
            }

            tuple = tuple * 85 + (c - '!');
            ++n;
        }

        if (n == 5)
            return fill(tuple, 4);

        if (n < 2)
            return EOF;

        //
        // Partial final group, padded with `u':
        //
        for (int i = n; i < 5; ++i)
            tuple = tuple * 85 + 84;

        return fill(tuple, n - 1);
    }

    template< typename Source >
    void close(Source &)
    {
        eof_ = false;
        pos_ = len_ = 0;
    }

private:
    int fill(std::uint32_t tuple, int n)
    {
        buf_[0] = (tuple >> 24) & 0xFF;
        buf_[1] = (tuple >> 16) & 0xFF;
        buf_[2] = (tuple >>  8) & 0xFF;
        buf_[3] =  tuple        & 0xFF;

        len_ = n;
        pos_ = 0;

        return buf_[pos_++];
    }

    unsigned char buf_[4] = { };
    int pos_ = 0, len_ = 0;
    bool eof_ = false;
};

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_ASCII85_INPUT_FILTER_HH
