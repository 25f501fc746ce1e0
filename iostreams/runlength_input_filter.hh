// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_RUNLENGTH_INPUT_FILTER_HH
#define SCRUB_IOSTREAMS_RUNLENGTH_INPUT_FILTER_HH

#include <cstdio>
#include <boost/iostreams/char_traits.hpp>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace scrub {
namespace iostreams {

//
// RunLengthDecode: a length byte 0..127 copies the next n + 1 bytes, 129..255
// repeats the next byte 257 - n times, 128 ends the data:
//
struct runlength_input_filter_t : public boost::iostreams::input_filter
{
    template< typename Source >
    int get(Source &src)
    {
        if (0 == count_) {
            if (eof_)
                return EOF;

            const int c = boost::iostreams::get(src);

            if (c == boost::iostreams::WOULD_BLOCK)
                return c;

            if (c == EOF || c == 128) {
                eof_ = true;
                return EOF;
            }

            if (c < 128) {
                count_ = c + 1;
                repeat_ = false;
            } else {
                count_ = 257 - c;
                repeat_ = true;

                if (EOF == (value_ = boost::iostreams::get(src))) {
                    eof_ = true;
                    return EOF;
                }
            }
        }

        --count_;

        if (repeat_)
            return value_;

        const int c = boost::iostreams::get(src);

        if (c == EOF) {
            eof_ = true;
            count_ = 0;
        }

        return c;
    }

    template< typename Source >
    void close(Source &)
    {
        eof_ = false;
        count_ = 0;
    }

private:
    int count_ = 0, value_ = 0;
    bool repeat_ = false, eof_ = false;
};

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_RUNLENGTH_INPUT_FILTER_HH
