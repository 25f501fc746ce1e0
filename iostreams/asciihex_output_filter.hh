// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef SCRUB_IOSTREAMS_ASCIIHEX_OUTPUT_FILTER_HH
#define SCRUB_IOSTREAMS_ASCIIHEX_OUTPUT_FILTER_HH

#include <cctype>
#include <boost/iostreams/concepts.hpp>
#include <boost/iostreams/operations.hpp>

namespace scrub {
namespace iostreams {

//
// ASCIIHexDecode encoder, breaks lines every 64 output characters:
//
struct asciihex_output_filter_t : public boost::iostreams::output_filter
{
    template< typename Sink >
    bool put(Sink &dst, int c)
    {
        if (eof_)
            return false;

        static const char *s = "0123456789ABCDEF";

        if (n_ && 0 == n_ % 32 && !boost::iostreams::put(dst, '\n'))
            return false;

        ++n_;

        return
            boost::iostreams::put(dst, s[((unsigned)c & 0xF0) >> 4]) &&
            boost::iostreams::put(dst, s[ (unsigned)c & 0x0F]);
    }

    template< typename Sink >
    void close(Sink &dst)
    {
        boost::iostreams::put(dst, '>');
        eof_ = true;
    }

private:
    bool eof_ = false;
    size_t n_ = 0;
};

} // namespace iostreams
} // namespace scrub

#endif // SCRUB_IOSTREAMS_ASCIIHEX_OUTPUT_FILTER_HH
