// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/stream.hh>
#include <scrub/parser/eol.hh>
#include <scrub/parser/iterator_guard.hh>
#include <scrub/parser/lit.hh>
#include <scrub/parser/skip.hh>

namespace scrub::parser {

//
// Scan for the `endstream' keyword at the start of a line, the end-of-line
// marker before the keyword is not part of the data:
//
template< typename Iterator >
bool streambuf_ (Iterator first, Iterator& iter, Iterator last,
                 std::string& attr) {
    std::string str;

    for (; iter != last; ++iter) {
        {
            SCRUB_ITERATOR_GUARD (iter);

            if (eol (first, iter, last) &&
                lit (first, iter, last, "endstream")) {
                attr = std::move (str);
                SCRUB_PARSE_SUCCESS;
            }
        }

        {
            //
            // Some producers omit the end-of-line marker:
            //
            SCRUB_ITERATOR_GUARD (iter);

            if (str.empty () && lit (first, iter, last, "endstream")) {
                attr = std::move (str);
                SCRUB_PARSE_SUCCESS;
            }
        }

        str += *iter;
    }

    return false;
}

template< typename Iterator >
bool stream_ (Iterator first, Iterator& iter, Iterator last,
              const dict_t& dict, std::string& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    if (!keyword (first, iter, last, "stream")) {
        return false;
    }

    //
    // The keyword is followed by CRLF or LF; a lone CR is tolerated:
    //
    for (; iter != last && (*iter == ' ' || *iter == '\t'); ++iter) ;
    eol (first, iter, last);

    //
    // Trust a direct /Length which lands on the `endstream' keyword:
    //
    if (auto length = dict.get< int > ("Length")) {
        const auto n = *length;

        if (n >= 0 && n <= std::distance (iter, last)) {
            auto other = std::next (iter, n);
            skipws (first, other, last);

            if (lit (first, other, last, "endstream")) {
                attr.assign (iter, std::next (iter, n));
                iter = other;

                SCRUB_PARSE_SUCCESS;
            }
        }
    }

    if (streambuf_ (first, iter, last, attr)) {
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

} // scrub::parser
