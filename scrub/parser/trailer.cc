// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/trailer.hh>
#include <scrub/parser/dict.hh>
#include <scrub/parser/skip.hh>

namespace scrub::parser {

template< typename Iterator >
bool trailer (Iterator first, Iterator& iter, Iterator last, dict_t& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    if (keyword (first, iter, last, "trailer")) {
        skip (first, iter, last);

        dict_t trailer;

        if (dictionary (first, iter, last, trailer)) {
            attr = std::move (trailer);
            SCRUB_PARSE_SUCCESS;
        }
    }

    return false;
}

} // scrub::parser
