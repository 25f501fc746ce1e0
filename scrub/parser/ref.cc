// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/ref.hh>
#include <scrub/parser/lit.hh>
#include <scrub/parser/numeric.hh>
#include <scrub/parser/skip.hh>

namespace scrub::parser {

template< typename Iterator >
bool ref (Iterator first, Iterator& iter, Iterator last, ref_t& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    int a = 0, b = 0;

    if (int_ (first, iter, last, a) && skipws (first, iter, last) &&
        int_ (first, iter, last, b) && skipws (first, iter, last) &&
        keyword (first, iter, last, "R")) {
        attr = { a, b };
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

} // scrub::parser
