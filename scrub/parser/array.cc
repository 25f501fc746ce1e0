// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/array.hh>
#include <scrub/parser/lit.hh>
#include <scrub/parser/skip.hh>

namespace scrub::parser {

template< typename Iterator >
bool array (Iterator first, Iterator& iter, Iterator last, array_t& attr) {
    array_t arr;

    if (lit (first, iter, last, '[')) {
        skip (first, iter, last);

        for (; iter != last && !lit (first, iter, last, ']');) {
            obj_t obj;

            if (any (first, iter, last, obj)) {
                arr.emplace_back (std::move (obj));
            }
            else
                return false;

            skip (first, iter, last);
        }

        attr = std::move (arr);
        return true;
    }

    return false;
}

} // scrub::parser
