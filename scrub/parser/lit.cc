// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/lit.hh>
#include <scrub/parser/character.hh>
#include <scrub/parser/iterator_guard.hh>

namespace scrub::parser {

template< typename Iterator >
bool lit (Iterator, Iterator& iter, Iterator last, const std::string& s) {
    SCRUB_ITERATOR_GUARD (iter);

    auto other = s.begin ();

    for (; iter != last && other != s.end () && *iter == *other;
         ++iter, ++other) ;

    if (other == s.end ()) {
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

template< typename Iterator >
bool lit (Iterator, Iterator& iter, Iterator last, char c) {
    if (iter != last && *iter == c) {
        return ++iter, true;
    }

    return false;
}

template< typename Iterator >
bool keyword (Iterator first, Iterator& iter, Iterator last,
              const std::string& s) {
    SCRUB_ITERATOR_GUARD (iter);

    if (lit (first, iter, last, s) && (iter == last || !is_regular (*iter))) {
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

} // scrub::parser
