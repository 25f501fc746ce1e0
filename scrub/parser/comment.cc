// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/comment.hh>
#include <scrub/parser/iterator_guard.hh>

#include <cctype>

namespace scrub::parser {

template< typename Iterator >
bool comment (Iterator, Iterator& iter, Iterator last) {
    if (iter != last && *iter == '%') {
        for (++iter; iter != last && *iter != '\r' && *iter != '\n'; ++iter) ;
        return true;
    }

    return false;
}

template< typename Iterator >
bool version (Iterator first, Iterator& iter, Iterator last,
              std::tuple< int, int >& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    if (lit (first, iter, last, "%PDF-") &&
        iter != last && std::isdigit (*iter)) {
        const int major = *iter++ - '0';

        if (lit (first, iter, last, '.') &&
            iter != last && std::isdigit (*iter)) {
            attr = { major, *iter++ - '0' };
            SCRUB_PARSE_SUCCESS;
        }
    }

    return false;
}

} // scrub::parser
