// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/skip.hh>
#include <scrub/parser/character.hh>
#include <scrub/parser/comment.hh>

namespace scrub::parser {

template< typename Iterator >
bool skipws (Iterator, Iterator& iter, Iterator last) {
    bool b = false;

    if (iter != last && is_space (*iter)) {
        b = true;
        for (++iter; iter != last && is_space (*iter); ++iter) ;
    }

    return b;
}

template< typename Iterator >
bool skip (Iterator first, Iterator& iter, Iterator last) {
    bool b = false;

    for (;;) {
        if (skipws (first, iter, last)) {
            b = true;
        }
        else if (comment (first, iter, last)) {
            b = true;
        }
        else {
            break;
        }
    }

    return b;
}

} // scrub::parser
