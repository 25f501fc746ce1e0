// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_ITERATOR_GUARD_HH
#define SCRUB_SCRUB_PARSER_ITERATOR_GUARD_HH

#include <defs.hh>

namespace scrub::parser {

template< typename Iterator >
struct iterator_guard_t {
    iterator_guard_t (Iterator& iter)
        : iter (iter), save (iter), restore (true)
        { }

    ~iterator_guard_t () {
        if (restore) {
            iter = save;
        }
    }

    void release () {
        restore = false;
    }

    Iterator &iter, save;
    bool restore;
};

#define SCRUB_ITERATOR_GUARD(x) iterator_guard_t iterator_guard (x)
#define SCRUB_ITERATOR_RELEASE  iterator_guard.release ()
#define SCRUB_PARSE_SUCCESS     SCRUB_ITERATOR_RELEASE; return true

} // scrub::parser

#endif // SCRUB_SCRUB_PARSER_ITERATOR_GUARD_HH
