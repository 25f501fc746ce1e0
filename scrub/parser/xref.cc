// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/xref.hh>
#include <scrub/parser/lit.hh>
#include <scrub/parser/numeric.hh>
#include <scrub/parser/skip.hh>

#include <cctype>

namespace scrub::parser {

template< typename Iterator >
bool startxref (Iterator first, Iterator& iter, Iterator last, off_t& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    int n = 0;

    if (keyword (first, iter, last, "startxref") && SKIP &&
        int_ (first, iter, last, n)) {
        attr = n;
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

namespace detail {

template< typename Iterator >
bool xref (Iterator first, Iterator& iter, Iterator last,
           off_t& off, int& type) {
    int a, b;

    if (ints (first, iter, last, a, b) && SKIP &&
        iter != last && (*iter == 'n' || *iter == 'f')) {
        return off = a, type = *iter++, true;
    }

    return false;
}

template< typename Iterator >
bool xrefs (Iterator first, Iterator& iter, Iterator last,
            int a, int b, std::map< int, off_t >& xs) {
    int i = a;

    for (; i < a + b; ++i, SKIP) {
        int type;
        off_t off;

        if (xref (first, iter, last, off, type)) {
            //
            // Free entries and object 0 carry no object:
            //
            if (type == 'n' && i) {
                xs [i] = off;
            }
        }
        else {
            break;
        }
    }

    return i == a + b;
}

template< typename Iterator >
bool xrefs (Iterator first, Iterator& iter, Iterator last,
            std::map< int, off_t >& attr) {
    std::map< int, off_t > xs;

    for (int a, b, c = 0; iter != last && std::isdigit (*iter); ++c, SKIP) {
        if (ints (first, iter, last, a, b)) {
            if (b < 0 || !SKIP || !xrefs (first, iter, last, a, b, xs)) {
                return false;
            }
        }
        else {
            if (0 == c) {
                return false;
            }

            break;
        }
    }

    return attr = xs, true;
}

} // namespace detail

//
// Cross-reference sections are parsed for validation only, objects are
// located by a sequential scan of the file:
//
template< typename Iterator >
bool xrefs (Iterator first, Iterator& iter, Iterator last,
            std::map< int, off_t >& attr) {
    if (keyword (first, iter, last, "xref")) {
        return SKIP && detail::xrefs (first, iter, last, attr);
    }

    return false;
}

} // scrub::parser
