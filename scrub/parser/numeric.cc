// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/lit.hh>
#include <scrub/parser/numeric.hh>
#include <scrub/parser/skip.hh>

#include <cctype>
#include <climits>
#include <cstdlib>
#include <string>

namespace scrub::parser {

template< typename Iterator >
bool bool_ (Iterator first, Iterator& iter, Iterator last, bool& b) {
    if (iter != last) {
        switch (*iter) {
        case 't':
            if (keyword (first, iter, last, "true"))
                return b = true;
            break;

        case 'f':
            if (keyword (first, iter, last, "false"))
                return !(b = false);
            break;

        default:
            break;
        }
    }

    return false;
}

template< typename Iterator >
bool digit (Iterator, Iterator& iter, Iterator last, int& attr) {
    if (iter != last) {
        if (std::isdigit (*iter)) {
            return attr = *iter++ - '0', true;
        }
    }

    return false;
}

template< typename Iterator >
bool int_ (Iterator first, Iterator& iter, Iterator last, int& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    if (iter != last) {
        std::string s;

        if (*iter == '+' || *iter == '-') {
            s += *iter++;
        }

        bool empty = true;

        for (; iter != last && std::isdigit (*iter); ++iter, empty = false) {
            s += *iter;
        }

        if (!empty) {
            const long long n = std::strtoll (s.c_str (), 0, 10);

            if (n >= INT_MIN && n <= INT_MAX) {
                attr = int (n);
                SCRUB_PARSE_SUCCESS;
            }
        }
    }

    return false;
}

template< typename Iterator >
bool double_ (Iterator first, Iterator& iter, Iterator last, double& attr) {
    SCRUB_ITERATOR_GUARD (iter);

    if (iter != last) {
        std::string s;

        //
        // Consume sign, if any; some producers emit a doubled sign:
        //
        for (; iter != last && (*iter == '+' || *iter == '-'); ++iter) {
            if (s.empty ()) {
                s += *iter;
            }
        }

        bool empty = true;

        //
        // Consume digits leading to decimal point:
        //
        for (; iter != last && std::isdigit (*iter); ++iter, empty = false) {
            s += *iter;
        }

        //
        // Expect a decimal point, required by format:
        //
        if (iter == last || *iter != '.')
            return false;

        s += *iter++;

        //
        // Consume trailing digits, if any:
        //
        for (; iter != last && std::isdigit (*iter); ++iter, empty = false) {
            s += *iter;
        }

        if (!empty) {
            attr = std::strtod (s.c_str (), 0);
            SCRUB_PARSE_SUCCESS;
        }
    }

    return false;
}

template< typename Iterator >
bool ints (Iterator first, Iterator& iter, Iterator last, int& a, int& b) {
    SCRUB_ITERATOR_GUARD (iter);

    int x, y;

    if (int_ (first, iter, last, x) && skipws (first, iter, last) &&
        int_ (first, iter, last, y)) {
        a = x;
        b = y;
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

//
// Integer or real, whichever the spelling is; integers out of range become
// reals:
//
template< typename Iterator >
bool number (Iterator first, Iterator& iter, Iterator last, obj_t& attr) {
    {
        SCRUB_ITERATOR_GUARD (iter);

        double d = 0;

        if (double_ (first, iter, last, d)) {
            attr = d;
            SCRUB_PARSE_SUCCESS;
        }
    }

    {
        SCRUB_ITERATOR_GUARD (iter);

        int n = 0;

        if (int_ (first, iter, last, n) &&
            (iter == last || !is_regular (*iter))) {
            attr = n;
            SCRUB_PARSE_SUCCESS;
        }
    }

    SCRUB_ITERATOR_GUARD (iter);

    std::string s;

    for (; iter != last && (std::isdigit (*iter) || *iter == '+' ||
                            *iter == '-'); ++iter) {
        s += *iter;
    }

    if (!s.empty () && std::isdigit (s.back ())) {
        attr = std::strtod (s.c_str (), 0);
        SCRUB_PARSE_SUCCESS;
    }

    return false;
}

} // scrub::parser
