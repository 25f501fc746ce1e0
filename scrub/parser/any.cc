// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/any.hh>
#include <scrub/parser/array.hh>
#include <scrub/parser/dict.hh>
#include <scrub/parser/iterator_guard.hh>
#include <scrub/parser/lookahead.hh>
#include <scrub/parser/name.hh>
#include <scrub/parser/numeric.hh>
#include <scrub/parser/ref.hh>
#include <scrub/parser/string.hh>

namespace scrub::parser {

//
// Direct objects; streams are parsed at the object level where the stream
// dictionary is at hand:
//
template< typename Iterator >
bool any (Iterator first, Iterator& iter, Iterator last, obj_t& attr) {
    if (iter != last) {
        switch (const int c = *iter) {
        case '(': {
            string_t s;

            if (string_ (first, iter, last, s))
                return attr = std::move (s), true;
        }
            break;

        case '<': {
            if (lookahead (iter, last, "<<")) {
                dict_t dict;

                if (dictionary (first, iter, last, dict))
                    return attr = make< dict_t > (std::move (dict)), true;
            }
            else {
                string_t s;

                if (string_ (first, iter, last, s))
                    return attr = std::move (s), true;
            }
        }
            break;

        case '/': {
            name_t s;

            if (name (first, iter, last, s))
                return attr = std::move (s), true;
        }
            break;

        case '[': {
            array_t arr;

            if (array (first, iter, last, arr))
                return attr = make< array_t > (std::move (arr)), true;
        }
            break;

        case 't':
        case 'f': {
            bool b;

            if (bool_ (first, iter, last, b)) {
                return attr = b, true;
            }
        }
            break;

        case 'n':
            if (keyword (first, iter, last, "null")) {
                return attr = null_t { }, true;
            }

            break;

        case '0': case '1': case '2': case '3': case '4':
        case '5': case '6': case '7': case '8': case '9': {
            // reference, ...
            ref_t reference;

            if (ref (first, iter, last, reference)) {
                return attr = reference, true;
            }
        }
            // fall through

        case '+': case '-': case '.': {
            // ... or number:
            return number (first, iter, last, attr);
        }

        default:
            (void)c;
            break;
        }
    }

    return false;
}

} // scrub::parser
