// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <scrub/parser/dict.hh>
#include <scrub/parser/comment.hh>
#include <scrub/parser/lit.hh>
#include <scrub/parser/name.hh>
#include <scrub/parser/skip.hh>

namespace scrub::parser {

template< typename Iterator >
bool definition (Iterator first, Iterator& iter, Iterator last,
                 std::tuple< name_t, obj_t >& attr) {
    std::tuple< name_t, obj_t > def;

    if (name (first, iter, last, std::get< 0 >(def))) {
        skip (first, iter, last);

        if (any (first, iter, last, std::get< 1 >(def))) {
            return attr = std::move (def), true;
        }
    }

    return false;
}

template< typename Iterator >
bool dictionary (Iterator first, Iterator& iter, Iterator last,
                 dict_t& attr) {
    if (lit (first, iter, last, "<<")) {
        skip (first, iter, last);

        dict_t dict;

        for (; iter != last;) {
            switch (*iter) {
            case '/': {
                std::tuple< name_t, obj_t > def;

                if (!definition (first, iter, last, def)) {
                    return false;
                }

                //
                // A null value is equivalent to a missing entry, a repeated
                // key keeps the last value:
                //
                if (!is_null (std::get< 1 > (def))) {
                    dict.emplace (
                        std::get< 0 > (def), std::move (std::get< 1 > (def)));
                }
            }
                break;

            case '>':
                if (lit (first, iter, last, ">>")) {
                    return attr = std::move (dict), true;
                }

                return false;

            default:
                return false;
            }

            skip (first, iter, last);
        }
    }

    return false;
}

} // scrub::parser
