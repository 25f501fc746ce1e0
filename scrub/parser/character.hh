// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_CHARACTER_HH
#define SCRUB_SCRUB_PARSER_CHARACTER_HH

#include <defs.hh>

namespace scrub::parser {

//
// PDF character classes, 0 for regular, 1 for delimiters, 2 for white-space:
//
inline int ctype_of (char c) {
    switch (c) {
    case '\0': case '\t': case '\n': case '\f': case '\r': case ' ':
        return 2;

    case '(': case ')': case '<': case '>': case '[': case ']':
    case '{': case '}': case '/': case '%':
        return 1;

    default:
        return 0;
    }
}

inline bool is_regular (char c) {
    return 0 == ctype_of (c);
}

inline bool is_delimiter (char c) {
    return 1 == ctype_of (c);
}

inline bool is_space (char c) {
    return 2 == ctype_of (c);
}

} // scrub::parser

#endif // SCRUB_SCRUB_PARSER_CHARACTER_HH
