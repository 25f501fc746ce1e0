// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef SCRUB_SCRUB_PARSER_LOOKAHEAD_HH
#define SCRUB_SCRUB_PARSER_LOOKAHEAD_HH

#include <defs.hh>

#include <climits>
#include <string>

namespace scrub::parser {

template< typename Iterator >
inline int
lookahead (Iterator& iter, Iterator last) {
    return (iter == last) ? CHAR_MAX + 1 : *iter;
}

template< typename Iterator >
inline bool
lookahead (Iterator& iter, Iterator last, char c) {
    return c == lookahead (iter, last);
}

template< typename Iterator >
bool lookahead (Iterator, Iterator, const std::string&);

} // scrub::parser

#include <scrub/parser/lookahead.cc>

#endif // SCRUB_SCRUB_PARSER_LOOKAHEAD_HH
